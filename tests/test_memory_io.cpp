#include <gtest/gtest.h>

#include <cstdio>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

#include "clip_forge/memory_io.hpp"
#include "test_helpers.hpp"

using namespace clip_forge;
using namespace clip_forge::test;

TEST(MemoryLoaderTest, MapsWholeFile) {
  TempDir dir;
  std::string path = dir.file("a.raw");
  std::vector<uint8_t> bytes = {1, 2, 3, 4, 5};
  write_bytes(path, bytes);

  MappedFile file;
  ASSERT_TRUE(MemoryLoader::load_file(path, file));
  ASSERT_TRUE(file.is_valid());
  ASSERT_EQ(file.size(), bytes.size());
  EXPECT_EQ(std::vector<uint8_t>(file.data(), file.data() + file.size()),
            bytes);
}

TEST(MemoryLoaderTest, EmptyFileIsValidMapping) {
  TempDir dir;
  std::string path = dir.file("empty.raw");
  write_bytes(path, {});

  MappedFile file;
  ASSERT_TRUE(MemoryLoader::load_file(path, file));
  EXPECT_TRUE(file.is_valid());
  EXPECT_EQ(file.size(), 0u);
}

TEST(MemoryLoaderTest, MissingFileFails) {
  TempDir dir;
  MappedFile file;
  EXPECT_FALSE(MemoryLoader::load_file(dir.file("missing.raw"), file));
  EXPECT_FALSE(file.is_valid());
}

TEST(MemoryLoaderTest, MoveTransfersOwnership) {
  TempDir dir;
  std::string path = dir.file("a.raw");
  write_bytes(path, {9, 9});

  MappedFile a;
  ASSERT_TRUE(MemoryLoader::load_file(path, a));
  MappedFile b(std::move(a));
  EXPECT_FALSE(a.is_valid());
  EXPECT_TRUE(b.is_valid());
  EXPECT_EQ(b.size(), 2u);
}

TEST(MemoryLoaderTest, StoreFileWritesExactBytes) {
  TempDir dir;
  std::string path = dir.file("out.raw");
  std::vector<uint8_t> bytes = {7, 0, 7, 0};
  ASSERT_TRUE(MemoryLoader::store_file(path, bytes));
  EXPECT_EQ(read_bytes(path), bytes);
}

TEST(MemoryLoaderTest, StoreFileNeverOverwrites) {
  TempDir dir;
  std::string path = dir.file("out.raw");
  write_bytes(path, {1});
  EXPECT_FALSE(MemoryLoader::store_file(path, std::vector<uint8_t>{2, 2}));
  EXPECT_EQ(read_bytes(path), std::vector<uint8_t>{1});
}

TEST(MemoryLoaderTest, AvioCallbacksReadAndSeek) {
  std::vector<uint8_t> bytes = {10, 11, 12, 13};
  MemReaderState state{bytes.data(), bytes.size(), 0};

  uint8_t buf[3];
  EXPECT_EQ(MemoryLoader::read(&state, buf, 3), 3);
  EXPECT_EQ(buf[2], 12);
  EXPECT_EQ(MemoryLoader::read(&state, buf, 3), 1);
  EXPECT_EQ(MemoryLoader::read(&state, buf, 3), AVERROR_EOF);

  EXPECT_EQ(MemoryLoader::seek(&state, 0, AVSEEK_SIZE), 4);
  EXPECT_EQ(MemoryLoader::seek(&state, 1, SEEK_SET), 1);
  EXPECT_EQ(MemoryLoader::seek(&state, -1, SEEK_END), 3);
  EXPECT_LT(MemoryLoader::seek(&state, 10, SEEK_SET), 0);
}
