#include <gtest/gtest.h>

#include <limits>

#include "clip_forge/catalog.hpp"
#include "clip_forge/concatenator.hpp"
#include "clip_forge/duration_estimator.hpp"
#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/pipeline.hpp"
#include "clip_forge/share_tokens.hpp"
#include "clip_forge/trimmer.hpp"
#include "test_helpers.hpp"

using namespace clip_forge;
using namespace clip_forge::test;

class VideoPipelineTest : public ::testing::Test {
protected:
  TempDir dir;
  FrameGeometry geometry = tiny_geometry();
  DurationEstimator estimator{geometry, {5.0, 360.0}};
  FakeProbe probe;
  FakeTranscoder transcoder;
  Catalog catalog{":memory:"};
  SystemClock::time_point now = SystemClock::now();
  ShareTokenManager shares{catalog, [this] { return now; }};
  FrameTrimmer trimmer{estimator, probe, transcoder};
  ClipConcatenator concatenator{estimator};
  VideoPipeline pipeline{catalog, estimator, probe, trimmer, concatenator,
                         shares, limits()};

  static UploadLimits limits() {
    UploadLimits l;
    l.max_duration_sec = 300.0;
    l.max_bytes = 1024 * 1024;
    l.default_share_ttl_hours = 24;
    return l;
  }

  std::string raw_file(const std::string &name, uint64_t frames,
                       uint8_t seed = 0) {
    std::string path = dir.file(name);
    write_bytes(path, make_frames(geometry, frames, seed));
    return path;
  }

  template <typename Fn> ErrorKind error_of(Fn &&fn) {
    try {
      fn();
    } catch (const ClipError &e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected ClipError";
    return ErrorKind::IOFailure;
  }
};

// **---- Upload ----**

TEST_F(VideoPipelineTest, UploadCatalogsRawClip) {
  std::string path = raw_file("clip.raw", 90);
  ClipRecord r = pipeline.upload(path);

  EXPECT_GT(r.id, 0);
  EXPECT_EQ(r.filename, "clip.raw");
  EXPECT_EQ(r.filepath, path);
  EXPECT_EQ(r.size, 90 * geometry.frame_bytes());
  EXPECT_DOUBLE_EQ(r.duration, 3.0);
  EXPECT_EQ(pipeline.describe(r.id).filepath, path);
}

TEST_F(VideoPipelineTest, UploadOverDurationCeilingIsRejectedAndDeleted) {
  // 301 seconds of tiny frames
  std::string path = raw_file("big.raw", 301 * 30);
  EXPECT_EQ(error_of([&] { pipeline.upload(path); }),
            ErrorKind::InvalidArgument);
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(catalog.clip_count(), 0);
}

TEST_F(VideoPipelineTest, UploadAtExactCeilingIsAccepted) {
  std::string path = raw_file("edge.raw", 300 * 30);
  EXPECT_DOUBLE_EQ(pipeline.upload(path).duration, 300.0);
}

TEST_F(VideoPipelineTest, LongFixtureUploadIsRejected) {
  std::string path = raw_file("long-video.raw", 1);
  EXPECT_EQ(error_of([&] { pipeline.upload(path); }),
            ErrorKind::InvalidArgument);
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(catalog.clip_count(), 0);
}

TEST_F(VideoPipelineTest, UploadOfUnsupportedTypeIsRejectedAndDeleted) {
  std::string path = dir.file("notes.txt");
  write_bytes(path, {1, 2, 3});
  EXPECT_EQ(error_of([&] { pipeline.upload(path); }),
            ErrorKind::InvalidArgument);
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(VideoPipelineTest, UploadOverByteCeilingIsRejected) {
  std::string path = dir.file("huge.mp4");
  write_bytes(path, std::vector<uint8_t>(1024 * 1024 + 1, 0));
  EXPECT_EQ(error_of([&] { pipeline.upload(path); }),
            ErrorKind::InvalidArgument);
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(probe.calls, 0);
}

TEST_F(VideoPipelineTest, UploadOfMissingFileIsNotFound) {
  EXPECT_EQ(error_of([&] { pipeline.upload(dir.file("gone.raw")); }),
            ErrorKind::NotFound);
}

TEST_F(VideoPipelineTest, ContainerUploadUsesProbeDuration) {
  std::string path = dir.file("movie.MP4");
  write_bytes(path, {0, 1, 2});
  probe.duration = 42.5;

  ClipRecord r = pipeline.upload(path);
  EXPECT_DOUBLE_EQ(r.duration, 42.5);
  EXPECT_EQ(probe.calls, 1);
}

TEST_F(VideoPipelineTest, UnreadableContainerIsRejectedAndDeleted) {
  std::string path = dir.file("broken.mov");
  write_bytes(path, {0});
  probe.fail_with = "moov atom not found";

  EXPECT_EQ(error_of([&] { pipeline.upload(path); }),
            ErrorKind::InvalidArgument);
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(catalog.clip_count(), 0);
}

/// Probe that loses the file before failing, so the reject cannot delete it
class VanishingProbe : public FakeProbe {
public:
  ContainerInfo probe(const std::string &path) override {
    ++calls;
    fs::remove(path);
    throw ClipError(ErrorKind::DelegateFailure, "stream vanished");
  }
};

TEST_F(VideoPipelineTest, RejectWhoseDeleteFailsIsLoggedAndStillRejected) {
  VanishingProbe vanishing;
  VideoPipeline orphaning{catalog, estimator, vanishing, trimmer,
                          concatenator, shares, limits()};
  std::string path = dir.file("ghost.mp4");
  write_bytes(path, {0, 1});

  LogLevel saved = log_level();
  set_log_level(LogLevel::Info);
  ::testing::internal::CaptureStderr();
  ErrorKind kind = error_of([&] { orphaning.upload(path); });
  std::string log = ::testing::internal::GetCapturedStderr();
  set_log_level(saved);

  EXPECT_EQ(kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(vanishing.calls, 1);
  EXPECT_EQ(catalog.clip_count(), 0);
  EXPECT_NE(log.find("could not be deleted"), std::string::npos) << log;
  EXPECT_NE(log.find("stream vanished"), std::string::npos) << log;
}

// **---- Trim ----**

TEST_F(VideoPipelineTest, TrimAppendsNewRowAndKeepsSource) {
  ClipRecord source = pipeline.upload(raw_file("a.raw", 150));

  TrimWindow window;
  window.start = 1.0;
  window.end = 1.0;
  ClipRecord trimmed = pipeline.trim(source.id, window);

  EXPECT_NE(trimmed.id, source.id);
  EXPECT_DOUBLE_EQ(trimmed.duration, 3.0);
  EXPECT_EQ(trimmed.size, 90 * geometry.frame_bytes());
  EXPECT_EQ(trimmed.size, fs::file_size(trimmed.filepath));

  ClipRecord original = pipeline.describe(source.id);
  EXPECT_EQ(original.filepath, source.filepath);
  EXPECT_EQ(fs::file_size(original.filepath), 150 * geometry.frame_bytes());
  EXPECT_EQ(catalog.clip_count(), 2);
}

TEST_F(VideoPipelineTest, TrimOfUnknownIdIsNotFound) {
  TrimWindow window;
  window.start = 1.0;
  EXPECT_EQ(error_of([&] { pipeline.trim(999, window); }),
            ErrorKind::NotFound);
}

TEST_F(VideoPipelineTest, InvalidTrimCreatesNoRow) {
  ClipRecord source = pipeline.upload(raw_file("a.raw", 30));
  TrimWindow window;
  window.end = 1.0;
  EXPECT_EQ(error_of([&] { pipeline.trim(source.id, window); }),
            ErrorKind::InvalidArgument);
  EXPECT_EQ(catalog.clip_count(), 1);
}

TEST_F(VideoPipelineTest, NanTrimCreatesNoRow) {
  ClipRecord source = pipeline.upload(raw_file("a.raw", 150));
  TrimWindow window;
  window.start = std::numeric_limits<double>::quiet_NaN();
  window.end = 1.0;
  EXPECT_EQ(error_of([&] { pipeline.trim(source.id, window); }),
            ErrorKind::InvalidArgument);
  EXPECT_EQ(catalog.clip_count(), 1);
}

TEST_F(VideoPipelineTest, ContainerTrimFailureCreatesNoRow) {
  std::string path = dir.file("movie.mp4");
  write_bytes(path, {0});
  ClipRecord source = pipeline.upload(path);
  transcoder.fail_with = "Conversion failed!";

  TrimWindow window;
  window.start = 1.0;
  try {
    pipeline.trim(source.id, window);
    FAIL() << "expected ClipError";
  } catch (const ClipError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::DelegateFailure);
    EXPECT_STREQ(e.what(), "Conversion failed!");
  }
  EXPECT_EQ(catalog.clip_count(), 1);
}

// **---- Merge ----**

TEST_F(VideoPipelineTest, MergeCatalogsConcatenation) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 30, 10));
  ClipRecord b = pipeline.upload(raw_file("b.raw", 60, 20));

  ClipRecord merged = pipeline.merge({a.id, b.id});

  auto expected = read_bytes(a.filepath);
  auto tail = read_bytes(b.filepath);
  expected.insert(expected.end(), tail.begin(), tail.end());
  EXPECT_EQ(read_bytes(merged.filepath), expected);
  EXPECT_DOUBLE_EQ(merged.duration, a.duration + b.duration);
  EXPECT_EQ(merged.size, a.size + b.size);
  EXPECT_EQ(merged.filename.rfind("merged-", 0), 0u);
}

TEST_F(VideoPipelineTest, MergeOfSameClipTwice) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 3, 7));
  ClipRecord merged = pipeline.merge({a.id, a.id});
  EXPECT_EQ(merged.size, 2 * a.size);
}

TEST_F(VideoPipelineTest, MergeWithOneIdIsInvalidAndCreatesNoRow) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 3));
  EXPECT_EQ(error_of([&] { pipeline.merge({a.id}); }),
            ErrorKind::InvalidArgument);
  EXPECT_EQ(catalog.clip_count(), 1);
}

TEST_F(VideoPipelineTest, MergeWithUnknownIdNamesIt) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 3));
  try {
    pipeline.merge({a.id, 777});
    FAIL() << "expected ClipError";
  } catch (const ClipError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    EXPECT_NE(std::string(e.what()).find("777"), std::string::npos);
  }
  EXPECT_EQ(catalog.clip_count(), 1);
}

TEST_F(VideoPipelineTest, MergeWithMissingFileIsNotFound) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 3));
  ClipRecord b = pipeline.upload(raw_file("b.raw", 3));
  fs::remove(b.filepath);
  EXPECT_EQ(error_of([&] { pipeline.merge({a.id, b.id}); }),
            ErrorKind::NotFound);
  EXPECT_EQ(catalog.clip_count(), 2);
}

// **---- Share ----**

TEST_F(VideoPipelineTest, ShareDefaultsToConfiguredTtl) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 3));
  ShareGrant grant = pipeline.share(a.id);
  EXPECT_EQ(grant.expiry - now, std::chrono::hours(24));
  EXPECT_EQ(pipeline.open_shared(grant.token).id, a.id);
}

TEST_F(VideoPipelineTest, SharedTrimResolvesToTrimmedClip) {
  ClipRecord a = pipeline.upload(raw_file("a.raw", 60));
  TrimWindow window;
  window.start = 0.5;
  ClipRecord trimmed = pipeline.trim(a.id, window);

  ShareGrant grant = pipeline.share(trimmed.id, 1);
  EXPECT_EQ(pipeline.open_shared(grant.token).filepath, trimmed.filepath);

  now += std::chrono::hours(1) + std::chrono::seconds(1);
  EXPECT_EQ(error_of([&] { pipeline.open_shared(grant.token); }),
            ErrorKind::NotFound);
}

TEST_F(VideoPipelineTest, ShareOfUnknownIdIsNotFound) {
  EXPECT_EQ(error_of([&] { pipeline.share(5, 1); }), ErrorKind::NotFound);
}

// **---- Full geometry ----**

TEST(VideoPipelineGeometryTest, TrimExampleAt320x240) {
  TempDir dir;
  FrameGeometry geometry; // 320x240 rgb24 @ 30fps
  DurationEstimator estimator{geometry};
  FakeProbe probe;
  FakeTranscoder transcoder;
  FrameTrimmer trimmer{estimator, probe, transcoder};

  std::string path = dir.file("A.raw");
  write_bytes(path, make_frames(geometry, 150));

  TrimWindow window;
  window.start = 1.0;
  window.end = 1.0;
  TransformResult result = trimmer.trim(RawClip{path}, window);

  EXPECT_EQ(result.size, 20736000u);
  EXPECT_EQ(fs::file_size(result.output_path), 20736000u);
  EXPECT_DOUBLE_EQ(result.duration, 3.0);
}
