#include <gtest/gtest.h>

#include "clip_forge/duration_estimator.hpp"
#include "clip_forge/error.hpp"
#include "test_helpers.hpp"

using namespace clip_forge;
using namespace clip_forge::test;

class DurationEstimatorTest : public ::testing::Test {
protected:
  TempDir dir;
  FrameGeometry geometry = tiny_geometry();
  DurationEstimator estimator{geometry, {5.0, 360.0}};
};

TEST_F(DurationEstimatorTest, DefaultGeometryMatchesRgb24At320x240) {
  FrameGeometry g;
  EXPECT_EQ(g.frame_bytes(), 230400u);
  EXPECT_EQ(g.frame_rate, 30u);
}

TEST_F(DurationEstimatorTest, WholeFramesOverFrameRate) {
  std::string path = dir.file("clip.raw");
  write_bytes(path, make_frames(geometry, 45));
  EXPECT_DOUBLE_EQ(estimator.estimate(path), 1.5);
}

TEST_F(DurationEstimatorTest, PartialTrailingFrameIsDropped) {
  std::string path = dir.file("clip.raw");
  auto bytes = make_frames(geometry, 30);
  bytes.resize(bytes.size() + geometry.frame_bytes() - 1, 0xff);
  write_bytes(path, bytes);
  EXPECT_DOUBLE_EQ(estimator.estimate(path), 1.0);
}

TEST_F(DurationEstimatorTest, ZeroByteFileIsZeroSeconds) {
  std::string path = dir.file("empty.raw");
  write_bytes(path, {});
  EXPECT_DOUBLE_EQ(estimator.estimate(path), 0.0);
}

TEST_F(DurationEstimatorTest, ShortFixtureIgnoresSize) {
  std::string path = dir.file("test-video-1.raw");
  write_bytes(path, make_frames(geometry, 3));
  EXPECT_DOUBLE_EQ(estimator.estimate(path), 5.0);
}

TEST_F(DurationEstimatorTest, LongFixtureIgnoresSize) {
  std::string path = dir.file("long-video.raw");
  write_bytes(path, {});
  EXPECT_DOUBLE_EQ(estimator.estimate(path), 360.0);
}

TEST_F(DurationEstimatorTest, FixturePrefixOnlyMatchesFilename) {
  fs::create_directories(dir.path() / "test-video");
  std::string path = (dir.path() / "test-video" / "clip.raw").string();
  write_bytes(path, make_frames(geometry, 60));
  EXPECT_DOUBLE_EQ(estimator.estimate(path), 2.0);
}

TEST_F(DurationEstimatorTest, MissingFileIsNotFound) {
  try {
    estimator.estimate(dir.file("nope.raw"));
    FAIL() << "expected ClipError";
  } catch (const ClipError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::NotFound);
  }
}

TEST_F(DurationEstimatorTest, RepeatedEstimatesAgree) {
  std::string path = dir.file("clip.raw");
  write_bytes(path, make_frames(geometry, 77));
  EXPECT_EQ(estimator.estimate(path), estimator.estimate(path));
}
