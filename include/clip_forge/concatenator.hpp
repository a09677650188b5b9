/**
 * @file concatenator.hpp
 * @brief Byte-exact concatenation of raw clips
 *
 * @details Two passes over the inputs, in order:
 *
 *          1. Sum estimated durations and file sizes to size one buffer
 *
 *          2. Copy each clip's bytes into successive offsets
 *
 *          The merged file is exactly bytes(A) ++ bytes(B) ++ ... and its
 *          duration is the sum of the per-clip estimates, not a fresh
 *          estimate of the merged size.
 *
 * @attention Inputs must all be raw clips in the configured geometry.
 *            There is no re-muxing or re-encoding.
 *
 * @note Container inputs (.mp4/.mov) are rejected with InvalidArgument
 *       rather than byte-joined, since the result would not be playable.
 */

#ifndef CLIP_FORGE_CONCATENATOR_HPP
#define CLIP_FORGE_CONCATENATOR_HPP

#include <string>
#include <vector>

#include "duration_estimator.hpp"
#include "types.hpp"

namespace clip_forge {

class ClipConcatenator {
public:
  explicit ClipConcatenator(const DurationEstimator &estimator);

  /**
   * @brief Concatenate `clips` into a new raw file.
   * @param clips At least two raw clips, in output order
   * @return Path, summed duration and size of the merged file
   * @throws ClipError InvalidArgument for fewer than two or non-raw inputs,
   *         NotFound for a missing input file, IOFailure on read or write
   *         faults
   * @note The output goes next to the first input as merged-<suffix>.raw.
   *       A failed write may leave a partial file behind; no catalog row
   *       ever references it.
   */
  TransformResult merge(const std::vector<Clip> &clips);

private:
  const DurationEstimator &estimator_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_CONCATENATOR_HPP
