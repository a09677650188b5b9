/**
 * @file trimmer.hpp
 * @brief Frame-accurate trimming of stored clips
 *
 * @details Raw clips are cut in memory on whole-frame boundaries:
 *
 *          start_frame = floor(trim_start * fps)
 *
 *          end_frame   = floor((total - trim_end) * fps)
 *
 *          and bytes [start_frame * frame_bytes, end_frame * frame_bytes)
 *          are written to a new file. Container clips are handed to the
 *          Transcoder and the caller blocks on its single result.
 *
 * @note The source clip is only read. Every trim writes a new file.
 */

#ifndef CLIP_FORGE_TRIMMER_HPP
#define CLIP_FORGE_TRIMMER_HPP

#include <cstdint>

#include "container_probe.hpp"
#include "duration_estimator.hpp"
#include "transcoder.hpp"
#include "types.hpp"

namespace clip_forge {

/**
 * @struct FrameRange
 * @brief Half-open range of whole frames [start, end).
 */
struct FrameRange {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t count() const { return end > start ? end - start : 0; }
};

class FrameTrimmer {
public:
  /// Frame geometry comes from `estimator`, so durations and byte offsets
  /// always agree
  FrameTrimmer(const DurationEstimator &estimator, ContainerProbe &probe,
               Transcoder &transcoder);

  /**
   * @brief Trim `clip` and write the result to a new file.
   * @param clip Source clip (raw or container)
   * @param window Seconds to remove from either end (absent = 0)
   * @return Path, duration (total - start - end) and size of the new file
   * @throws ClipError InvalidArgument for a non-finite, negative, all-zero
   *         or over-long window, NotFound if the source is missing, IOFailure on read or
   *         write faults, DelegateFailure if the transcoder fails
   */
  TransformResult trim(const Clip &clip, const TrimWindow &window);

  /**
   * @brief Frames retained when trimming a raw clip of `total` seconds.
   */
  FrameRange frame_range(double total, double trim_start,
                         double trim_end) const;

private:
  TransformResult trim_raw(const RawClip &clip, double total,
                           double trim_start, double trim_end,
                           double new_duration);
  TransformResult trim_container(const ContainerClip &clip, double trim_start,
                                 double trim_end, double new_duration);

  const DurationEstimator &estimator_;
  ContainerProbe &probe_;
  Transcoder &transcoder_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_TRIMMER_HPP
