/**
 * @file trimmer.cpp
 * @brief Frame-accurate trimming implementation
 */

#include "clip_forge/trimmer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/memory_io.hpp"
#include "clip_forge/system.hpp"

namespace clip_forge {

FrameTrimmer::FrameTrimmer(const DurationEstimator &estimator,
                           ContainerProbe &probe, Transcoder &transcoder)
    : estimator_(estimator), probe_(probe), transcoder_(transcoder) {}

FrameRange FrameTrimmer::frame_range(double total, double trim_start,
                                     double trim_end) const {
  double fps = static_cast<double>(estimator_.geometry().frame_rate);
  FrameRange range;
  range.start = static_cast<uint64_t>(std::floor(trim_start * fps));
  range.end = static_cast<uint64_t>(std::floor((total - trim_end) * fps));
  return range;
}

TransformResult FrameTrimmer::trim(const Clip &clip, const TrimWindow &window) {
  double trim_start = window.start.value_or(0.0);
  double trim_end = window.end.value_or(0.0);

  if (!std::isfinite(trim_start) || !std::isfinite(trim_end))
    throw ClipError(ErrorKind::InvalidArgument,
                    "trim values must be finite numbers");
  if (trim_start < 0.0 || trim_end < 0.0)
    throw ClipError(ErrorKind::InvalidArgument, "trim values must be positive");
  if (!(trim_start > 0.0) && !(trim_end > 0.0))
    throw ClipError(ErrorKind::InvalidArgument,
                    "must specify a positive trim amount");

  const std::string &path = clip_path(clip);
  double total = is_raw(clip) ? estimator_.estimate(path)
                              : probe_.probe(path).duration;

  double new_duration = total - trim_start - trim_end;
  if (!(new_duration > 0.0))
    throw ClipError(ErrorKind::InvalidArgument,
                    fmt::format("resulting clip would be empty ({:.3f}s - "
                                "{:.3f}s - {:.3f}s)",
                                total, trim_start, trim_end));

  if (const auto *raw = std::get_if<RawClip>(&clip))
    return trim_raw(*raw, total, trim_start, trim_end, new_duration);
  return trim_container(std::get<ContainerClip>(clip), trim_start, trim_end,
                        new_duration);
}

TransformResult FrameTrimmer::trim_raw(const RawClip &clip, double total,
                                       double trim_start, double trim_end,
                                       double new_duration) {
  TIMER_START(trim_raw);

  FrameRange range = frame_range(total, trim_start, trim_end);
  uint64_t frame_bytes = estimator_.geometry().frame_bytes();
  LOG_DEBUG("{}: {:.3f}s total, frames [{}, {}) of {} bytes", clip.path,
            total, range.start, range.end, frame_bytes);
  uint64_t first_byte = range.start * frame_bytes;
  uint64_t out_size = range.count() * frame_bytes;

  MappedFile source;
  if (!MemoryLoader::load_file(clip.path, source))
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("failed to read {}", clip.path));

  /// Fixture clips can claim more frames than they hold; the tail past the
  /// source stays zero so the output is always out_size bytes
  std::vector<uint8_t> output(static_cast<size_t>(out_size), 0);
  uint64_t available = source.size() > first_byte ? source.size() - first_byte : 0;
  uint64_t copy = std::min(available, out_size);
  if (copy > 0)
    std::memcpy(output.data(), source.data() + first_byte,
                static_cast<size_t>(copy));

  std::string output_path = trimmed_output_path(clip.path);
  if (!MemoryLoader::store_file(output_path, output))
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("failed to write {}", output_path));

  LOG_INFO("Trimmed {} frames [{}, {}) -> {} ({})", range.count(), range.start,
           range.end, output_path, format_time(new_duration));
  TIMER_END(trim_raw);

  TransformResult result;
  result.output_path = std::move(output_path);
  result.duration = new_duration;
  result.size = out_size;
  return result;
}

TransformResult FrameTrimmer::trim_container(const ContainerClip &clip,
                                             double trim_start,
                                             double trim_end,
                                             double new_duration) {
  TranscodeRequest request;
  request.input_path = clip.path;
  request.output_path = trimmed_output_path(clip.path);
  if (trim_start > 0.0)
    request.start_sec = trim_start;
  if (trim_end > 0.0)
    request.duration_sec = new_duration;

  std::string output_path = request.output_path;
  LOG_DEBUG("Queueing container trim {} -> {}", clip.path, output_path);

  TIMER_START(transcode_wait);
  std::future<void> done = transcoder_.submit(std::move(request));
  /// Single suspension point; a DelegateFailure propagates unchanged
  done.get();
  TIMER_END(transcode_wait);

  TransformResult result;
  result.output_path = output_path;
  result.duration = new_duration;
  result.size = file_size_or_throw(output_path);
  LOG_INFO("Transcoded trim -> {} ({})", output_path,
           format_time(new_duration));
  return result;
}

} // namespace clip_forge
