/**
 * @file concatenator.cpp
 * @brief Raw clip concatenation implementation
 */

#include "clip_forge/concatenator.hpp"

#include <cstring>
#include <filesystem>

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/memory_io.hpp"
#include "clip_forge/system.hpp"

namespace clip_forge {

ClipConcatenator::ClipConcatenator(const DurationEstimator &estimator)
    : estimator_(estimator) {}

TransformResult ClipConcatenator::merge(const std::vector<Clip> &clips) {
  if (clips.size() < 2)
    throw ClipError(ErrorKind::InvalidArgument, "at least two clips required");

  for (const auto &clip : clips) {
    if (!is_raw(clip))
      throw ClipError(ErrorKind::InvalidArgument,
                      fmt::format("cannot merge non-raw clip {}",
                                  clip_path(clip)));
  }

  TIMER_START(merge);

  // **----- PASS 1: SIZE THE OUTPUT -----**

  double total_duration = 0.0;
  uint64_t total_size = 0;
  std::vector<uint64_t> sizes;
  sizes.reserve(clips.size());

  for (const auto &clip : clips) {
    const std::string &path = clip_path(clip);
    total_duration += estimator_.estimate(path);
    uint64_t size = file_size_or_throw(path);
    sizes.push_back(size);
    total_size += size;
  }

  // **----- PASS 2: COPY IN ORDER -----**

  std::vector<uint8_t> output(static_cast<size_t>(total_size));
  uint64_t offset = 0;

  for (size_t i = 0; i < clips.size(); ++i) {
    const std::string &path = clip_path(clips[i]);
    MappedFile input;
    if (!MemoryLoader::load_file(path, input))
      throw ClipError(ErrorKind::IOFailure,
                      fmt::format("failed to read {}", path));

    /// Stored clips are immutable; a size change means storage is broken
    if (input.size() != sizes[i])
      throw ClipError(ErrorKind::IOFailure,
                      fmt::format("{} changed size during merge ({} != {})",
                                  path, input.size(), sizes[i]));

    if (input.size() > 0)
      std::memcpy(output.data() + offset, input.data(), input.size());
    offset += input.size();
  }

  std::string directory =
      std::filesystem::path(clip_path(clips.front())).parent_path().string();
  std::string output_path = merged_output_path(directory);
  if (!MemoryLoader::store_file(output_path, output))
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("failed to write {}", output_path));

  LOG_INFO("Merged {} clips ({} bytes) -> {} ({})", clips.size(), total_size,
           output_path, format_time(total_duration));
  TIMER_END(merge);

  TransformResult result;
  result.output_path = std::move(output_path);
  result.duration = total_duration;
  result.size = total_size;
  return result;
}

} // namespace clip_forge
