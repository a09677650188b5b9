/**
 * @file pipeline.cpp
 * @brief Video lifecycle orchestration implementation
 */

#include "clip_forge/pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/system.hpp"

namespace clip_forge {

namespace fs = std::filesystem;

// **---- Constructor ----**

VideoPipeline::VideoPipeline(Catalog &catalog,
                             const DurationEstimator &estimator,
                             ContainerProbe &probe, FrameTrimmer &trimmer,
                             ClipConcatenator &concatenator,
                             ShareTokenManager &shares, UploadLimits limits)
    : catalog_(catalog), estimator_(estimator), probe_(probe),
      trimmer_(trimmer), concatenator_(concatenator), shares_(shares),
      limits_(limits) {}

// **---- Upload ----**

bool VideoPipeline::is_accepted_type(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".raw" || ext == ".mp4" || ext == ".mov";
}

void VideoPipeline::reject_upload(const std::string &path,
                                  const std::string &reason) {
  std::error_code ec;
  if (!fs::remove(path, ec) || ec) {
    /// The row is never created either way; the file is now an orphan
    LOG_WARN("Rejected upload {} could not be deleted: {}", path,
             ec ? ec.message() : "file already gone");
  }
  LOG_WARN("Rejected upload {}: {}", path, reason);
  throw ClipError(ErrorKind::InvalidArgument, reason);
}

ClipRecord VideoPipeline::upload(const std::string &stored_path) {
  TIMER_START(upload);

  uint64_t size = file_size_or_throw(stored_path);

  if (!is_accepted_type(stored_path))
    reject_upload(stored_path,
                  "invalid file type, only .raw, .mp4 and .mov are allowed");

  if (size > limits_.max_bytes)
    reject_upload(stored_path,
                  fmt::format("video file exceeds maximum allowed size ({} "
                              "bytes)",
                              limits_.max_bytes));

  Clip clip = classify_clip(stored_path);
  double duration = 0.0;
  if (is_raw(clip)) {
    duration = estimator_.estimate(stored_path);
  } else {
    try {
      duration = probe_.probe(stored_path).duration;
    } catch (const ClipError &e) {
      if (e.kind() != ErrorKind::DelegateFailure)
        throw;
      reject_upload(stored_path, fmt::format("unreadable video: {}", e.what()));
    }
  }

  if (duration > limits_.max_duration_sec)
    reject_upload(stored_path,
                  fmt::format("video duration exceeds maximum allowed length "
                              "({} > {})",
                              format_time(duration),
                              format_time(limits_.max_duration_sec)));

  ClipRecord record;
  record.filename = fs::path(stored_path).filename().string();
  record.filepath = stored_path;
  record.size = size;
  record.duration = duration;

  ClipRecord stored = catalog_.insert_clip(record);
  LOG_SUCCESS("Uploaded video {} ({}, {} bytes)", stored.id,
              format_time(stored.duration), stored.size);
  TIMER_END(upload);
  return stored;
}

// **---- Transforms ----**

ClipRecord VideoPipeline::lookup(int64_t id) {
  auto record = catalog_.find_clip(id);
  if (!record)
    throw ClipError(ErrorKind::NotFound,
                    fmt::format("video with ID {} not found", id));
  return *record;
}

ClipRecord VideoPipeline::record_result(const TransformResult &result) {
  ClipRecord record;
  record.filename = fs::path(result.output_path).filename().string();
  record.filepath = result.output_path;
  record.size = result.size;
  record.duration = result.duration;
  return catalog_.insert_clip(record);
}

ClipRecord VideoPipeline::trim(int64_t id, const TrimWindow &window) {
  ClipRecord source = lookup(id);
  LOG_PHASE("Trimming video {} ({})", id, source.filename);

  TransformResult result = trimmer_.trim(source.clip(), window);
  ClipRecord stored = record_result(result);

  LOG_SUCCESS("Trim of video {} stored as video {} ({})", id, stored.id,
              format_time(stored.duration));
  return stored;
}

ClipRecord VideoPipeline::merge(const std::vector<int64_t> &ids) {
  if (ids.size() < 2)
    throw ClipError(ErrorKind::InvalidArgument, "at least two clips required");

  std::vector<Clip> clips;
  clips.reserve(ids.size());
  for (int64_t id : ids) {
    clips.push_back(lookup(id).clip());
  }

  LOG_PHASE("Merging {} videos", ids.size());
  TransformResult result = concatenator_.merge(clips);
  ClipRecord stored = record_result(result);

  LOG_SUCCESS("Merge stored as video {} ({})", stored.id,
              format_time(stored.duration));
  return stored;
}

// **---- Sharing ----**

ShareGrant VideoPipeline::share(int64_t id, std::optional<int> ttl_hours) {
  return shares_.issue(id, ttl_hours.value_or(limits_.default_share_ttl_hours));
}

ClipRecord VideoPipeline::open_shared(const std::string &token) {
  return shares_.resolve(token);
}

ClipRecord VideoPipeline::describe(int64_t id) { return lookup(id); }

} // namespace clip_forge
