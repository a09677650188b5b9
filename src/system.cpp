/**
 * @file system.cpp
 * @brief Naming, time and filesystem utilities implementation
 */

#include "clip_forge/system.hpp"

#include <cmath>
#include <ctime>
#include <filesystem>
#include <random>
#include <system_error>

#include <fmt/core.h>

#include "clip_forge/error.hpp"

namespace clip_forge {

namespace fs = std::filesystem;

// **---- Naming ----**

std::string random_base36(size_t length) {
  static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int> pick(0, 35);

  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i)
    out.push_back(digits[pick(rng)]);
  return out;
}

std::string unique_suffix() {
  return fmt::format("{}-{}", to_epoch_ms(SystemClock::now()),
                     random_base36(8));
}

std::string trimmed_output_path(const std::string &source_path) {
  fs::path src(source_path);
  std::string name = fmt::format("{}-trimmed-{}{}", src.stem().string(),
                                 unique_suffix(), src.extension().string());
  return (src.parent_path() / name).string();
}

std::string merged_output_path(const std::string &directory) {
  std::string name = fmt::format("merged-{}{}", unique_suffix(), RAW_EXTENSION);
  return (fs::path(directory) / name).string();
}

// **---- Time ----**

int64_t to_epoch_ms(SystemClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

SystemClock::time_point from_epoch_ms(int64_t ms) {
  return SystemClock::time_point(
      std::chrono::duration_cast<SystemClock::duration>(
          std::chrono::milliseconds(ms)));
}

std::string format_iso8601(SystemClock::time_point tp) {
  int64_t ms = to_epoch_ms(tp);
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  int millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    secs -= 1;
  }

  std::tm utc{};
  gmtime_r(&secs, &utc);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                     utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

std::string format_time(double seconds) {
  long total_ms = std::lround(seconds * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms % 3600000) / 60000;
  long s = (total_ms % 60000) / 1000;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

// **---- Filesystem ----**

uint64_t file_size_or_throw(const std::string &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec)
      throw ClipError(ErrorKind::IOFailure,
                      fmt::format("cannot access {}: {}", path, ec.message()));
    throw ClipError(ErrorKind::NotFound, fmt::format("file not found: {}", path));
  }

  uintmax_t size = fs::file_size(path, ec);
  if (ec)
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("cannot stat {}: {}", path, ec.message()));
  return static_cast<uint64_t>(size);
}

} // namespace clip_forge
