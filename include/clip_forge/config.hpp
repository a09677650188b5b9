/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once per process; components receive them as
 *          constructor arguments and never call back into Config.
 *
 */

#ifndef CLIP_FORGE_CONFIG_HPP
#define CLIP_FORGE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

#include "types.hpp"

namespace clip_forge {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a 64-bit integer value from environment variable.
 */
inline int64_t get_env_int64(const char *name, int64_t default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoll(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : std::string(default_val);
}

// **---- RAW GEOMETRY ----**

/// Raw frame width in pixels
inline int frame_width() {
  static int val = get_env_int("CLIP_FORGE_FRAME_WIDTH", 320);
  return val;
}

/// Raw frame height in pixels
inline int frame_height() {
  static int val = get_env_int("CLIP_FORGE_FRAME_HEIGHT", 240);
  return val;
}

/// Bytes per pixel (3 = rgb24)
inline int bytes_per_pixel() {
  static int val = get_env_int("CLIP_FORGE_BYTES_PER_PIXEL", 3);
  return val;
}

/// Raw frame rate
inline int frame_rate() {
  static int val = get_env_int("CLIP_FORGE_FRAME_RATE", 30);
  return val;
}

/**
 * @brief Geometry value injected into the estimator, trimmer and
 *        concatenator.
 */
inline FrameGeometry raw_geometry() {
  FrameGeometry g;
  g.width = static_cast<uint32_t>(frame_width());
  g.height = static_cast<uint32_t>(frame_height());
  g.bytes_per_pixel = static_cast<uint32_t>(bytes_per_pixel());
  g.frame_rate = static_cast<uint32_t>(frame_rate());
  return g;
}

// **---- FIXTURE DURATIONS ----**

/// Duration reported for files named test-video*
inline double fixture_short_sec() {
  static double val = get_env_double("CLIP_FORGE_FIXTURE_SHORT_SEC", 5.0);
  return val;
}

/// Duration reported for files named long-video*
inline double fixture_long_sec() {
  static double val = get_env_double("CLIP_FORGE_FIXTURE_LONG_SEC", 360.0);
  return val;
}

// **---- UPLOAD LIMITS ----**

/// Longest clip accepted on upload (seconds)
inline double max_upload_duration_sec() {
  static double val =
      get_env_double("CLIP_FORGE_MAX_UPLOAD_DURATION_SEC", 300.0);
  return val;
}

/// Largest file accepted on upload (bytes)
inline int64_t max_upload_bytes() {
  static int64_t val =
      get_env_int64("CLIP_FORGE_MAX_UPLOAD_BYTES", 1024LL * 1024 * 1024);
  return val;
}

// **---- SHARING ----**

/// Lifetime of a share link when the caller does not pick one
inline int share_ttl_hours() {
  static int val = get_env_int("CLIP_FORGE_SHARE_TTL_HOURS", 24);
  return val;
}

// **---- PATHS ----**

/// FFmpeg binary used for container trims
inline const std::string &ffmpeg_path() {
  static std::string val =
      get_env_string("CLIP_FORGE_FFMPEG", "/usr/local/bin/ffmpeg");
  return val;
}

/// SQLite catalog file
inline const std::string &catalog_path() {
  static std::string val = get_env_string("CLIP_FORGE_CATALOG", "clip_forge.db");
  return val;
}

/// Directory uploads are copied into
inline const std::string &storage_dir() {
  static std::string val = get_env_string("CLIP_FORGE_STORAGE_DIR", "uploads");
  return val;
}

// **---- LOGGING ----**

/// debug, info, warn, error or off
inline const std::string &log_level_name() {
  static std::string val = get_env_string("CLIP_FORGE_LOG_LEVEL", "info");
  return val;
}

} // namespace Config
} // namespace clip_forge

#endif // CLIP_FORGE_CONFIG_HPP
