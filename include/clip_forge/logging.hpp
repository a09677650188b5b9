/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Leveled logging macros (LOG_DEBUG, LOG_INFO, LOG_WARN, ...)
 *            compiled in by ENABLE_LOGGING and filtered at runtime
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for per-phase transform timings
 *
 * @note Every line goes to stderr and is flushed immediately, so CLI
 *       results on stdout stay parseable.
 */

#ifndef CLIP_FORGE_LOGGING_HPP
#define CLIP_FORGE_LOGGING_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace clip_forge {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// Lines below this level are dropped. Defaults to Info.
void set_log_level(LogLevel level);
LogLevel log_level();

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(log_level());
}

/// "debug", "info", "warn", "error" or "off" (case-insensitive)
std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Write one already formatted line under the log mutex.
 * @param prefix Tag such as "[WARN] ", may be empty
 */
void log_line(const fmt::text_style &style, std::string_view prefix,
              const std::string &message);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define CLIP_FORGE_LOG_AT(level, style, prefix, format_str, ...)               \
  do {                                                                         \
    if (clip_forge::log_enabled(level))                                        \
      clip_forge::log_line(style, prefix,                                      \
                           fmt::format(format_str, ##__VA_ARGS__));            \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  CLIP_FORGE_LOG_AT(clip_forge::LogLevel::Debug,                               \
                    fmt::fg(fmt::color::gray), "[DEBUG] ", format_str,         \
                    ##__VA_ARGS__)
#define LOG_INFO(format_str, ...)                                              \
  CLIP_FORGE_LOG_AT(clip_forge::LogLevel::Info, fmt::text_style(), "[INFO] ",  \
                    format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  CLIP_FORGE_LOG_AT(clip_forge::LogLevel::Warn,                                \
                    fmt::fg(fmt::color::yellow), "[WARN] ", format_str,        \
                    ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  CLIP_FORGE_LOG_AT(clip_forge::LogLevel::Error, fmt::fg(fmt::color::red),     \
                    "[ERROR] ", format_str, ##__VA_ARGS__)
/// Start of a pipeline step
#define LOG_PHASE(format_str, ...)                                             \
  CLIP_FORGE_LOG_AT(clip_forge::LogLevel::Info, fmt::fg(fmt::color::cyan), "", \
                    format_str, ##__VA_ARGS__)
/// A step committed its result
#define LOG_SUCCESS(format_str, ...)                                           \
  CLIP_FORGE_LOG_AT(clip_forge::LogLevel::Info, fmt::fg(fmt::color::green),    \
                    "", format_str, ##__VA_ARGS__)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: one measured phase.
 */
struct TimingEntry {
  std::string name;
  long microseconds;
};

/**
 * @class TimingCollector
 * @brief Process-wide store of phase timings.
 * @note The transcoder worker and request threads record here concurrently.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print per-phase call counts and totals, in first-seen order.
   * @note Silent when nothing was recorded or the level is above Info.
   */
  static void print_summary();

  static size_t count();
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  clip_forge::TimingCollector::record(                                         \
      #name, static_cast<long>(                                                \
                 std::chrono::duration_cast<std::chrono::microseconds>(        \
                     std::chrono::steady_clock::now() - timer_start_##name)    \
                     .count()))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace clip_forge

#endif // CLIP_FORGE_LOGGING_HPP
