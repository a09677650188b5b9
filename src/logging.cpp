/**
 * @file logging.cpp
 * @brief Log sink, runtime level and TimingCollector implementation
 */

#include "clip_forge/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>

namespace clip_forge {

std::mutex log_mutex;

namespace {
std::atomic<int> current_level{static_cast<int>(LogLevel::Info)};
}

// **----- LEVEL -----**

void set_log_level(LogLevel level) {
  current_level.store(static_cast<int>(level));
}

LogLevel log_level() { return static_cast<LogLevel>(current_level.load()); }

std::optional<LogLevel> parse_log_level(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "off" || lower == "none")
    return LogLevel::Off;
  return std::nullopt;
}

// **----- SINK -----**

void log_line(const fmt::text_style &style, std::string_view prefix,
              const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(stderr, style, "{}{}\n", prefix, message);
  std::fflush(stderr);
}

// **----- TIMING COLLECTOR -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  if (!log_enabled(LogLevel::Info))
    return;

  struct PhaseTotal {
    std::string name;
    size_t calls = 0;
    long total_us = 0;
  };
  std::vector<PhaseTotal> totals;
  {
    std::lock_guard<std::mutex> lock(timing_mutex);
    for (const auto &e : entries) {
      auto it = std::find_if(totals.begin(), totals.end(),
                             [&](const PhaseTotal &t) { return t.name == e.name; });
      if (it == totals.end()) {
        totals.push_back({e.name, 0, 0});
        it = totals.end() - 1;
      }
      ++it->calls;
      it->total_us += e.microseconds;
    }
  }
  if (totals.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print(stderr, fg(fmt::color::cyan),
             "\n================== TIMING SUMMARY ==================\n");
  fmt::print(stderr, "{:<24} {:>6} {:>20}\n", "Phase", "Calls", "Total [sec]");
  fmt::print(stderr, "{:-<24} {:-<6} {:-<20}\n", "", "", "");
  for (const auto &t : totals) {
    fmt::print(stderr, "{:<24} {:>6} {:>20.3f}\n", t.name, t.calls,
               t.total_us / 1000000.0);
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stderr);
}

size_t TimingCollector::count() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace clip_forge
