/**
 * @file main.cpp
 * @brief Entry point for the Clip Forge command-line tool
 *
 * @details Commands:
 *
 *          - upload <file>                  copy into storage and catalog
 *
 *          - trim <id> [--start s] [--end s]
 *
 *          - merge <id> <id> [<id>...]
 *
 *          - share <id> [hours]
 *
 *          - fetch <token> <dest>            download through a share link
 *
 *          - info <id>
 *
 * @note Results go to stdout as key=value lines, logs go to stderr.
 *       Exit status: 0 ok, 1 usage, 2 NotFound, 3 InvalidArgument,
 *       4 IOFailure, 5 DelegateFailure.
 */

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "clip_forge/catalog.hpp"
#include "clip_forge/concatenator.hpp"
#include "clip_forge/config.hpp"
#include "clip_forge/container_probe.hpp"
#include "clip_forge/duration_estimator.hpp"
#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/pipeline.hpp"
#include "clip_forge/share_tokens.hpp"
#include "clip_forge/system.hpp"
#include "clip_forge/transcoder.hpp"
#include "clip_forge/trimmer.hpp"

using namespace clip_forge;

namespace fs = std::filesystem;

namespace {

// **---- USAGE ----**

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void print_usage() {
  LOG_WARN("Usage: ./clip_forge <command> [args]\n"
           "  upload <file>\n"
           "  trim <id> [--start <sec>] [--end <sec>]\n"
           "  merge <id> <id> [<id>...]\n"
           "  share <id> [hours]\n"
           "  fetch <token> <dest>\n"
           "  info <id>");
}

int64_t parse_id(const std::string &arg) {
  try {
    size_t used = 0;
    long long v = std::stoll(arg, &used);
    if (used != arg.size())
      throw UsageError(fmt::format("not a video id: {}", arg));
    return static_cast<int64_t>(v);
  } catch (const std::logic_error &) {
    throw UsageError(fmt::format("not a video id: {}", arg));
  }
}

double parse_seconds(const std::string &arg) {
  try {
    size_t used = 0;
    double v = std::stod(arg, &used);
    if (used != arg.size() || !std::isfinite(v))
      throw UsageError(fmt::format("not a number: {}", arg));
    return v;
  } catch (const std::logic_error &) {
    throw UsageError(fmt::format("not a number: {}", arg));
  }
}

int parse_hours(const std::string &arg) {
  int64_t v = parse_id(arg);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
    throw UsageError(fmt::format("share lifetime out of range: {}", arg));
  return static_cast<int>(v);
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return 2;
  case ErrorKind::InvalidArgument:
    return 3;
  case ErrorKind::IOFailure:
    return 4;
  case ErrorKind::DelegateFailure:
    return 5;
  }
  return 1;
}

void print_record(const ClipRecord &r) {
  fmt::print("id={}\nfilename={}\nfilepath={}\nsize={}\nduration={:.3f}\n",
             r.id, r.filename, r.filepath, r.size, r.duration);
}

/**
 * @brief Copy an incoming file into the storage directory under a fresh
 *        name. The original stem is kept as a prefix.
 */
std::string stage_upload(const std::string &source) {
  if (!fs::exists(source))
    throw ClipError(ErrorKind::NotFound,
                    fmt::format("file not found: {}", source));

  std::error_code ec;
  fs::create_directories(Config::storage_dir(), ec);
  if (ec)
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("cannot create {}: {}", Config::storage_dir(),
                                ec.message()));

  fs::path src(source);
  std::string name = fmt::format("{}-{}{}", src.stem().string(),
                                 unique_suffix(), src.extension().string());
  fs::path dest = fs::path(Config::storage_dir()) / name;

  fs::copy_file(src, dest, fs::copy_options::none, ec);
  if (ec)
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("cannot store {}: {}", source, ec.message()));
  return dest.string();
}

// **---- COMMANDS ----**

int run_command(VideoPipeline &pipeline, const std::vector<std::string> &args) {
  const std::string &cmd = args[0];

  if (cmd == "upload") {
    if (args.size() != 2)
      throw UsageError("upload takes one file");
    print_record(pipeline.upload(stage_upload(args[1])));
    return 0;
  }

  if (cmd == "trim") {
    if (args.size() < 2)
      throw UsageError("trim needs a video id");
    int64_t id = parse_id(args[1]);
    TrimWindow window;
    for (size_t i = 2; i < args.size(); i += 2) {
      if (i + 1 >= args.size())
        throw UsageError(fmt::format("{} needs a value", args[i]));
      if (args[i] == "--start")
        window.start = parse_seconds(args[i + 1]);
      else if (args[i] == "--end")
        window.end = parse_seconds(args[i + 1]);
      else
        throw UsageError(fmt::format("unknown option {}", args[i]));
    }
    print_record(pipeline.trim(id, window));
    return 0;
  }

  if (cmd == "merge") {
    std::vector<int64_t> ids;
    for (size_t i = 1; i < args.size(); ++i)
      ids.push_back(parse_id(args[i]));
    print_record(pipeline.merge(ids));
    return 0;
  }

  if (cmd == "share") {
    if (args.size() < 2 || args.size() > 3)
      throw UsageError("share takes a video id and optional hours");
    std::optional<int> hours;
    if (args.size() == 3)
      hours = parse_hours(args[2]);
    ShareGrant grant = pipeline.share(parse_id(args[1]), hours);
    fmt::print("shareUrl={}\nexpiryTimestamp={}\n",
               ShareTokenManager::share_url(grant.token),
               format_iso8601(grant.expiry));
    return 0;
  }

  if (cmd == "fetch") {
    if (args.size() != 3)
      throw UsageError("fetch takes a token and a destination");
    ClipRecord clip = pipeline.open_shared(args[1]);
    std::error_code ec;
    fs::copy_file(clip.filepath, args[2], fs::copy_options::overwrite_existing,
                  ec);
    if (ec)
      throw ClipError(ErrorKind::IOFailure,
                      fmt::format("cannot copy {}: {}", clip.filepath,
                                  ec.message()));
    print_record(clip);
    return 0;
  }

  if (cmd == "info") {
    if (args.size() != 2)
      throw UsageError("info takes a video id");
    print_record(pipeline.describe(parse_id(args[1])));
    return 0;
  }

  throw UsageError(fmt::format("unknown command {}", cmd));
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  std::vector<std::string> args(argv + 1, argv + argc);

  if (auto level = parse_log_level(Config::log_level_name())) {
    set_log_level(*level);
  } else {
    LOG_WARN("Unknown CLIP_FORGE_LOG_LEVEL '{}', using info",
             Config::log_level_name());
  }

  int status = 0;
  try {
    FrameGeometry geometry = Config::raw_geometry();
    DurationEstimator estimator(
        geometry, {Config::fixture_short_sec(), Config::fixture_long_sec()});
    LibavProbe probe;
    FFmpegTranscoder transcoder(Config::ffmpeg_path());
    Catalog catalog(Config::catalog_path());
    ShareTokenManager shares(catalog);
    FrameTrimmer trimmer(estimator, probe, transcoder);
    ClipConcatenator concatenator(estimator);

    UploadLimits limits;
    limits.max_duration_sec = Config::max_upload_duration_sec();
    limits.max_bytes = static_cast<uint64_t>(Config::max_upload_bytes());
    limits.default_share_ttl_hours = Config::share_ttl_hours();

    VideoPipeline pipeline(catalog, estimator, probe, trimmer, concatenator,
                           shares, limits);
    status = run_command(pipeline, args);
  } catch (const UsageError &e) {
    LOG_ERROR("{}", e.what());
    print_usage();
    status = 1;
  } catch (const ClipError &e) {
    LOG_ERROR("{}: {}", to_string(e.kind()), e.what());
    status = exit_code_for(e.kind());
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected error: {}", e.what());
    status = 1;
  }

  TimingCollector::print_summary();
  return status;
}
