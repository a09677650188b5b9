/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "clip_forge/ffmpeg_executor.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/wait.h>

#include <fmt/core.h>

#include "clip_forge/logging.hpp"

namespace clip_forge {

std::string shell_quote(const std::string &arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '\'';
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

std::string build_ffmpeg_trim_command(const std::string &ffmpeg_path,
                                      const TranscodeRequest &request) {
  std::string cmd = fmt::format("{} -y -hide_banner -loglevel error -i {}",
                                shell_quote(ffmpeg_path),
                                shell_quote(request.input_path));

  /// Output-side seek keeps the cut frame accurate for re-encoded output
  if (request.start_sec)
    cmd += fmt::format(" -ss {:.3f}", *request.start_sec);
  if (request.duration_sec)
    cmd += fmt::format(" -t {:.3f}", *request.duration_sec);

  cmd += fmt::format(" {} 2>&1", shell_quote(request.output_path));
  return cmd;
}

FFmpegStatus execute_ffmpeg_trim(const std::string &ffmpeg_path,
                                 const TranscodeRequest &request) {
  std::string cmd = build_ffmpeg_trim_command(ffmpeg_path, request);

  LOG_INFO("[FFmpeg Worker] Executing trim: {}",
           std::filesystem::path(request.output_path).filename().string());

  FFmpegStatus status;
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    status.exit_code = -1;
    status.output = fmt::format("failed to start ffmpeg: {}", std::strerror(errno));
    LOG_ERROR("{}", status.output);
    return status;
  }

  std::array<char, 4096> buf;
  size_t n;
  while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    status.output.append(buf.data(), n);
  }

  int raw = pclose(pipe);
  if (raw == -1) {
    status.exit_code = -1;
    if (status.output.empty())
      status.output = fmt::format("failed to wait for ffmpeg: {}",
                                  std::strerror(errno));
  } else if (WIFEXITED(raw)) {
    status.exit_code = WEXITSTATUS(raw);
  } else {
    status.exit_code = -1;
    if (status.output.empty())
      status.output = "ffmpeg terminated abnormally";
  }

  if (status.exit_code != 0) {
    LOG_ERROR("FFmpeg failed with status {}", status.exit_code);
  }
  return status;
}

} // namespace clip_forge
