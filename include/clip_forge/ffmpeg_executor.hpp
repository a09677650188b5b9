/**
 * @file ffmpeg_executor.hpp
 * @brief Standalone FFmpeg execution for container trims
 *
 * @details Builds and runs one FFmpeg command. Used by the transcoder
 *          worker; kept separate so the command line can be tested without
 *          spawning a process.
 */

#ifndef CLIP_FORGE_FFMPEG_EXECUTOR_HPP
#define CLIP_FORGE_FFMPEG_EXECUTOR_HPP

#include <optional>
#include <string>

namespace clip_forge {

/**
 * @struct TranscodeRequest
 * @brief One trim handed to the external transcoder.
 */
struct TranscodeRequest {
  std::string input_path;
  std::string output_path;
  std::optional<double> start_sec;    //< Seek offset into the input
  std::optional<double> duration_sec; //< Length of the output
};

/**
 * @struct FFmpegStatus
 * @brief Exit status and combined stdout/stderr of one FFmpeg run.
 */
struct FFmpegStatus {
  int exit_code = 0;
  std::string output;
};

/**
 * @brief Quote a string for /bin/sh using single quotes.
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief Shell command that performs `request` with the given binary.
 */
std::string build_ffmpeg_trim_command(const std::string &ffmpeg_path,
                                      const TranscodeRequest &request);

/**
 * @brief Execute FFmpeg to trim a container clip.
 *
 * @param ffmpeg_path FFmpeg binary
 * @param request Input, output and cut parameters
 * @return Exit code (0 on success) and everything FFmpeg printed
 */
FFmpegStatus execute_ffmpeg_trim(const std::string &ffmpeg_path,
                                 const TranscodeRequest &request);

} // namespace clip_forge

#endif // CLIP_FORGE_FFMPEG_EXECUTOR_HPP
