/**
 * @file transcoder.cpp
 * @brief FFmpeg transcoder worker implementation
 */

#include "clip_forge/transcoder.hpp"

#include <exception>

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"

namespace clip_forge {

FFmpegTranscoder::FFmpegTranscoder(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {
  worker_ = std::thread([this] { worker_loop(); });
}

FFmpegTranscoder::~FFmpegTranscoder() {
  queue_.finish();
  if (worker_.joinable())
    worker_.join();
}

std::future<void> FFmpegTranscoder::submit(TranscodeRequest request) {
  FFmpegJob job;
  job.request = std::move(request);
  std::future<void> result = job.done.get_future();

  if (!queue_.push(job)) {
    job.done.set_exception(std::make_exception_ptr(
        ClipError(ErrorKind::DelegateFailure, "transcoder is shutting down")));
  }
  return result;
}

void FFmpegTranscoder::worker_loop() {
  FFmpegJob job;
  while (queue_.pop(job)) {
    TIMER_START(ffmpeg_trim);
    FFmpegStatus status = execute_ffmpeg_trim(ffmpeg_path_, job.request);
    TIMER_END(ffmpeg_trim);

    if (status.exit_code == 0) {
      job.done.set_value();
      continue;
    }

    std::string message =
        status.output.empty()
            ? fmt::format("ffmpeg exited with status {}", status.exit_code)
            : status.output;
    job.done.set_exception(std::make_exception_ptr(
        ClipError(ErrorKind::DelegateFailure, message)));
  }
}

} // namespace clip_forge
