/**
 * @file ffmpeg_queue.cpp
 * @brief FFmpeg job queue implementation
 */

#include "clip_forge/ffmpeg_queue.hpp"

namespace clip_forge {

bool FFmpegQueue::push(FFmpegJob &job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    /// Checked under the lock so finish() cannot slip in between
    if (done_.load())
      return false;
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

bool FFmpegQueue::pop(FFmpegJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty()) {
    return false;
  }

  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void FFmpegQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace clip_forge
