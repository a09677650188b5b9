/**
 * @file ffmpeg_queue.hpp
 * @brief Thread-safe FFmpeg job queue for producer-consumer pattern
 *
 * @details Request threads push trim jobs, the transcoder worker pops and
 *          runs them one at a time. Each job carries the promise its
 *          submitter is waiting on.
 */

#ifndef CLIP_FORGE_FFMPEG_QUEUE_HPP
#define CLIP_FORGE_FFMPEG_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>

#include "ffmpeg_executor.hpp"

namespace clip_forge {

/**
 * @struct FFmpegJob
 * @brief A single FFmpeg trim job and its completion channel.
 */
struct FFmpegJob {
  TranscodeRequest request;
  std::promise<void> done; //< Set exactly once: value or DelegateFailure
};

/**
 * @class FFmpegQueue
 * @brief Thread-safe queue for FFmpeg jobs (producer-consumer pattern).
 *
 * @attention USAGE:
 *
 *   - Request threads call push()
 *
 *   - The transcoder worker calls pop() in a loop
 *
 *   - finish() wakes the worker once remaining jobs are drained
 */
class FFmpegQueue {
public:
  /**
   * @brief Push a job to the queue.
   * @return false if the queue is already finished (job not queued)
   */
  bool push(FFmpegJob &job);

  /**
   * @brief Pop a job from the queue (blocking).
   * @param job Output: the job to execute
   * @return true if job was retrieved, false if queue is finished
   */
  bool pop(FFmpegJob &job);

  /**
   * @brief Signal that no more jobs will be pushed.
   */
  void finish();

  /**
   * @brief Check if queue is empty.
   */
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<FFmpegJob> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace clip_forge

#endif // CLIP_FORGE_FFMPEG_QUEUE_HPP
