/**
 * @file transcoder.hpp
 * @brief External transcoder delegate for container clips
 *
 * @details A submitted trim completes or fails exactly once, asynchronously.
 *          The returned future is the single-shot result channel: get()
 *          returns on success and throws ClipError{DelegateFailure} carrying
 *          the transcoder's own message otherwise. There is no progress
 *          reporting and no cancellation once a job is queued.
 */

#ifndef CLIP_FORGE_TRANSCODER_HPP
#define CLIP_FORGE_TRANSCODER_HPP

#include <future>
#include <string>
#include <thread>

#include "ffmpeg_executor.hpp"
#include "ffmpeg_queue.hpp"

namespace clip_forge {

/**
 * @class Transcoder
 * @brief Interface the trimmer uses for non-raw clips.
 */
class Transcoder {
public:
  virtual ~Transcoder() = default;

  /**
   * @brief Queue a trim.
   * @return Future that becomes ready when the output file is complete
   */
  virtual std::future<void> submit(TranscodeRequest request) = 0;
};

/**
 * @class FFmpegTranscoder
 * @brief Runs FFmpeg jobs sequentially on a dedicated worker thread.
 * @note One FFmpeg process at a time keeps disk writes from contending.
 *       The destructor drains queued jobs before joining the worker.
 */
class FFmpegTranscoder : public Transcoder {
public:
  explicit FFmpegTranscoder(std::string ffmpeg_path);
  ~FFmpegTranscoder() override;

  FFmpegTranscoder(const FFmpegTranscoder &) = delete;
  FFmpegTranscoder &operator=(const FFmpegTranscoder &) = delete;

  std::future<void> submit(TranscodeRequest request) override;

private:
  void worker_loop();

  std::string ffmpeg_path_;
  FFmpegQueue queue_;
  std::thread worker_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_TRANSCODER_HPP
