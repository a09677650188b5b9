/**
 * @file container_probe.cpp
 * @brief libavformat-backed container probing
 *
 * @details The file is mapped with MemoryLoader and handed to libavformat
 *          through custom AVIO callbacks, the same way every other clip read
 *          in this project goes through a mapping.
 */

#include "clip_forge/container_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/memory_io.hpp"
#include "clip_forge/system.hpp"
#include "clip_forge/types.hpp"

namespace clip_forge {

namespace {

std::string av_error_text(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

/**
 * @class ProbeSession
 * @brief Owns the libav contexts for one probe.
 * @attention Destructor handles partial initialization failures and frees
 *            resources in reverse allocation order.
 */
class ProbeSession {
  AVFormatContext *fmt_ctx = nullptr;
  AVIOContext *avio_ctx = nullptr;
  uint8_t *avio_buffer = nullptr;
  MemReaderState mem_state;
  bool opened = false;

public:
  explicit ProbeSession(const MappedFile &file)
      : mem_state{file.data(), file.size(), 0} {}

  ~ProbeSession() {
    if (opened) {
      /// avformat_close_input leaves custom I/O alone with
      /// AVFMT_FLAG_CUSTOM_IO, so the AVIO context is freed below
      avformat_close_input(&fmt_ctx);
    } else if (fmt_ctx) {
      avformat_free_context(fmt_ctx);
    }

    if (avio_ctx) {
      /// avio_context_free does not free the (possibly reallocated) buffer
      av_freep(&avio_ctx->buffer);
      avio_context_free(&avio_ctx);
    } else if (avio_buffer) {
      av_free(avio_buffer);
    }
  }

  ProbeSession(const ProbeSession &) = delete;
  ProbeSession &operator=(const ProbeSession &) = delete;

  ContainerInfo run(const std::string &path) {
    fmt_ctx = avformat_alloc_context();
    if (!fmt_ctx)
      throw ClipError(ErrorKind::IOFailure, "failed to allocate AVFormatContext");

    avio_buffer = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
    if (!avio_buffer)
      throw ClipError(ErrorKind::IOFailure, "failed to allocate AVIO buffer");

    avio_ctx = avio_alloc_context(avio_buffer, AVIO_BUFFER_SIZE, 0, &mem_state,
                                  MemoryLoader::read, nullptr,
                                  MemoryLoader::seek);
    if (!avio_ctx)
      throw ClipError(ErrorKind::IOFailure, "failed to allocate AVIOContext");

    fmt_ctx->pb = avio_ctx;
    fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    /// On failure avformat_open_input frees fmt_ctx and nulls the pointer
    int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0)
      throw ClipError(ErrorKind::DelegateFailure,
                      fmt::format("cannot open container {}: {}", path,
                                  av_error_text(ret)));
    opened = true;

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0)
      throw ClipError(ErrorKind::DelegateFailure,
                      fmt::format("cannot read stream info of {}: {}", path,
                                  av_error_text(ret)));

    int idx = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1,
                                  nullptr, 0);
    if (idx < 0)
      throw ClipError(ErrorKind::DelegateFailure,
                      fmt::format("no video stream in {}", path));

    const AVStream *stream = fmt_ctx->streams[idx];
    const AVCodecParameters *par = stream->codecpar;

    ContainerInfo info;
    info.width = par->width;
    info.height = par->height;
    info.codec = avcodec_get_name(par->codec_id);

    AVRational rate = stream->avg_frame_rate.num ? stream->avg_frame_rate
                                                 : stream->r_frame_rate;
    info.fps = rate.den ? av_q2d(rate) : 0.0;

    /// Prefer the container duration, fall back to the stream's own
    if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
      info.duration = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
      info.duration = stream->duration * av_q2d(stream->time_base);
    }
    return info;
  }
};

} // anonymous namespace

ContainerInfo LibavProbe::probe(const std::string &path) {
  TIMER_START(container_probe);

  /// Raises NotFound before libav gets a chance to report something vaguer
  file_size_or_throw(path);

  MappedFile file;
  if (!MemoryLoader::load_file(path, file))
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("failed to map container {}", path));

  ProbeSession session(file);
  ContainerInfo info = session.run(path);

  LOG_INFO("Probed {}: {} {}x{} @ {:.2f}fps, {}", path, info.codec, info.width,
           info.height, info.fps, format_time(info.duration));
  TIMER_END(container_probe);
  return info;
}

} // namespace clip_forge
