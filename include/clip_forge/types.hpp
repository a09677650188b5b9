/**
 * @file types.hpp
 * @brief Core data types and constants for Clip Forge
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - I/O buffer sizing
 *
 *          - FrameGeometry for the raw pixel encoding
 *
 *          - Clip variant (raw vs container) and the catalog row
 *
 *          - TrimWindow and transform results
 *
 *          - ShareGrant for issued share links
 */

#ifndef CLIP_FORGE_TYPES_HPP
#define CLIP_FORGE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace clip_forge {

// **----- CONSTANTS -----**

/**
 * @brief Size of the I/O buffer handed to libavformat when probing.
 * @note Probing only reads headers and a handful of packets, 256KB is
 *       plenty for every container we accept.
 */
constexpr size_t AVIO_BUFFER_SIZE = 256 * 1024; //< 256KB

/**
 * @brief CPU cache line size for alignment.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

/// Extension that marks a clip as raw frames in FrameGeometry layout
constexpr const char *RAW_EXTENSION = ".raw";

// **----- DATA STRUCTURES -----**

/**
 * @struct FrameGeometry
 * @brief Fixed layout of a headerless raw video stream.
 * @note Pixels are interleaved with no row padding, so a frame is exactly
 *       width * height * bytes_per_pixel bytes. Built once from Config and
 *       passed by value to every component that needs it.
 */
struct FrameGeometry {
  uint32_t width = 320;          //< Frame width in pixels
  uint32_t height = 240;         //< Frame height in pixels
  uint32_t bytes_per_pixel = 3;  //< rgb24
  uint32_t frame_rate = 30;      //< Frames per second

  constexpr uint64_t frame_bytes() const {
    return static_cast<uint64_t>(width) * height * bytes_per_pixel;
  }

  /// Whole frames contained in a stream of the given size
  constexpr uint64_t frames_in(uint64_t byte_size) const {
    return frame_bytes() == 0 ? 0 : byte_size / frame_bytes();
  }
};

/**
 * @struct RawClip
 * @brief A clip stored as raw frames in FrameGeometry layout.
 */
struct RawClip {
  std::string path;
};

/**
 * @struct ContainerClip
 * @brief A clip in any other container (mp4, mov). Opaque to the engine,
 *        trimmed through the external transcoder.
 */
struct ContainerClip {
  std::string path;
};

/// Storage form of a clip, decided once from its filename
using Clip = std::variant<RawClip, ContainerClip>;

/**
 * @brief Classify a stored file as raw or container by its suffix.
 */
Clip classify_clip(const std::string &path);

/**
 * @brief Storage path of either clip form.
 */
const std::string &clip_path(const Clip &clip);

/**
 * @brief True if the clip holds raw frames.
 */
inline bool is_raw(const Clip &clip) {
  return std::holds_alternative<RawClip>(clip);
}

/**
 * @struct ClipRecord
 * @brief One row of the video catalog.
 * @note Rows are append-only. The file at `filepath` belongs to this row and
 *       is never rewritten.
 */
struct ClipRecord {
  int64_t id = 0;        //< Catalog-assigned identity
  std::string filename;  //< Basename of filepath
  std::string filepath;  //< Absolute or process-relative storage path
  uint64_t size = 0;     //< Bytes on disk
  double duration = 0.0; //< Seconds, always >= 0

  Clip clip() const { return classify_clip(filepath); }
};

/**
 * @struct TrimWindow
 * @brief Seconds to cut from the head and tail of a clip.
 * @note An absent side is treated as 0.
 */
struct TrimWindow {
  std::optional<double> start; //< Seconds removed from the start
  std::optional<double> end;   //< Seconds removed from the end
};

/**
 * @struct TransformResult
 * @brief A freshly written clip, not yet in the catalog.
 */
struct TransformResult {
  std::string output_path;
  double duration = 0.0;
  uint64_t size = 0;
};

using SystemClock = std::chrono::system_clock;

/**
 * @struct ShareGrant
 * @brief An issued share token and the instant it stops working.
 */
struct ShareGrant {
  std::string token;
  int64_t clip_id = 0;
  SystemClock::time_point expiry;
};

} // namespace clip_forge

#endif // CLIP_FORGE_TYPES_HPP
