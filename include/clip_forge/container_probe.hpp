/**
 * @file container_probe.hpp
 * @brief Duration and stream metadata of container clips (mp4, mov)
 *
 * @details Container clips bypass DurationEstimator. Their duration comes
 *          from the FFmpeg libraries' own reading of the container, which is
 *          what the transcoder will see when it trims them.
 */

#ifndef CLIP_FORGE_CONTAINER_PROBE_HPP
#define CLIP_FORGE_CONTAINER_PROBE_HPP

#include <string>

namespace clip_forge {

/**
 * @struct ContainerInfo
 * @brief What a probe learned about a container's best video stream.
 */
struct ContainerInfo {
  double duration = 0.0; //< Seconds
  int width = 0;
  int height = 0;
  double fps = 0.0;
  std::string codec; //< Codec short name, e.g. "h264"
};

/**
 * @class ContainerProbe
 * @brief Interface for reading container metadata.
 */
class ContainerProbe {
public:
  virtual ~ContainerProbe() = default;

  /**
   * @brief Probe the container at `path`.
   * @throws ClipError NotFound if the file is missing, IOFailure if it
   *         cannot be read, DelegateFailure if the media library rejects it
   */
  virtual ContainerInfo probe(const std::string &path) = 0;
};

/**
 * @class LibavProbe
 * @brief ContainerProbe backed by libavformat reading from a RAM mapping.
 *
 * @attention THREAD MODEL:
 *
 *            - Each probe() call builds and tears down its own contexts,
 *              so one instance may be shared between threads.
 */
class LibavProbe : public ContainerProbe {
public:
  ContainerInfo probe(const std::string &path) override;
};

} // namespace clip_forge

#endif // CLIP_FORGE_CONTAINER_PROBE_HPP
