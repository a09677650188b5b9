/**
 * @file types.cpp
 * @brief Clip classification and error labels
 */

#include "clip_forge/error.hpp"
#include "clip_forge/types.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace clip_forge {

Clip classify_clip(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == RAW_EXTENSION)
    return RawClip{path};
  return ContainerClip{path};
}

const std::string &clip_path(const Clip &clip) {
  return std::visit(
      [](const auto &c) -> const std::string & { return c.path; }, clip);
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::IOFailure:
    return "IOFailure";
  case ErrorKind::DelegateFailure:
    return "DelegateFailure";
  }
  return "Unknown";
}

} // namespace clip_forge
