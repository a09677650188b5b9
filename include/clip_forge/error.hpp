/**
 * @file error.hpp
 * @brief Typed failures raised by the transform engine
 *
 * @details Every operation that can fail throws ClipError. The kind tells
 *          the caller whether resubmitting makes sense:
 *
 *          - NotFound / InvalidArgument: never retried
 *
 *          - IOFailure / DelegateFailure: caller may resubmit explicitly
 */

#ifndef CLIP_FORGE_ERROR_HPP
#define CLIP_FORGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace clip_forge {

enum class ErrorKind {
  NotFound,        //< Missing clip, file or token
  InvalidArgument, //< Request violates a domain rule
  IOFailure,       //< Read, write or catalog fault
  DelegateFailure, //< External transcoder or media library reported an error
};

/**
 * @brief Stable label for a failure kind (used in logs and CLI output).
 */
const char *to_string(ErrorKind kind);

/**
 * @class ClipError
 * @brief Exception carrying an ErrorKind and a human-readable message.
 */
class ClipError : public std::runtime_error {
public:
  ClipError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_ERROR_HPP
