/**
 * @file share_tokens.hpp
 * @brief Time-limited share links for stored clips
 *
 * @details A token is valid while now < expiry, evaluated against the clock
 *          at every resolve. Tokens are never renewed or revoked; expiry is
 *          the only way they stop working. A token refers to its clip by id
 *          only and does not keep it alive.
 */

#ifndef CLIP_FORGE_SHARE_TOKENS_HPP
#define CLIP_FORGE_SHARE_TOKENS_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "catalog.hpp"
#include "types.hpp"

namespace clip_forge {

/// Source of "now"; injectable so expiry can be tested
using ClockFn = std::function<SystemClock::time_point()>;

class ShareTokenManager {
public:
  explicit ShareTokenManager(Catalog &catalog,
                             ClockFn clock = [] { return SystemClock::now(); });

  /**
   * @brief Issue a token for `clip_id` valid for `ttl_hours`.
   * @throws ClipError NotFound if the clip does not exist,
   *         InvalidArgument if ttl_hours is not positive or would put the
   *         expiry past the end of the clock's range
   */
  ShareGrant issue(int64_t clip_id, int ttl_hours);

  /**
   * @brief Clip behind a live token.
   * @throws ClipError NotFound if the token is unknown, expired, or its clip
   *         no longer resolves
   */
  ClipRecord resolve(const std::string &token);

  /// Public URL path for a token
  static std::string share_url(const std::string &token);

private:
  Catalog &catalog_;
  ClockFn clock_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_SHARE_TOKENS_HPP
