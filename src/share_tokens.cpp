/**
 * @file share_tokens.cpp
 * @brief Share token issue and resolution
 */

#include "clip_forge/share_tokens.hpp"

#include <chrono>

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/system.hpp"

namespace clip_forge {

ShareTokenManager::ShareTokenManager(Catalog &catalog, ClockFn clock)
    : catalog_(catalog), clock_(std::move(clock)) {}

ShareGrant ShareTokenManager::issue(int64_t clip_id, int ttl_hours) {
  if (ttl_hours <= 0)
    throw ClipError(ErrorKind::InvalidArgument,
                    fmt::format("share lifetime must be positive, got {}h",
                                ttl_hours));

  if (!catalog_.find_clip(clip_id))
    throw ClipError(ErrorKind::NotFound,
                    fmt::format("video with ID {} not found", clip_id));

  auto now = clock_();
  const auto max_ttl = std::chrono::duration_cast<std::chrono::hours>(
      SystemClock::time_point::max() - now);
  if (ttl_hours > max_ttl.count())
    throw ClipError(ErrorKind::InvalidArgument,
                    fmt::format("share lifetime of {}h is too long", ttl_hours));

  ShareGrant grant;
  grant.clip_id = clip_id;
  grant.token = fmt::format("{}-{}", to_epoch_ms(now), random_base36(16));
  grant.expiry = now + std::chrono::hours(ttl_hours);

  catalog_.insert_share(grant);
  LOG_INFO("Shared video {} until {}", clip_id, format_iso8601(grant.expiry));
  return grant;
}

ClipRecord ShareTokenManager::resolve(const std::string &token) {
  auto grant = catalog_.find_share(token);

  /// Unknown and expired look the same to the caller
  if (!grant || !(clock_() < grant->expiry))
    throw ClipError(ErrorKind::NotFound, "share link not found or expired");

  auto clip = catalog_.find_clip(grant->clip_id);
  if (!clip)
    throw ClipError(ErrorKind::NotFound, "share link not found or expired");
  return *clip;
}

std::string ShareTokenManager::share_url(const std::string &token) {
  return fmt::format("/videos/share/{}", token);
}

} // namespace clip_forge
