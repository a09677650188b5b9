/**
 * @file pipeline.hpp
 * @brief Video lifecycle orchestration
 *
 * @details The VideoPipeline class ties the transforms to the catalog:
 *
 *          1. Resolve referenced clip ids to stored files
 *
 *          2. Estimate duration / run the transform
 *
 *          3. Insert exactly one new catalog row for the result
 *
 * @note Existing rows and files are never updated or deleted. The only
 *       file ever removed is a just-stored upload that fails validation,
 *       and that happens before any row exists for it.
 * @note There are no retries. A failed transform may have written a partial
 *       output file, so resubmitting is left to the caller.
 */

#ifndef CLIP_FORGE_PIPELINE_HPP
#define CLIP_FORGE_PIPELINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "concatenator.hpp"
#include "container_probe.hpp"
#include "duration_estimator.hpp"
#include "share_tokens.hpp"
#include "trimmer.hpp"
#include "types.hpp"

namespace clip_forge {

/**
 * @struct UploadLimits
 * @brief Validation applied to every upload.
 */
struct UploadLimits {
  double max_duration_sec = 300.0;              //< 5 minutes
  uint64_t max_bytes = 1024ULL * 1024 * 1024;   //< 1 GiB
  int default_share_ttl_hours = 24;
};

/**
 * @class VideoPipeline
 * @brief Orchestrates upload, trim, merge and sharing of catalogued clips.
 *
 * @attention THREAD MODEL:
 *
 *            - Holds no per-request state; concurrent calls are independent
 *
 *            - Transforms only read their inputs and write uniquely named
 *              outputs, so requests on the same source clip do not race
 *
 *            - The catalog insert is the single serialization point
 */
class VideoPipeline {
public:
  VideoPipeline(Catalog &catalog, const DurationEstimator &estimator,
                ContainerProbe &probe, FrameTrimmer &trimmer,
                ClipConcatenator &concatenator, ShareTokenManager &shares,
                UploadLimits limits = {});

  /**
   * @brief Validate and catalog a freshly stored upload.
   * @param stored_path File already written to storage
   * @return The new catalog row
   * @throws ClipError InvalidArgument if the type, size or duration is
   *         rejected (the file is deleted first), NotFound if the file is
   *         missing
   */
  ClipRecord upload(const std::string &stored_path);

  /**
   * @brief Trim clip `id` into a new catalogued clip.
   */
  ClipRecord trim(int64_t id, const TrimWindow &window);

  /**
   * @brief Concatenate `ids` (in order) into a new catalogued clip.
   * @throws ClipError InvalidArgument for fewer than two ids, NotFound
   *         naming the first id that does not resolve
   */
  ClipRecord merge(const std::vector<int64_t> &ids);

  /**
   * @brief Issue a share link for clip `id`.
   * @param ttl_hours Lifetime; the configured default when absent
   */
  ShareGrant share(int64_t id, std::optional<int> ttl_hours = std::nullopt);

  /**
   * @brief Clip behind a live share token.
   */
  ClipRecord open_shared(const std::string &token);

  /**
   * @brief Catalog row for `id`.
   * @throws ClipError NotFound if absent
   */
  ClipRecord describe(int64_t id);

  /// Upload file types accepted by upload()
  static bool is_accepted_type(const std::string &path);

private:
  ClipRecord lookup(int64_t id);
  ClipRecord record_result(const TransformResult &result);
  [[noreturn]] void reject_upload(const std::string &path,
                                  const std::string &reason);

  Catalog &catalog_;
  const DurationEstimator &estimator_;
  ContainerProbe &probe_;
  FrameTrimmer &trimmer_;
  ClipConcatenator &concatenator_;
  ShareTokenManager &shares_;
  UploadLimits limits_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_PIPELINE_HPP
