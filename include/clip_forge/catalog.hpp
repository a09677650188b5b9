/**
 * @file catalog.hpp
 * @brief SQLite-backed catalog of clips and share links
 *
 * @details Two tables:
 *
 *          - videos (id, filename, filepath, size, duration)
 *
 *          - share_links (video_id, token, expiry_timestamp)
 *
 *          The engine only needs point lookups and single-row inserts. Each
 *          insert is one statement, so a reader sees a complete row or none.
 */

#ifndef CLIP_FORGE_CATALOG_HPP
#define CLIP_FORGE_CATALOG_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "types.hpp"

struct sqlite3;

namespace clip_forge {

/**
 * @class Catalog
 * @brief Owns one SQLite connection; all methods are thread-safe.
 * @note Pass ":memory:" for a private in-memory catalog.
 */
class Catalog {
public:
  /**
   * @brief Open (creating if needed) the catalog at `db_path`.
   * @throws ClipError IOFailure if SQLite cannot open or initialise it
   */
  explicit Catalog(const std::string &db_path);
  ~Catalog();

  Catalog(const Catalog &) = delete;
  Catalog &operator=(const Catalog &) = delete;

  /**
   * @brief Insert a clip row. `record.id` is ignored.
   * @return The row as stored, with its assigned id
   */
  ClipRecord insert_clip(const ClipRecord &record);

  std::optional<ClipRecord> find_clip(int64_t id);

  /// Persist an issued share token
  void insert_share(const ShareGrant &grant);

  std::optional<ShareGrant> find_share(const std::string &token);

  /// Number of clip rows
  int64_t clip_count();

private:
  void exec(const char *sql);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace clip_forge

#endif // CLIP_FORGE_CATALOG_HPP
