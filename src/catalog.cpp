/**
 * @file catalog.cpp
 * @brief SQLite catalog implementation
 */

#include "clip_forge/catalog.hpp"

#include <sqlite3.h>

#include <fmt/core.h>

#include "clip_forge/error.hpp"
#include "clip_forge/logging.hpp"
#include "clip_forge/system.hpp"

namespace clip_forge {

namespace {

constexpr const char *SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS videos (
  id       INTEGER PRIMARY KEY AUTOINCREMENT,
  filename TEXT    NOT NULL,
  filepath TEXT    NOT NULL,
  size     INTEGER NOT NULL,
  duration REAL    NOT NULL
);
CREATE TABLE IF NOT EXISTS share_links (
  id               INTEGER PRIMARY KEY AUTOINCREMENT,
  video_id         INTEGER NOT NULL REFERENCES videos(id),
  token            TEXT    NOT NULL UNIQUE,
  expiry_timestamp INTEGER NOT NULL
);
)sql";

[[noreturn]] void throw_sqlite(sqlite3 *db, const std::string &what) {
  throw ClipError(ErrorKind::IOFailure,
                  fmt::format("{}: {}", what, db ? sqlite3_errmsg(db)
                                                 : "out of memory"));
}

/**
 * @class Statement
 * @brief RAII prepared statement.
 */
class Statement {
  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;

public:
  Statement(sqlite3 *db, const char *sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK)
      throw_sqlite(db_, fmt::format("prepare failed [{}]", sql));
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void bind(int idx, int64_t v) { check(sqlite3_bind_int64(stmt_, idx, v)); }
  void bind(int idx, double v) { check(sqlite3_bind_double(stmt_, idx, v)); }
  void bind(int idx, const std::string &v) {
    check(sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()),
                            SQLITE_TRANSIENT));
  }

  /// @return true if a row is available
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    throw_sqlite(db_, "step failed");
  }

  int64_t column_int64(int col) { return sqlite3_column_int64(stmt_, col); }
  double column_double(int col) { return sqlite3_column_double(stmt_, col); }
  std::string column_text(int col) {
    const unsigned char *text = sqlite3_column_text(stmt_, col);
    return text ? reinterpret_cast<const char *>(text) : "";
  }

private:
  void check(int rc) {
    if (rc != SQLITE_OK)
      throw_sqlite(db_, "bind failed");
  }
};

} // anonymous namespace

Catalog::Catalog(const std::string &db_path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("cannot open catalog {}: {}", db_path, msg));
  }

  try {
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA foreign_keys = ON;");
    exec(SCHEMA_SQL);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Catalog::~Catalog() {
  if (db_)
    sqlite3_close(db_);
}

void Catalog::exec(const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw ClipError(ErrorKind::IOFailure,
                    fmt::format("catalog statement failed: {}", msg));
  }
}

ClipRecord Catalog::insert_clip(const ClipRecord &record) {
  TIMER_START(catalog_insert);
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "INSERT INTO videos (filename, filepath, size, duration) "
                      "VALUES (?, ?, ?, ?)");
  stmt.bind(1, record.filename);
  stmt.bind(2, record.filepath);
  stmt.bind(3, static_cast<int64_t>(record.size));
  stmt.bind(4, record.duration);
  stmt.step();

  ClipRecord stored = record;
  /// Connection-local, read under the same lock as the insert
  stored.id = sqlite3_last_insert_rowid(db_);
  TIMER_END(catalog_insert);
  return stored;
}

std::optional<ClipRecord> Catalog::find_clip(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "SELECT id, filename, filepath, size, duration "
                      "FROM videos WHERE id = ?");
  stmt.bind(1, id);
  if (!stmt.step())
    return std::nullopt;

  ClipRecord r;
  r.id = stmt.column_int64(0);
  r.filename = stmt.column_text(1);
  r.filepath = stmt.column_text(2);
  r.size = static_cast<uint64_t>(stmt.column_int64(3));
  r.duration = stmt.column_double(4);
  return r;
}

void Catalog::insert_share(const ShareGrant &grant) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "INSERT INTO share_links (video_id, token, "
                      "expiry_timestamp) VALUES (?, ?, ?)");
  stmt.bind(1, grant.clip_id);
  stmt.bind(2, grant.token);
  stmt.bind(3, to_epoch_ms(grant.expiry));
  stmt.step();
}

std::optional<ShareGrant> Catalog::find_share(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "SELECT video_id, token, expiry_timestamp "
                      "FROM share_links WHERE token = ?");
  stmt.bind(1, token);
  if (!stmt.step())
    return std::nullopt;

  ShareGrant g;
  g.clip_id = stmt.column_int64(0);
  g.token = stmt.column_text(1);
  g.expiry = from_epoch_ms(stmt.column_int64(2));
  return g;
}

int64_t Catalog::clip_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT COUNT(*) FROM videos");
  stmt.step();
  return stmt.column_int64(0);
}

} // namespace clip_forge
