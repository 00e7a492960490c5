/**
 * @file site_store.cpp
 * @brief SQLite implementation of the site and update store.
 */
#include "site_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "sqlite_util.hpp"

#include <memory>
#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("store");
  }();
  return logger;
}

constexpr const char *kSchema =
    "CREATE TABLE IF NOT EXISTS sites("
    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "url TEXT NOT NULL UNIQUE,"
    "interval_secs INTEGER NOT NULL,"
    "style TEXT NOT NULL,"
    "status TEXT NOT NULL DEFAULT 'pending',"
    "last_checked TEXT,"
    "last_updated TEXT);"
    "CREATE TABLE IF NOT EXISTS updates("
    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "site_id INTEGER NOT NULL REFERENCES sites(id) ON DELETE CASCADE,"
    "timestamp TEXT NOT NULL,"
    "content_hash TEXT NOT NULL,"
    "content TEXT NOT NULL);"
    "CREATE INDEX IF NOT EXISTS idx_updates_site ON updates(site_id, id);";

constexpr const char *kSiteColumns =
    "id, url, interval_secs, style, status, last_checked, last_updated";

constexpr const char *kUpdateColumns =
    "id, site_id, timestamp, content_hash, content";

std::optional<std::string> optional_time(const std::optional<Timestamp> &tp) {
  if (!tp) {
    return std::nullopt;
  }
  return format_timestamp(*tp);
}

std::optional<Timestamp> read_time(const Statement &stmt, int column) {
  if (stmt.column_is_null(column)) {
    return std::nullopt;
  }
  auto parsed = parse_timestamp(stmt.column_text(column));
  if (!parsed) {
    store_log()->warn("Ignoring malformed timestamp '{}'",
                      stmt.column_text(column));
  }
  return parsed;
}

Site read_site(const Statement &stmt) {
  Site site;
  site.id = stmt.column_int64(0);
  site.url = stmt.column_text(1);
  site.interval_secs = static_cast<int>(stmt.column_int64(2));
  site.style = parse_poll_style(stmt.column_text(3)).value_or(PollStyle::None);
  site.status =
      parse_site_status(stmt.column_text(4)).value_or(SiteStatus::Pending);
  site.last_checked = read_time(stmt, 5);
  site.last_updated = read_time(stmt, 6);
  site.current_backoff_secs = site.interval_secs;
  return site;
}

Update read_update(const Statement &stmt) {
  Update update;
  update.id = stmt.column_int64(0);
  update.site_id = stmt.column_int64(1);
  update.timestamp = read_time(stmt, 2).value_or(Timestamp{});
  update.content_hash = stmt.column_text(3);
  update.content = stmt.column_text(4);
  return update;
}

} // namespace

SiteStore::SiteStore(const std::string &path, int update_cache_size)
    : update_cache_size_(update_cache_size) {
  if (update_cache_size_ < 1) {
    throw ConfigurationError("update_cache_size must be at least 1");
  }
  store_log()->debug("Opening database {}", path);
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(rc, "Failed to open database " + path + ": " + msg);
  }
  try {
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);
    exec_sql(db_, "PRAGMA foreign_keys = ON;");
    create_schema();
  } catch (const StorageError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  store_log()->info("Database {} ready (update cache size {})", path,
                    update_cache_size_);
}

SiteStore::~SiteStore() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SiteStore::create_schema() { exec_sql(db_, kSchema); }

SiteId SiteStore::upsert_site(const Site &site) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    if (site.id == 0) {
      Statement stmt(db_, "INSERT INTO sites(url, interval_secs, style, "
                          "status, last_checked, last_updated) "
                          "VALUES(?, ?, ?, ?, ?, ?)");
      stmt.bind(1, site.url);
      stmt.bind(2, static_cast<std::int64_t>(site.interval_secs));
      stmt.bind(3, std::string(to_string(site.style)));
      stmt.bind(4, std::string(to_string(site.status)));
      stmt.bind(5, optional_time(site.last_checked));
      stmt.bind(6, optional_time(site.last_updated));
      stmt.step();
      SiteId id = sqlite3_last_insert_rowid(db_);
      store_log()->debug("Inserted site {} ({})", id, site.url);
      return id;
    }
    Statement stmt(db_, "INSERT INTO sites(id, url, interval_secs, style, "
                        "status, last_checked, last_updated) "
                        "VALUES(?, ?, ?, ?, ?, ?, ?) "
                        "ON CONFLICT(id) DO UPDATE SET url=excluded.url, "
                        "interval_secs=excluded.interval_secs, "
                        "style=excluded.style, status=excluded.status, "
                        "last_checked=excluded.last_checked, "
                        "last_updated=excluded.last_updated");
    stmt.bind(1, static_cast<std::int64_t>(site.id));
    stmt.bind(2, site.url);
    stmt.bind(3, static_cast<std::int64_t>(site.interval_secs));
    stmt.bind(4, std::string(to_string(site.style)));
    stmt.bind(5, std::string(to_string(site.status)));
    stmt.bind(6, optional_time(site.last_checked));
    stmt.bind(7, optional_time(site.last_updated));
    stmt.step();
    return site.id;
  } catch (const StorageError &e) {
    if (e.code() == SQLITE_CONSTRAINT_UNIQUE) {
      throw ConfigurationError("Site with URL " + site.url +
                               " already exists");
    }
    throw;
  }
}

void SiteStore::delete_site(SiteId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  Statement updates(db_, "DELETE FROM updates WHERE site_id = ?");
  updates.bind(1, static_cast<std::int64_t>(id));
  updates.step();
  Statement sites(db_, "DELETE FROM sites WHERE id = ?");
  sites.bind(1, static_cast<std::int64_t>(id));
  sites.step();
  int removed = sqlite3_changes(db_);
  tx.commit();
  if (removed > 0) {
    store_log()->debug("Deleted site {}", id);
  }
}

std::vector<Site> SiteStore::list_sites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql =
      std::string("SELECT ") + kSiteColumns + " FROM sites ORDER BY id";
  Statement stmt(db_, sql.c_str());
  std::vector<Site> sites;
  while (stmt.step()) {
    sites.push_back(read_site(stmt));
  }
  return sites;
}

std::optional<Site> SiteStore::find_site(SiteId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql =
      std::string("SELECT ") + kSiteColumns + " FROM sites WHERE id = ?";
  Statement stmt(db_, sql.c_str());
  stmt.bind(1, static_cast<std::int64_t>(id));
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_site(stmt);
}

bool SiteStore::record_check(SiteId id, SiteStatus status, Timestamp when) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_,
                 "UPDATE sites SET status = ?, last_checked = ? WHERE id = ?");
  stmt.bind(1, std::string(to_string(status)));
  stmt.bind(2, format_timestamp(when));
  stmt.bind(3, static_cast<std::int64_t>(id));
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

bool SiteStore::record_change(SiteId id, Timestamp when) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "UPDATE sites SET status = 'ok', last_checked = ?, "
                      "last_updated = ? WHERE id = ?");
  const std::string ts = format_timestamp(when);
  stmt.bind(1, ts);
  stmt.bind(2, ts);
  stmt.bind(3, static_cast<std::int64_t>(id));
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

UpdateId SiteStore::append_update(SiteId site_id, const Update &update) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  {
    Statement exists(db_, "SELECT 1 FROM sites WHERE id = ?");
    exists.bind(1, static_cast<std::int64_t>(site_id));
    if (!exists.step()) {
      throw NotFoundError("Site " + std::to_string(site_id) +
                          " does not exist");
    }
  }
  Statement insert(db_, "INSERT INTO updates(site_id, timestamp, "
                        "content_hash, content) VALUES(?, ?, ?, ?)");
  insert.bind(1, static_cast<std::int64_t>(site_id));
  insert.bind(2, format_timestamp(update.timestamp));
  insert.bind(3, update.content_hash);
  insert.bind(4, update.content);
  insert.step();
  UpdateId id = sqlite3_last_insert_rowid(db_);

  Statement stamp(db_, "UPDATE sites SET status = 'ok', last_checked = ?, "
                       "last_updated = ? WHERE id = ?");
  const std::string ts = format_timestamp(update.timestamp);
  stamp.bind(1, ts);
  stamp.bind(2, ts);
  stamp.bind(3, static_cast<std::int64_t>(site_id));
  stamp.step();

  Statement evict(db_, "DELETE FROM updates WHERE site_id = ?1 AND id NOT IN "
                       "(SELECT id FROM updates WHERE site_id = ?1 "
                       "ORDER BY id DESC LIMIT ?2)");
  evict.bind(1, static_cast<std::int64_t>(site_id));
  evict.bind(2, static_cast<std::int64_t>(update_cache_size_));
  evict.step();
  int evicted = sqlite3_changes(db_);
  tx.commit();
  if (evicted > 0) {
    store_log()->debug("Site {}: evicted {} old update(s)", site_id, evicted);
  }
  return id;
}

std::optional<Update> SiteStore::get_update(SiteId site_id,
                                            UpdateId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = std::string("SELECT ") + kUpdateColumns +
                    " FROM updates WHERE site_id = ? AND id = ?";
  Statement stmt(db_, sql.c_str());
  stmt.bind(1, static_cast<std::int64_t>(site_id));
  stmt.bind(2, static_cast<std::int64_t>(id));
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_update(stmt);
}

std::optional<Update> SiteStore::get_update_at(SiteId site_id,
                                               Timestamp when) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = std::string("SELECT ") + kUpdateColumns +
                    " FROM updates WHERE site_id = ? AND timestamp = ? "
                    "ORDER BY id DESC LIMIT 1";
  Statement stmt(db_, sql.c_str());
  stmt.bind(1, static_cast<std::int64_t>(site_id));
  stmt.bind(2, format_timestamp(when));
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_update(stmt);
}

std::vector<Update> SiteStore::list_updates(SiteId site_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = std::string("SELECT ") + kUpdateColumns +
                    " FROM updates WHERE site_id = ? ORDER BY id";
  Statement stmt(db_, sql.c_str());
  stmt.bind(1, static_cast<std::int64_t>(site_id));
  std::vector<Update> updates;
  while (stmt.step()) {
    updates.push_back(read_update(stmt));
  }
  return updates;
}

std::optional<std::string> SiteStore::latest_hash(SiteId site_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT content_hash FROM updates WHERE site_id = ? "
                      "ORDER BY id DESC LIMIT 1");
  stmt.bind(1, static_cast<std::int64_t>(site_id));
  if (!stmt.step()) {
    return std::nullopt;
  }
  return stmt.column_text(0);
}

void SiteStore::reset_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  store_log()->warn("Resetting database: dropping sites and updates");
  Transaction tx(db_);
  exec_sql(db_, "DROP TABLE IF EXISTS updates; DROP TABLE IF EXISTS sites;");
  create_schema();
  tx.commit();
}

} // namespace sitewatch
