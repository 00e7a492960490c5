/**
 * @file site_store.hpp
 * @brief SQLite persistence of sites and their bounded update history.
 */
#ifndef SITEWATCH_SITE_STORE_HPP
#define SITEWATCH_SITE_STORE_HPP

#include "site.hpp"
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sitewatch {

/**
 * Stores sites and their update history in two related tables.
 *
 * `sites` is keyed by id with a unique url; `updates` references its site
 * with `ON DELETE CASCADE`. Every operation runs under one connection mutex,
 * so a reader never observes a half-written record, and appends insert and
 * evict inside one transaction so the per-site cap always holds.
 *
 * All methods throw StorageError when SQLite reports a failure.
 */
class SiteStore {
public:
  /**
   * Open (or create) the database.
   *
   * @param path SQLite file path or `:memory:`.
   * @param update_cache_size Maximum updates kept per site (>= 1).
   * @throws StorageError When the database cannot be opened or migrated.
   * @throws ConfigurationError When @p update_cache_size is below 1.
   */
  SiteStore(const std::string &path, int update_cache_size);
  ~SiteStore();
  SiteStore(const SiteStore &) = delete;
  SiteStore &operator=(const SiteStore &) = delete;

  /**
   * Insert a site (`site.id == 0`) or overwrite the stored record with the
   * same id.
   *
   * @return Id of the stored site.
   * @throws ConfigurationError When another site already uses the url.
   */
  SiteId upsert_site(const Site &site);

  /// Delete a site and its updates. Unknown ids are ignored.
  void delete_site(SiteId id);

  /// All sites ordered by id.
  std::vector<Site> list_sites() const;

  /// One site by id.
  std::optional<Site> find_site(SiteId id) const;

  /// Record a fetch attempt. @return false when the site no longer exists.
  bool record_check(SiteId id, SiteStatus status, Timestamp when);

  /**
   * Record a detected change: `last_updated` and `last_checked` both become
   * @p when and the status becomes Ok.
   *
   * @return false when the site no longer exists.
   */
  bool record_change(SiteId id, Timestamp when);

  /**
   * Append an update and evict the oldest ones beyond the cache size.
   * The site is stamped as by record_change() with the update's timestamp
   * in the same transaction, so a stored update always has a matching site
   * record.
   *
   * @param site_id Owning site.
   * @param update Timestamp, hash and content of the change; its id and
   *        site_id fields are ignored.
   * @return Id of the new update.
   * @throws NotFoundError When the site does not exist.
   */
  UpdateId append_update(SiteId site_id, const Update &update);

  /// Update by id, restricted to @p site_id.
  std::optional<Update> get_update(SiteId site_id, UpdateId id) const;

  /// Newest update of @p site_id created at exactly @p when.
  std::optional<Update> get_update_at(SiteId site_id, Timestamp when) const;

  /// Stored updates of @p site_id, oldest first.
  std::vector<Update> list_updates(SiteId site_id) const;

  /// Content hash of the newest stored update of @p site_id.
  std::optional<std::string> latest_hash(SiteId site_id) const;

  /// Drop and recreate both tables.
  void reset_all();

  int update_cache_size() const { return update_cache_size_; }

private:
  void create_schema();

  sqlite3 *db_{nullptr};
  mutable std::mutex mutex_;
  int update_cache_size_;
};

} // namespace sitewatch

#endif // SITEWATCH_SITE_STORE_HPP
