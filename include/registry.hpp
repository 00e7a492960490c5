/**
 * @file registry.hpp
 * @brief Authoritative set of monitored sites and their polling tasks.
 */
#ifndef SITEWATCH_REGISTRY_HPP
#define SITEWATCH_REGISTRY_HPP

#include "scheduler.hpp"
#include "site.hpp"
#include "site_state.hpp"
#include "site_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sitewatch {

/// Values applied to sites added without an interval or style.
struct RegistryDefaults {
  int interval_secs = 60;
  PollStyle style = PollStyle::Random;
};

/**
 * Owns the mapping from site id to its runtime state and keeps the store and
 * the scheduler in step with it.
 *
 * Structural changes (add, remove, reset) are serialized. remove_site()
 * returns only after the site's task has terminated.
 */
class Registry {
public:
  Registry(SiteStore &store, Scheduler &scheduler,
           RegistryDefaults defaults = {});
  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  /**
   * Load every persisted site, restore its change baseline from the newest
   * stored update and schedule it for an immediate first cycle.
   *
   * @return Number of sites loaded.
   */
  std::size_t load();

  /**
   * Validate, persist and start polling a new site.
   *
   * @throws ConfigurationError for a malformed URL, an interval outside
   *         [1,3000] or a URL that is already monitored.
   * @throws StorageError when the site cannot be persisted.
   */
  Site add_site(const SiteSpec &spec);

  /**
   * Stop polling a site and delete it with its updates. Unknown ids are
   * ignored.
   *
   * @return true when the site existed.
   */
  bool remove_site(SiteId id);

  /// Snapshots of every site ordered by id.
  std::vector<Site> list_sites() const;

  std::optional<Site> find_site(SiteId id) const;

  std::size_t size() const;

  /**
   * Add each entry, logging and skipping the ones that are rejected.
   *
   * @return Number of sites added.
   */
  std::size_t seed(const std::vector<SiteSpec> &specs);

  /// Cancel every task, wipe both tables and add @p seed_specs again.
  void reset_all(const std::vector<SiteSpec> &seed_specs = {});

  const RegistryDefaults &defaults() const { return defaults_; }

private:
  Site add_site_locked(const SiteSpec &spec);

  SiteStore &store_;
  Scheduler &scheduler_;
  RegistryDefaults defaults_;
  /// Serializes add/remove/reset against each other.
  std::mutex lifecycle_mutex_;
  mutable std::mutex map_mutex_;
  std::map<SiteId, std::shared_ptr<SiteState>> sites_;
};

/// Whether @p url is an absolute http or https URL with a host.
bool is_valid_site_url(const std::string &url);

} // namespace sitewatch

#endif // SITEWATCH_REGISTRY_HPP
