/**
 * @file registry.cpp
 * @brief Site registry keeping store and scheduler consistent.
 */
#include "registry.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> registry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("registry");
  }();
  return logger;
}

bool starts_with_ci(const std::string &text, const std::string &prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), text.begin(),
                    [](char a, char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

} // namespace

bool is_valid_site_url(const std::string &url) {
  std::size_t host_start = 0;
  if (starts_with_ci(url, "http://")) {
    host_start = 7;
  } else if (starts_with_ci(url, "https://")) {
    host_start = 8;
  } else {
    return false;
  }
  std::size_t host_end = url.find_first_of("/?#", host_start);
  std::string host = url.substr(host_start, host_end == std::string::npos
                                                ? std::string::npos
                                                : host_end - host_start);
  if (host.empty()) {
    return false;
  }
  return std::none_of(host.begin(), host.end(), [](unsigned char c) {
    return std::isspace(c) || std::iscntrl(c);
  });
}

Registry::Registry(SiteStore &store, Scheduler &scheduler,
                   RegistryDefaults defaults)
    : store_(store), scheduler_(scheduler), defaults_(defaults) {}

std::size_t Registry::load() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::vector<Site> sites = store_.list_sites();
  std::size_t loaded = 0;
  for (Site &site : sites) {
    auto state =
        std::make_shared<SiteState>(site, store_.latest_hash(site.id));
    {
      std::lock_guard<std::mutex> lock(map_mutex_);
      if (sites_.count(site.id) != 0) {
        continue;
      }
      sites_.emplace(site.id, state);
    }
    scheduler_.schedule(state);
    ++loaded;
  }
  registry_log()->info("Loaded {} site(s) from the store", loaded);
  return loaded;
}

Site Registry::add_site(const SiteSpec &spec) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  return add_site_locked(spec);
}

Site Registry::add_site_locked(const SiteSpec &spec) {
  if (!is_valid_site_url(spec.url)) {
    throw ConfigurationError("Invalid site URL: '" + spec.url + "'");
  }
  int interval = spec.interval_secs.value_or(defaults_.interval_secs);
  if (interval < kMinIntervalSecs || interval > kMaxIntervalSecs) {
    throw ConfigurationError(
        "Interval must be between " + std::to_string(kMinIntervalSecs) +
        " and " + std::to_string(kMaxIntervalSecs) + " seconds, got " +
        std::to_string(interval));
  }
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    for (const auto &entry : sites_) {
      if (entry.second->snapshot().url == spec.url) {
        throw ConfigurationError("Site with URL " + spec.url +
                                 " already exists");
      }
    }
  }

  Site site;
  site.url = spec.url;
  site.interval_secs = interval;
  site.current_backoff_secs = interval;
  site.style = spec.style.value_or(defaults_.style);
  site.status = SiteStatus::Pending;
  site.id = store_.upsert_site(site);

  auto state = std::make_shared<SiteState>(site);
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    sites_[site.id] = state;
  }
  scheduler_.schedule(state);
  registry_log()->info("Added site {} ({}, every {}s, {})", site.id, site.url,
                       site.interval_secs, to_string(site.style));
  return site;
}

bool Registry::remove_site(SiteId id) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  scheduler_.cancel(id);
  bool existed = false;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    existed = sites_.erase(id) > 0;
  }
  store_.delete_site(id);
  if (existed) {
    registry_log()->info("Removed site {}", id);
  } else {
    registry_log()->debug("Site {} not registered; nothing to remove", id);
  }
  return existed;
}

std::vector<Site> Registry::list_sites() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  std::vector<Site> out;
  out.reserve(sites_.size());
  for (const auto &entry : sites_) {
    out.push_back(entry.second->snapshot());
  }
  return out;
}

std::optional<Site> Registry::find_site(SiteId id) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = sites_.find(id);
  if (it == sites_.end()) {
    return std::nullopt;
  }
  return it->second->snapshot();
}

std::size_t Registry::size() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return sites_.size();
}

std::size_t Registry::seed(const std::vector<SiteSpec> &specs) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::size_t added = 0;
  for (const SiteSpec &spec : specs) {
    try {
      add_site_locked(spec);
      ++added;
    } catch (const ConfigurationError &e) {
      registry_log()->warn("Skipping default site {}: {}", spec.url,
                           e.what());
    } catch (const StorageError &e) {
      registry_log()->error("Could not store default site {}: {}", spec.url,
                            e.what());
    }
  }
  return added;
}

void Registry::reset_all(const std::vector<SiteSpec> &seed_specs) {
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    scheduler_.cancel_all();
    {
      std::lock_guard<std::mutex> lock(map_mutex_);
      sites_.clear();
    }
    store_.reset_all();
    registry_log()->warn("All sites and updates were reset");
  }
  if (!seed_specs.empty()) {
    std::size_t added = seed(seed_specs);
    registry_log()->info("Seeded {} default site(s)", added);
  }
}

} // namespace sitewatch
