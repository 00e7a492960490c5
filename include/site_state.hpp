/**
 * @file site_state.hpp
 * @brief Runtime record of one monitored site.
 */
#ifndef SITEWATCH_SITE_STATE_HPP
#define SITEWATCH_SITE_STATE_HPP

#include "site.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace sitewatch {

/**
 * Mutable state of a site shared between its polling task and readers.
 *
 * Every transition updates status, timestamps and hash under one lock so a
 * snapshot never mixes two cycles.
 */
class SiteState {
public:
  explicit SiteState(Site site,
                     std::optional<std::string> last_hash = std::nullopt);

  /// Consistent copy of the site record.
  Site snapshot() const;

  SiteId id() const { return id_; }

  /// Fingerprint of the last recorded change.
  std::optional<std::string> last_hash() const;

  /// Successful fetch with an unchanged fingerprint.
  void mark_unchanged(Timestamp when);

  /// Successful fetch with a new fingerprint that was stored.
  void mark_changed(const std::string &hash, Timestamp when);

  /// Failed fetch or failed store write.
  void mark_failed(Timestamp when);

  void set_current_backoff(int secs);

private:
  const SiteId id_;
  mutable std::mutex mutex_;
  Site site_;
  std::optional<std::string> last_hash_;
};

} // namespace sitewatch

#endif // SITEWATCH_SITE_STATE_HPP
