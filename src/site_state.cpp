#include "site_state.hpp"

namespace sitewatch {

SiteState::SiteState(Site site, std::optional<std::string> last_hash)
    : id_(site.id), site_(std::move(site)), last_hash_(std::move(last_hash)) {}

Site SiteState::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return site_;
}

std::optional<std::string> SiteState::last_hash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_hash_;
}

void SiteState::mark_unchanged(Timestamp when) {
  std::lock_guard<std::mutex> lock(mutex_);
  site_.status = SiteStatus::Ok;
  site_.last_checked = when;
}

void SiteState::mark_changed(const std::string &hash, Timestamp when) {
  std::lock_guard<std::mutex> lock(mutex_);
  site_.status = SiteStatus::Ok;
  site_.last_checked = when;
  site_.last_updated = when;
  last_hash_ = hash;
}

void SiteState::mark_failed(Timestamp when) {
  std::lock_guard<std::mutex> lock(mutex_);
  site_.status = SiteStatus::Error;
  site_.last_checked = when;
}

void SiteState::set_current_backoff(int secs) {
  std::lock_guard<std::mutex> lock(mutex_);
  site_.current_backoff_secs = secs;
}

} // namespace sitewatch
