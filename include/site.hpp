/**
 * @file site.hpp
 * @brief Data model of monitored sites, stored updates and live events.
 */
#ifndef SITEWATCH_SITE_HPP
#define SITEWATCH_SITE_HPP

#include "util/time.hpp"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace sitewatch {

using SiteId = std::int64_t;
using UpdateId = std::int64_t;

/// Smallest accepted polling interval in seconds.
constexpr int kMinIntervalSecs = 1;
/// Largest accepted polling interval in seconds.
constexpr int kMaxIntervalSecs = 3000;

/// Delay policy applied between two polls of a site.
enum class PollStyle { Random, Exponential, None };

/// Outcome of the most recent poll of a site.
enum class SiteStatus { Pending, Ok, Error };

/// Lowercase name of a poll style (`random`, `exponential`, `none`).
const char *to_string(PollStyle style);

/// Wire name of a status (`pending`, `ok`, `error`).
const char *to_string(SiteStatus status);

/// Parse a poll style name, ignoring case.
std::optional<PollStyle> parse_poll_style(const std::string &name);

/// Parse a status name, ignoring case.
std::optional<SiteStatus> parse_site_status(const std::string &name);

/**
 * One monitored target.
 *
 * `last_updated` is never later than `last_checked`, and `status` is
 * `Error` exactly when the latest fetch attempt failed.
 */
struct Site {
  SiteId id = 0;
  std::string url;
  int interval_secs = 60;
  PollStyle style = PollStyle::Random;
  SiteStatus status = SiteStatus::Pending;
  std::optional<Timestamp> last_checked;
  std::optional<Timestamp> last_updated;
  /// Working delay of the Exponential style; runtime only.
  int current_backoff_secs = 60;
};

/// Request to add a site; missing fields take the configured defaults.
struct SiteSpec {
  std::string url;
  std::optional<int> interval_secs;
  std::optional<PollStyle> style;
};

/// One detected content change. Never modified after creation.
struct Update {
  UpdateId id = 0;
  SiteId site_id = 0;
  Timestamp timestamp{};
  std::string content_hash;
  std::string content;
};

/// Event pushed to live subscribers when a change is recorded.
struct UpdateEvent {
  UpdateId update_id = 0;
  SiteId site_id = 0;
  std::string url;
  Timestamp timestamp{};
  std::string content_hash;
  std::string content_preview;
  bool has_full_content = true;
};

void to_json(nlohmann::json &j, const Site &site);
void to_json(nlohmann::json &j, const Update &update);
void to_json(nlohmann::json &j, const UpdateEvent &event);

} // namespace sitewatch

#endif // SITEWATCH_SITE_HPP
