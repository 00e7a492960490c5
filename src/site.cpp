#include "site.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace sitewatch {

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

nlohmann::json optional_time(const std::optional<Timestamp> &tp) {
  if (!tp) {
    return nullptr;
  }
  return format_timestamp(*tp);
}

} // namespace

const char *to_string(PollStyle style) {
  switch (style) {
  case PollStyle::Random:
    return "random";
  case PollStyle::Exponential:
    return "exponential";
  case PollStyle::None:
    return "none";
  }
  return "none";
}

const char *to_string(SiteStatus status) {
  switch (status) {
  case SiteStatus::Pending:
    return "pending";
  case SiteStatus::Ok:
    return "ok";
  case SiteStatus::Error:
    return "error";
  }
  return "pending";
}

std::optional<PollStyle> parse_poll_style(const std::string &name) {
  std::string lower = to_lower_copy(name);
  if (lower == "random") {
    return PollStyle::Random;
  }
  if (lower == "exponential") {
    return PollStyle::Exponential;
  }
  if (lower == "none") {
    return PollStyle::None;
  }
  return std::nullopt;
}

std::optional<SiteStatus> parse_site_status(const std::string &name) {
  std::string lower = to_lower_copy(name);
  if (lower == "pending") {
    return SiteStatus::Pending;
  }
  if (lower == "ok") {
    return SiteStatus::Ok;
  }
  if (lower == "error") {
    return SiteStatus::Error;
  }
  return std::nullopt;
}

void to_json(nlohmann::json &j, const Site &site) {
  j = nlohmann::json{{"id", site.id},
                     {"url", site.url},
                     {"interval_secs", site.interval_secs},
                     {"style", to_string(site.style)},
                     {"status", to_string(site.status)},
                     {"last_checked", optional_time(site.last_checked)},
                     {"last_updated", optional_time(site.last_updated)},
                     {"current_backoff_secs", site.current_backoff_secs}};
}

void to_json(nlohmann::json &j, const Update &update) {
  j = nlohmann::json{{"id", update.id},
                     {"site_id", update.site_id},
                     {"timestamp", format_timestamp(update.timestamp)},
                     {"content_hash", update.content_hash},
                     {"content", update.content}};
}

void to_json(nlohmann::json &j, const UpdateEvent &event) {
  j = nlohmann::json{{"update_id", event.update_id},
                     {"site_id", event.site_id},
                     {"url", event.url},
                     {"timestamp", format_timestamp(event.timestamp)},
                     {"content_hash", event.content_hash},
                     {"content_preview", event.content_preview},
                     {"has_full_content", event.has_full_content}};
}

} // namespace sitewatch
