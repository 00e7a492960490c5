/**
 * @file config.hpp
 * @brief Runtime configuration of the watcher.
 *
 * Configuration is read once at startup from YAML, TOML or JSON and passed
 * explicitly into the store, scheduler and registry.
 */
#ifndef SITEWATCH_CONFIG_HPP
#define SITEWATCH_CONFIG_HPP

#include "site.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace sitewatch {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  Config();

  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// SQLite database file.
  const std::string &database_path() const { return database_path_; }

  /// Set the SQLite database file; a leading `sqlite:` scheme is removed.
  void set_database_path(const std::string &path);

  /// Maximum number of stored updates per site.
  int update_cache_size() const { return update_cache_size_; }

  /// Set the per-site update cap.
  /// @throws ConfigurationError when @p size is below 1.
  void set_update_cache_size(int size);

  /// Interval assigned to sites added without one.
  int default_interval_secs() const { return default_interval_secs_; }

  /// @throws ConfigurationError when outside [1, 3000].
  void set_default_interval_secs(int secs);

  /// Style assigned to sites added without one.
  PollStyle default_style() const { return default_style_; }

  /// Set the default poll style.
  void set_default_style(PollStyle style) { default_style_ = style; }

  /// Upper bound of the Random style jitter in milliseconds.
  int interval_jitter_max_ms() const { return interval_jitter_max_ms_; }

  /// @throws ConfigurationError when negative.
  void set_interval_jitter_max_ms(int ms);

  /// Ceiling of the Exponential backoff.
  std::chrono::seconds max_backoff() const { return max_backoff_; }

  /// Set the backoff ceiling, clamped to [1 s, INT_MAX s].
  void set_max_backoff(std::chrono::seconds cap) {
    max_backoff_ = std::chrono::seconds{std::clamp<std::chrono::seconds::rep>(
        cap.count(), 1, std::numeric_limits<int>::max())};
  }

  /// Number of worker threads used for fetch cycles.
  int workers() const { return workers_; }

  /// Set worker thread count (minimum 1).
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// Maximum fetch starts per minute (0 = unlimited).
  int max_request_rate() const { return max_request_rate_; }

  /// Set maximum request rate.
  void set_max_request_rate(int rate) {
    max_request_rate_ = rate < 0 ? 0 : rate;
  }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout (minimum 1 second).
  void set_http_timeout(int t) { http_timeout_ = t < 1 ? 1 : t; }

  /// Largest accepted response body in bytes (0 = unlimited).
  long long max_content_bytes() const { return max_content_bytes_; }

  /// Set the response body ceiling.
  void set_max_content_bytes(long long bytes) {
    max_content_bytes_ = bytes < 0 ? 0 : bytes;
  }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// User-Agent strings rotated across fetches.
  const std::vector<std::string> &user_agents() const { return user_agents_; }

  /// Replace the User-Agent pool; an empty list restores the defaults.
  void set_user_agents(std::vector<std::string> agents);

  /// Whether volatile markup is stripped before fingerprinting.
  bool normalize_content() const { return normalize_content_; }

  /// Enable or disable content normalization.
  void set_normalize_content(bool enable) { normalize_content_ = enable; }

  /// Maximum length of a live preview in bytes.
  int preview_length() const { return preview_length_; }

  /// Set preview length (minimum 16 bytes).
  void set_preview_length(int len) { preview_length_ = len < 16 ? 16 : len; }

  /// Per-subscriber event buffer.
  int subscriber_queue_size() const { return subscriber_queue_size_; }

  /// Set the per-subscriber buffer (minimum 1).
  void set_subscriber_queue_size(int size) {
    subscriber_queue_size_ = size < 1 ? 1 : size;
  }

  /// Whether the control socket is started.
  bool control_enabled() const { return control_enabled_; }

  /// Enable or disable the control socket.
  void set_control_enabled(bool enable) { control_enabled_ = enable; }

  /// Address the control socket binds to.
  const std::string &control_bind_address() const {
    return control_bind_address_;
  }

  /// Set the control socket address.
  void set_control_bind_address(const std::string &address) {
    control_bind_address_ = address;
  }

  /// TCP port of the control socket.
  int control_port() const { return control_port_; }

  /// @throws ConfigurationError when outside [0, 65535].
  void set_control_port(int port);

  /// Concurrent control connections.
  int control_max_clients() const { return control_max_clients_; }

  /// Set the control connection limit (minimum 1).
  void set_control_max_clients(int n) {
    control_max_clients_ = n < 1 ? 1 : n;
  }

  /// Sites seeded into an empty database.
  const std::vector<SiteSpec> &default_sites() const { return default_sites_; }

  /// Replace the seed list.
  void set_default_sites(std::vector<SiteSpec> sites) {
    default_sites_ = std::move(sites);
  }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Set or update a single log category override.
  void set_log_category(const std::string &name, const std::string &level) {
    log_categories_[name] = level;
  }

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON object.
  void load_json(const nlohmann::json &j);

  /// User-Agent strings used when none are configured.
  static const std::vector<std::string> &default_user_agents();

private:
  bool verbose_ = false;
  std::string database_path_ = "sitewatch.db";
  int update_cache_size_ = 5;
  int default_interval_secs_ = 60;
  PollStyle default_style_ = PollStyle::Random;
  int interval_jitter_max_ms_ = 1500;
  std::chrono::seconds max_backoff_{86400};
  int workers_ = 16;
  int max_request_rate_ = 0;
  int http_timeout_ = 10;
  long long max_content_bytes_ = 10 * 1024 * 1024;
  std::string http_proxy_;
  std::string https_proxy_;
  std::vector<std::string> user_agents_;
  bool normalize_content_ = true;
  int preview_length_ = 400;
  int subscriber_queue_size_ = 64;
  bool control_enabled_ = true;
  std::string control_bind_address_ = "127.0.0.1";
  int control_port_ = 7340;
  int control_max_clients_ = 16;
  std::vector<SiteSpec> default_sites_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace sitewatch

#endif // SITEWATCH_CONFIG_HPP
