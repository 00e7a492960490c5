#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars that read completely as booleans, integers or floating point
 * numbers keep that type; everything else stays a string.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (s.empty())
      return s;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
      // not an integer
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::logic_error &) {
      // not a number
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge grouped sections (`core`, `storage`, `scheduler`, ...) into the root
 * object so grouped and flat files expose the same keys.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"core", "storage", "scheduler", "http",
                                    "broadcast", "control", "logging"}) {
    merge_section(section);
  }

  return normalized;
}

/// Read a duration given either as a number of seconds or a string.
std::chrono::seconds duration_value(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return std::chrono::seconds{value.get<long long>()};
  }
  if (value.is_string()) {
    try {
      return parse_duration(value.get<std::string>());
    } catch (const std::runtime_error &e) {
      throw ConfigurationError(e.what());
    }
  }
  throw ConfigurationError("Expected a duration string or seconds");
}

PollStyle style_value(const nlohmann::json &value) {
  auto style = parse_poll_style(value.get<std::string>());
  if (!style) {
    throw ConfigurationError("Unknown poll style '" +
                             value.get<std::string>() + "'");
  }
  return *style;
}

SiteSpec site_spec_value(const nlohmann::json &value) {
  SiteSpec spec;
  if (value.is_string()) {
    spec.url = value.get<std::string>();
    return spec;
  }
  if (!value.is_object() || !value.contains("url")) {
    throw ConfigurationError("default_sites entries need a url");
  }
  spec.url = value["url"].get<std::string>();
  if (value.contains("interval_secs")) {
    spec.interval_secs = value["interval_secs"].get<int>();
  }
  if (value.contains("style")) {
    spec.style = style_value(value["style"]);
  }
  return spec;
}

} // namespace

Config::Config() : user_agents_(default_user_agents()) {}

const std::vector<std::string> &Config::default_user_agents() {
  static const std::vector<std::string> agents = {
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
      "like Gecko) Chrome/91.0.4472.124 Safari/537.36",
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 "
      "(KHTML, like Gecko) Version/14.1.1 Safari/605.1.15",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:89.0) Gecko/20100101 "
      "Firefox/89.0",
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like "
      "Gecko) Chrome/91.0.4472.124 Safari/537.36"};
  return agents;
}

void Config::set_database_path(const std::string &path) {
  std::string value = path;
  if (value.rfind("sqlite://", 0) == 0) {
    value.erase(0, 9);
  } else if (value.rfind("sqlite:", 0) == 0) {
    value.erase(0, 7);
  }
  if (value.empty()) {
    throw ConfigurationError("database_path must not be empty");
  }
  database_path_ = value;
}

void Config::set_update_cache_size(int size) {
  if (size < 1) {
    throw ConfigurationError("update_cache_size must be at least 1");
  }
  update_cache_size_ = size;
}

void Config::set_default_interval_secs(int secs) {
  if (secs < kMinIntervalSecs || secs > kMaxIntervalSecs) {
    throw ConfigurationError("default_interval_secs must be within [" +
                             std::to_string(kMinIntervalSecs) + ", " +
                             std::to_string(kMaxIntervalSecs) + "]");
  }
  default_interval_secs_ = secs;
}

void Config::set_interval_jitter_max_ms(int ms) {
  if (ms < 0) {
    throw ConfigurationError("interval_jitter_max_ms must not be negative");
  }
  interval_jitter_max_ms_ = ms;
}

void Config::set_control_port(int port) {
  if (port < 0 || port > 65535) {
    throw ConfigurationError("control_port must be within [0, 65535]");
  }
  control_port_ = port;
}

void Config::set_user_agents(std::vector<std::string> agents) {
  agents.erase(std::remove_if(agents.begin(), agents.end(),
                              [](const std::string &a) { return a.empty(); }),
               agents.end());
  if (agents.empty()) {
    user_agents_ = default_user_agents();
  } else {
    user_agents_ = std::move(agents);
  }
}

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("database_path")) {
    set_database_path(cfg["database_path"].get<std::string>());
  } else if (cfg.contains("database_url")) {
    set_database_path(cfg["database_url"].get<std::string>());
  }
  if (cfg.contains("update_cache_size")) {
    set_update_cache_size(cfg["update_cache_size"].get<int>());
  }
  if (cfg.contains("default_interval_secs")) {
    set_default_interval_secs(cfg["default_interval_secs"].get<int>());
  }
  if (cfg.contains("default_style")) {
    set_default_style(style_value(cfg["default_style"]));
  }
  if (cfg.contains("interval_jitter_max_ms")) {
    set_interval_jitter_max_ms(cfg["interval_jitter_max_ms"].get<int>());
  }
  if (cfg.contains("max_backoff")) {
    set_max_backoff(duration_value(cfg["max_backoff"]));
  }
  if (cfg.contains("workers")) {
    set_workers(cfg["workers"].get<int>());
  }
  if (cfg.contains("max_request_rate")) {
    set_max_request_rate(cfg["max_request_rate"].get<int>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(
        static_cast<int>(duration_value(cfg["http_timeout"]).count()));
  }
  if (cfg.contains("max_content_bytes")) {
    set_max_content_bytes(cfg["max_content_bytes"].get<long long>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("user_agents")) {
    set_user_agents(cfg["user_agents"].get<std::vector<std::string>>());
  }
  if (cfg.contains("normalize_content")) {
    set_normalize_content(cfg["normalize_content"].get<bool>());
  }
  if (cfg.contains("preview_length")) {
    set_preview_length(cfg["preview_length"].get<int>());
  }
  if (cfg.contains("subscriber_queue_size")) {
    set_subscriber_queue_size(cfg["subscriber_queue_size"].get<int>());
  }
  if (cfg.contains("control_enabled")) {
    set_control_enabled(cfg["control_enabled"].get<bool>());
  }
  if (cfg.contains("control_bind_address")) {
    set_control_bind_address(cfg["control_bind_address"].get<std::string>());
  }
  if (cfg.contains("control_port")) {
    set_control_port(cfg["control_port"].get<int>());
  }
  if (cfg.contains("control_max_clients")) {
    set_control_max_clients(cfg["control_max_clients"].get<int>());
  }
  if (cfg.contains("default_sites")) {
    const auto &value = cfg["default_sites"];
    if (!value.is_array()) {
      throw ConfigurationError("default_sites must be a list");
    }
    std::vector<SiteSpec> sites;
    sites.reserve(value.size());
    for (const auto &item : value) {
      sites.push_back(site_spec_value(item));
    }
    set_default_sites(std::move(sites));
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    auto assign_category = [&categories](std::string name, std::string level) {
      if (name.empty()) {
        return;
      }
      if (level.empty()) {
        level = "debug";
      }
      categories[std::move(name)] = to_lower_copy(std::move(level));
    };
    auto assign_raw = [&assign_category](const std::string &raw) {
      auto pos = raw.find('=');
      assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                      pos == std::string::npos ? std::string{"debug"}
                                               : raw.substr(pos + 1));
    };
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          assign_category(key, v.get<std::string>());
        } else if (v.is_null()) {
          assign_category(key, "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (item.is_string()) {
          assign_raw(item.get<std::string>());
        }
      }
    } else if (value.is_string()) {
      assign_raw(value.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @throws nlohmann::json::exception When value conversions fail.
 * @throws ConfigurationError When a value is out of range.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  if (j.is_null()) {
    j = nlohmann::json::object();
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {} ({} default site(s))", path,
                     cfg.default_sites().size());
  return cfg;
}

} // namespace sitewatch
