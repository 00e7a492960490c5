#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace sitewatch {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

void App::apply_cli_overrides(const CliOptions &options, Config &config) {
  if (options.verbose) {
    config.set_verbose(true);
  }
  if (options.log_level_explicit) {
    config.set_log_level(options.log_level);
  } else if (options.verbose && config.log_level() == "info") {
    config.set_log_level("debug");
  }
  if (!options.log_file.empty()) {
    config.set_log_file(options.log_file);
  }
  if (options.log_rotate_explicit) {
    config.set_log_rotate(options.log_rotate);
  }
  if (options.log_compress_explicit) {
    config.set_log_compress(options.log_compress);
  }
  for (const auto &[name, level] : options.log_categories) {
    config.set_log_category(name, level);
  }
  if (!options.database_path.empty()) {
    config.set_database_path(options.database_path);
  }
  if (options.workers > 0) {
    config.set_workers(options.workers);
  }
  if (options.max_request_rate >= 0) {
    config.set_max_request_rate(options.max_request_rate);
  }
  if (options.http_timeout > 0) {
    config.set_http_timeout(options.http_timeout);
  }
  if (!options.bind_address.empty()) {
    config.set_control_bind_address(options.bind_address);
  }
  if (options.port_explicit) {
    config.set_control_port(options.port);
  }
  if (options.no_control) {
    config.set_control_enabled(false);
  }
}

/**
 * Execute the start-up flow.
 *
 * Configuration errors are reported on the default logger and turn into a
 * non-zero return value.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    config_ = options_.config_file.empty()
                  ? Config()
                  : Config::from_file(options_.config_file);
    apply_cli_overrides(options_, config_);
  } catch (const std::exception &e) {
    app_log()->error("Invalid configuration: {}", e.what());
    should_exit_ = true;
    return 1;
  }

  spdlog::level::level_enum lvl = spdlog::level::from_str(config_.log_level());
  if (lvl == spdlog::level::off && config_.log_level() != "off") {
    app_log()->warn("Unknown log level '{}'; using info", config_.log_level());
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    auto level = spdlog::level::from_str(level_str);
    if (level == spdlog::level::off && level_str != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
  if (config_.verbose()) {
    app_log()->debug("Verbose mode enabled");
  }
  if (!options_.config_file.empty()) {
    app_log()->info("Loaded configuration from {}", options_.config_file);
  }
  return 0;
}

} // namespace sitewatch
