#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 13> categories = {
      "app",     "broadcast", "cli",      "config", "control",
      "fetcher", "http",      "logging",  "main",   "pool",
      "registry", "scheduler", "store"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "scheduler=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}
} // namespace

bool env_flag_enabled(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr) {
    return false;
  }
  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return !(value.empty() || value == "0" || value == "false" ||
           value == "no" || value == "off");
}

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"sitewatch website change monitor"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "sitewatch " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  auto *log_level_option =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->default_val("info")
          ->check(CLI::IsMember(std::vector<std::string>{"trace", "debug",
                                                         "info", "warn",
                                                         "warning", "error",
                                                         "critical", "off"},
                                CLI::ignore_case))
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_function(
         "--log-compress",
         [&options](std::size_t) {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-d,--database", options.database_path,
                 "SQLite database holding sites and updates")
      ->type_name("PATH")
      ->group("Storage");
  app.add_flag("--reset-db", options.reset_db,
               "Delete every site and update before starting (also enabled "
               "by the RESET_DB environment variable)")
      ->group("Storage");

  app.add_option("-w,--workers", options.workers,
                 "Worker threads executing fetch cycles")
      ->type_name("N")
      ->check(CLI::PositiveNumber)
      ->group("Scheduling");
  app.add_option("--max-request-rate", options.max_request_rate,
                 "Global fetch starts per minute (0 = unlimited)")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Scheduling");
  app.add_option("--http-timeout", options.http_timeout,
                 "Per-fetch timeout in seconds")
      ->type_name("SECONDS")
      ->check(CLI::PositiveNumber)
      ->group("Scheduling");

  app.add_option("--bind", options.bind_address,
                 "Address of the control socket")
      ->type_name("ADDRESS")
      ->group("Control");
  auto *port_option =
      app.add_option("-p,--port", options.port, "Port of the control socket")
          ->type_name("PORT")
          ->check(CLI::Range(1, 65535))
          ->group("Control");
  app.add_flag("--no-control", options.no_control,
               "Do not open the control socket")
      ->group("Control");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  options.log_level_explicit = log_level_option->count() > 0U;
  options.port_explicit = port_option->count() > 0U;
  if (!options.reset_db && env_flag_enabled("RESET_DB")) {
    cli_log()->debug("RESET_DB is set; database will be reset");
    options.reset_db = true;
  }
  return options;
}

} // namespace sitewatch
