/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for sitewatch.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the service.
 */

#ifndef SITEWATCH_CLI_HPP
#define SITEWATCH_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>

namespace sitewatch {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code requested by the parser.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Fields flagged `_explicit` record whether the value came from the command
 * line so it can override the configuration file.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  bool log_level_explicit{false}; ///< True if CLI set the log level
  std::string log_file;           ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress{false};          ///< Compress rotated log files
  bool log_compress_explicit{false}; ///< True if CLI toggled log compression
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  std::string database_path; ///< SQLite database (empty = config value)
  bool reset_db{false};      ///< Wipe sites and updates before loading
  int workers{0};            ///< Worker threads (0 = config value)
  int max_request_rate{-1};  ///< Fetch starts per minute (-1 = config value)
  int http_timeout{0};       ///< Per-fetch timeout in seconds (0 = config)
  std::string bind_address;  ///< Control socket address (empty = config)
  int port{0};               ///< Control socket port
  bool port_explicit{false}; ///< True if CLI set the control port
  bool no_control{false};    ///< Disable the control socket
};

/**
 * Parse command line arguments.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Parsed options.
 * @throws CliParseExit when help or version output was requested or the
 *         arguments were invalid.
 */
CliOptions parse_cli(int argc, char **argv);

/// Whether an environment flag such as `RESET_DB` is set to a true value.
bool env_flag_enabled(const char *name);

} // namespace sitewatch

#endif // SITEWATCH_CLI_HPP
