/**
 * @file app.hpp
 * @brief Command line and configuration front end of sitewatch.
 *
 * Declares the App class, which parses the command line, loads the
 * configuration file and initializes logging before the service starts.
 */

#ifndef SITEWATCH_APP_HPP
#define SITEWATCH_APP_HPP

#include "cli.hpp"
#include "config.hpp"

namespace sitewatch {

/**
 * Resolves the effective configuration from the CLI and the config file.
 */
class App {
public:
  /**
   * Parse @p argv, load the configuration and initialize logging.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration with command line overrides applied.
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes (help, version or an error).
   */
  bool should_exit() const { return should_exit_; }

  /// Apply command line overrides from @p options onto @p config.
  static void apply_cli_overrides(const CliOptions &options, Config &config);

private:
  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace sitewatch

#endif // SITEWATCH_APP_HPP
