#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace sitewatch;

namespace {

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "sitewatch");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}

} // namespace

TEST_CASE("cli defaults", "[cli]") {
  unsetenv("RESET_DB");
  CliOptions opts = parse({});
  CHECK_FALSE(opts.verbose);
  CHECK(opts.config_file.empty());
  CHECK(opts.log_level == "info");
  CHECK_FALSE(opts.log_level_explicit);
  CHECK(opts.log_rotate == 3);
  CHECK_FALSE(opts.log_rotate_explicit);
  CHECK_FALSE(opts.log_compress_explicit);
  CHECK(opts.database_path.empty());
  CHECK_FALSE(opts.reset_db);
  CHECK(opts.workers == 0);
  CHECK(opts.max_request_rate == -1);
  CHECK(opts.http_timeout == 0);
  CHECK_FALSE(opts.port_explicit);
  CHECK_FALSE(opts.no_control);
}

TEST_CASE("cli general and logging options", "[cli]") {
  {
    std::ofstream f("cli_cfg.yaml");
    f << "verbose: true\n";
  }
  CliOptions opts =
      parse({"-v", "--config", "cli_cfg.yaml", "--log-level", "DEBUG",
             "--log-file", "watch.log", "--log-rotate", "0", "--log-compress",
             "--log-category", "scheduler=trace", "--log-category", "fetcher"});
  CHECK(opts.verbose);
  CHECK(opts.config_file == "cli_cfg.yaml");
  CHECK(opts.log_level_explicit);
  CHECK(opts.log_file == "watch.log");
  CHECK(opts.log_rotate == 0);
  CHECK(opts.log_rotate_explicit);
  CHECK(opts.log_compress);
  CHECK(opts.log_compress_explicit);
  CHECK(opts.log_categories.at("scheduler") == "trace");
  CHECK(opts.log_categories.at("fetcher") == "debug");
  std::remove("cli_cfg.yaml");
}

TEST_CASE("cli storage, scheduling and control options", "[cli]") {
  unsetenv("RESET_DB");
  CliOptions opts = parse({"--database", "sites.db", "--reset-db", "-w", "8",
                           "--max-request-rate", "120", "--http-timeout",
                           "5", "--bind", "0.0.0.0", "-p", "9100",
                           "--no-control"});
  CHECK(opts.database_path == "sites.db");
  CHECK(opts.reset_db);
  CHECK(opts.workers == 8);
  CHECK(opts.max_request_rate == 120);
  CHECK(opts.http_timeout == 5);
  CHECK(opts.bind_address == "0.0.0.0");
  CHECK(opts.port == 9100);
  CHECK(opts.port_explicit);
  CHECK(opts.no_control);
}

TEST_CASE("cli rejects invalid values", "[cli]") {
  CHECK(exit_code_of({"--log-level", "loud"}) != 0);
  CHECK(exit_code_of({"--config", "missing-file.yaml"}) != 0);
  CHECK(exit_code_of({"--workers", "0"}) != 0);
  CHECK(exit_code_of({"--port", "70000"}) != 0);
  CHECK(exit_code_of({"--log-rotate", "-1"}) != 0);
  CHECK(exit_code_of({"--log-category", "=debug"}) != 0);
  CHECK(exit_code_of({"--unknown-flag"}) != 0);
}

TEST_CASE("cli help and version exit cleanly", "[cli]") {
  CHECK(exit_code_of({"--help"}) == 0);
  CHECK(exit_code_of({"--version"}) == 0);
}

TEST_CASE("RESET_DB environment variable", "[cli]") {
  setenv("RESET_DB", "1", 1);
  CHECK(env_flag_enabled("RESET_DB"));
  CHECK(parse({}).reset_db);

  for (const char *off : {"", "0", "false", "no", "off"}) {
    setenv("RESET_DB", off, 1);
    CHECK_FALSE(env_flag_enabled("RESET_DB"));
  }
  setenv("RESET_DB", "yes", 1);
  CHECK(env_flag_enabled("RESET_DB"));
  unsetenv("RESET_DB");
  CHECK_FALSE(env_flag_enabled("RESET_DB"));
  CHECK_FALSE(parse({}).reset_db);
}
