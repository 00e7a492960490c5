#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace sitewatch;

namespace {

int run_app(App &app, std::vector<std::string> args) {
  args.insert(args.begin(), "sitewatch");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return app.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("cli options override the config file") {
  {
    std::ofstream f("app_cfg.yaml");
    f << "database_path: from_file.db\n";
    f << "workers: 2\n";
    f << "control_port: 9000\n";
    f << "log_level: warn\n";
  }
  App app;
  int rc = run_app(app, {"--config", "app_cfg.yaml", "--database", "cli.db",
                         "--port", "9100", "--no-control"});
  REQUIRE(rc == 0);
  CHECK_FALSE(app.should_exit());
  const Config &cfg = app.config();
  CHECK(cfg.database_path() == "cli.db");
  CHECK(cfg.workers() == 2);
  CHECK(cfg.control_port() == 9100);
  CHECK_FALSE(cfg.control_enabled());
  CHECK(cfg.log_level() == "warn");
  std::remove("app_cfg.yaml");
}

TEST_CASE("verbose raises the default log level") {
  CliOptions options;
  options.verbose = true;
  Config cfg;
  App::apply_cli_overrides(options, cfg);
  CHECK(cfg.verbose());
  CHECK(cfg.log_level() == "debug");

  options.log_level = "error";
  options.log_level_explicit = true;
  App::apply_cli_overrides(options, cfg);
  CHECK(cfg.log_level() == "error");
}

TEST_CASE("unset cli options keep config values") {
  Config cfg;
  cfg.set_workers(3);
  cfg.set_max_request_rate(30);
  cfg.set_http_timeout(7);
  cfg.set_log_rotate(9);
  CliOptions options;
  App::apply_cli_overrides(options, cfg);
  CHECK(cfg.workers() == 3);
  CHECK(cfg.max_request_rate() == 30);
  CHECK(cfg.http_timeout() == 7);
  CHECK(cfg.log_rotate() == 9);
  CHECK(cfg.control_enabled());

  options.max_request_rate = 0;
  options.log_rotate = 0;
  options.log_rotate_explicit = true;
  options.log_categories["store"] = "trace";
  App::apply_cli_overrides(options, cfg);
  CHECK(cfg.max_request_rate() == 0);
  CHECK(cfg.log_rotate() == 0);
  CHECK(cfg.log_categories().at("store") == "trace");
}

TEST_CASE("invalid configuration makes run fail") {
  {
    std::ofstream f("bad_cfg.json");
    f << R"({"update_cache_size": 0})";
  }
  App app;
  CHECK(run_app(app, {"--config", "bad_cfg.json"}) == 1);
  CHECK(app.should_exit());
  std::remove("bad_cfg.json");
}

TEST_CASE("help exits without error") {
  App app;
  CHECK(run_app(app, {"--help"}) == 0);
  CHECK(app.should_exit());
}
