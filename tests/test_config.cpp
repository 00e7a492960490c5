#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

using namespace sitewatch;

TEST_CASE("config defaults") {
  Config cfg;
  CHECK_FALSE(cfg.verbose());
  CHECK(cfg.database_path() == "sitewatch.db");
  CHECK(cfg.update_cache_size() == 5);
  CHECK(cfg.default_interval_secs() == 60);
  CHECK(cfg.default_style() == PollStyle::Random);
  CHECK(cfg.interval_jitter_max_ms() == 1500);
  CHECK(cfg.workers() == 16);
  CHECK(cfg.max_request_rate() == 0);
  CHECK(cfg.http_timeout() == 10);
  CHECK(cfg.normalize_content());
  CHECK(cfg.preview_length() == 400);
  CHECK(cfg.control_enabled());
  CHECK(cfg.control_bind_address() == "127.0.0.1");
  CHECK(cfg.control_port() == 7340);
  CHECK(cfg.user_agents() == Config::default_user_agents());
  CHECK_FALSE(cfg.user_agents().empty());
  CHECK(cfg.default_sites().empty());
  CHECK(cfg.log_level() == "info");
}

TEST_CASE("yaml config with grouped sections") {
  {
    std::ofstream f("cfg.yaml");
    f << "core:\n";
    f << "  verbose: true\n";
    f << "storage:\n";
    f << "  database_url: sqlite:///tmp/watch.db\n";
    f << "  update_cache_size: 8\n";
    f << "scheduler:\n";
    f << "  default_interval_secs: 120\n";
    f << "  default_style: exponential\n";
    f << "  interval_jitter_max_ms: 250\n";
    f << "  max_backoff: 2h\n";
    f << "  workers: 4\n";
    f << "  max_request_rate: 90\n";
    f << "http:\n";
    f << "  http_timeout: 15\n";
    f << "  max_content_bytes: 1048576\n";
    f << "  http_proxy: http://proxy:8080\n";
    f << "  user_agents:\n";
    f << "    - agent-a\n";
    f << "    - agent-b\n";
    f << "  normalize_content: false\n";
    f << "broadcast:\n";
    f << "  preview_length: 200\n";
    f << "  subscriber_queue_size: 32\n";
    f << "control:\n";
    f << "  control_enabled: false\n";
    f << "  control_bind_address: 0.0.0.0\n";
    f << "  control_port: 9000\n";
    f << "  control_max_clients: 4\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_rotate: 5\n";
    f << "  log_compress: true\n";
    f << "  log_categories:\n";
    f << "    scheduler: trace\n";
    f << "    fetcher: WARN\n";
    f << "default_sites:\n";
    f << "  - https://a.example/\n";
    f << "  - url: https://b.example/\n";
    f << "    interval_secs: 30\n";
    f << "    style: none\n";
  }
  Config cfg = Config::from_file("cfg.yaml");
  CHECK(cfg.verbose());
  CHECK(cfg.database_path() == "/tmp/watch.db");
  CHECK(cfg.update_cache_size() == 8);
  CHECK(cfg.default_interval_secs() == 120);
  CHECK(cfg.default_style() == PollStyle::Exponential);
  CHECK(cfg.interval_jitter_max_ms() == 250);
  CHECK(cfg.max_backoff() == std::chrono::hours(2));
  CHECK(cfg.workers() == 4);
  CHECK(cfg.max_request_rate() == 90);
  CHECK(cfg.http_timeout() == 15);
  CHECK(cfg.max_content_bytes() == 1048576);
  CHECK(cfg.http_proxy() == "http://proxy:8080");
  CHECK(cfg.user_agents() == std::vector<std::string>{"agent-a", "agent-b"});
  CHECK_FALSE(cfg.normalize_content());
  CHECK(cfg.preview_length() == 200);
  CHECK(cfg.subscriber_queue_size() == 32);
  CHECK_FALSE(cfg.control_enabled());
  CHECK(cfg.control_bind_address() == "0.0.0.0");
  CHECK(cfg.control_port() == 9000);
  CHECK(cfg.control_max_clients() == 4);
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_rotate() == 5);
  CHECK(cfg.log_compress());
  CHECK(cfg.log_categories().at("scheduler") == "trace");
  CHECK(cfg.log_categories().at("fetcher") == "warn");
  REQUIRE(cfg.default_sites().size() == 2);
  CHECK(cfg.default_sites()[0].url == "https://a.example/");
  CHECK_FALSE(cfg.default_sites()[0].interval_secs);
  CHECK(cfg.default_sites()[1].interval_secs == 30);
  CHECK(cfg.default_sites()[1].style == PollStyle::None);
  std::remove("cfg.yaml");
}

TEST_CASE("toml config") {
  {
    std::ofstream f("cfg.toml");
    f << "database_path = \"watch.db\"\n";
    f << "update_cache_size = 3\n";
    f << "max_backoff = 600\n";
    f << "default_sites = [\"https://a.example/\"]\n";
    f << "[logging]\n";
    f << "log_level = \"warn\"\n";
    f << "log_categories = [\"control=debug\", \"registry\"]\n";
  }
  Config cfg = Config::from_file("cfg.toml");
  CHECK(cfg.database_path() == "watch.db");
  CHECK(cfg.update_cache_size() == 3);
  CHECK(cfg.max_backoff() == std::chrono::seconds(600));
  REQUIRE(cfg.default_sites().size() == 1);
  CHECK(cfg.log_level() == "warn");
  CHECK(cfg.log_categories().at("control") == "debug");
  CHECK(cfg.log_categories().at("registry") == "debug");
  std::remove("cfg.toml");
}

TEST_CASE("json config") {
  {
    std::ofstream f("cfg.json");
    f << R"({"workers": 0, "max_request_rate": -5, "http_timeout": "30s",)"
      << R"( "preview_length": 4, "user_agents": []})";
  }
  Config cfg = Config::from_file("cfg.json");
  CHECK(cfg.workers() == 1);
  CHECK(cfg.max_request_rate() == 0);
  CHECK(cfg.http_timeout() == 30);
  CHECK(cfg.preview_length() == 16);
  CHECK(cfg.user_agents() == Config::default_user_agents());
  std::remove("cfg.json");
}

TEST_CASE("empty yaml file yields defaults") {
  { std::ofstream f("empty.yaml"); }
  Config cfg = Config::from_file("empty.yaml");
  CHECK(cfg.update_cache_size() == 5);
  std::remove("empty.yaml");
}

TEST_CASE("out of range values are rejected") {
  CHECK_THROWS_AS(Config::from_json({{"update_cache_size", 0}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"default_interval_secs", 0}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"default_interval_secs", 3001}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"default_style", "linear"}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"control_port", 70000}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"interval_jitter_max_ms", -1}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"max_backoff", "soon"}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"database_path", "sqlite:"}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"default_sites", "https://a/"}}),
                  ConfigurationError);
  CHECK_THROWS_AS(Config::from_json({{"default_sites", {{{"interval_secs", 5}}}}}),
                  ConfigurationError);
}

TEST_CASE("backoff ceiling is clamped to what a backoff can hold") {
  Config cfg = Config::from_json({{"max_backoff", "100000d"}});
  CHECK(cfg.max_backoff().count() == std::numeric_limits<int>::max());
  cfg.set_max_backoff(std::chrono::seconds{0});
  CHECK(cfg.max_backoff() == std::chrono::seconds{1});
}

TEST_CASE("unsupported config files are rejected") {
  CHECK_THROWS(Config::from_file("config"));
  CHECK_THROWS(Config::from_file("config.ini"));
  CHECK_THROWS(Config::from_file("does-not-exist.json"));
}
