#include "log.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <spdlog/spdlog.h>

using namespace sitewatch;
using sitewatch_test::wait_until;

namespace {

std::string read_file(const char *path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("log writes filtered messages to the file") {
  const char *path = "test.log";
  std::remove(path);
  init_logger(spdlog::level::info, "", path, 0);
  spdlog::debug("debug message");
  spdlog::info("info message");
  category_logger("store")->info("category message");
  spdlog::default_logger()->flush();
  category_logger("store")->flush();
  REQUIRE(wait_until([&] {
    std::string content = read_file(path);
    return content.find("info message") != std::string::npos &&
           content.find("category message") != std::string::npos;
  }));
  std::string content = read_file(path);
  CHECK(content.find("debug message") == std::string::npos);
  CHECK(content.find("sitewatch.store") != std::string::npos);
}

TEST_CASE("category loggers are shared and named") {
  ensure_default_logger();
  auto a = category_logger("scheduler");
  auto b = category_logger("scheduler");
  CHECK(a.get() == b.get());
  CHECK(a->name() == "sitewatch.scheduler");
  CHECK(spdlog::get("sitewatch.scheduler") != nullptr);
  CHECK(spdlog::default_logger()->name() == "sitewatch");
}

TEST_CASE("category levels can be overridden") {
  ensure_default_logger();
  configure_log_categories({{"fetcher", spdlog::level::trace},
                            {"registry", spdlog::level::err}});
  CHECK(category_logger("fetcher")->level() == spdlog::level::trace);
  CHECK(category_logger("registry")->level() == spdlog::level::err);
  configure_log_categories({});
  CHECK(category_logger("fetcher")->level() == spdlog::level::trace);
}

TEST_CASE("init_logger updates the level of an existing logger") {
  init_logger(spdlog::level::warn);
  CHECK(spdlog::default_logger()->level() == spdlog::level::warn);
  init_logger(spdlog::level::info);
  CHECK(spdlog::default_logger()->level() == spdlog::level::info);
}
