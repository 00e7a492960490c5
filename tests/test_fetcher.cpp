#include "fetcher.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <set>

using namespace sitewatch;
using namespace sitewatch_test;
using namespace std::chrono_literals;

TEST_CASE("successful fetch returns the body") {
  FakeWeb web;
  web.set_body("https://a.example/", "<html>hi</html>");
  Fetcher fetcher = make_fake_fetcher(web);
  FetchResult result = fetcher.fetch("https://a.example/", 1000ms);
  CHECK(result.success);
  REQUIRE(result.content);
  CHECK(*result.content == "<html>hi</html>");
  CHECK_FALSE(result.error);
  CHECK(result.status_code == 200);
}

TEST_CASE("status errors are reported without throwing") {
  FakeWeb web;
  web.set_body("https://a.example/", "x");
  web.set_status("https://a.example/", 500);
  Fetcher fetcher = make_fake_fetcher(web);
  FetchResult result;
  REQUIRE_NOTHROW(result = fetcher.fetch("https://a.example/", 1000ms));
  CHECK_FALSE(result.success);
  CHECK_FALSE(result.content);
  REQUIRE(result.error);
  CHECK(result.status_code == 500);
}

TEST_CASE("unreachable hosts are reported without throwing") {
  FakeWeb web;
  web.set_unreachable("https://down.example/");
  Fetcher fetcher = make_fake_fetcher(web);
  FetchResult result = fetcher.fetch("https://down.example/", 1000ms);
  CHECK_FALSE(result.success);
  CHECK(result.status_code == 0);
  REQUIRE(result.error);
  CHECK(result.error->find("connection refused") != std::string::npos);
}

TEST_CASE("each fetch is a single attempt") {
  FakeWeb web;
  web.set_status("https://a.example/", 503);
  Fetcher fetcher = make_fake_fetcher(web);
  fetcher.fetch("https://a.example/", 1000ms);
  CHECK(web.requests_for("https://a.example/") == 1);
}

TEST_CASE("abort flag cancels an in-progress fetch") {
  FakeWeb web;
  web.set_body("https://slow.example/", "late");
  web.latency = 2000ms;
  Fetcher fetcher = make_fake_fetcher(web);
  std::atomic<bool> abort{true};
  auto start = std::chrono::steady_clock::now();
  FetchResult result = fetcher.fetch("https://slow.example/", 5000ms, &abort);
  CHECK_FALSE(result.success);
  CHECK(std::chrono::steady_clock::now() - start < 1000ms);
}

TEST_CASE("user agents rotate through the configured pool") {
  FakeWeb web;
  web.set_body("https://a.example/", "x");
  std::vector<std::string> agents = {"agent-one", "agent-two", "agent-three"};
  Fetcher fetcher = make_fake_fetcher(web, agents);
  for (int i = 0; i < 60; ++i) {
    fetcher.fetch("https://a.example/", 1000ms);
  }
  std::set<std::string> seen;
  for (const auto &headers : web.sent_headers) {
    bool found = false;
    for (const auto &h : headers) {
      if (h.rfind("User-Agent: ", 0) == 0) {
        std::string agent = h.substr(12);
        CHECK(std::find(agents.begin(), agents.end(), agent) != agents.end());
        seen.insert(agent);
        found = true;
      }
    }
    CHECK(found);
  }
  CHECK(seen.size() > 1);
}

TEST_CASE("empty user agent pool falls back to the program name") {
  FakeWeb web;
  Fetcher fetcher = make_fake_fetcher(web);
  CHECK(fetcher.pick_user_agent() == "sitewatch");
}
