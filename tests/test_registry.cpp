#include "errors.hpp"
#include "registry.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace sitewatch;
using namespace sitewatch_test;
using namespace std::chrono_literals;

namespace {

/// Registry over an idle scheduler; cycles are driven with poll_now().
struct RegistryHarness {
  explicit RegistryHarness(const std::string &path)
      : store(path, 5), fetcher(make_fake_fetcher(web)), pool(1, 0),
        scheduler(store, broadcaster, fetcher, hasher,
                  DelayPolicy(0ms, std::chrono::seconds(60)), pool),
        registry(store, scheduler, RegistryDefaults{45, PollStyle::None}) {}

  FakeWeb web;
  SiteStore store;
  Broadcaster broadcaster;
  Fetcher fetcher;
  ContentHasher hasher;
  WorkerPool pool;
  Scheduler scheduler;
  Registry registry;
};

} // namespace

TEST_CASE("site url validation") {
  CHECK(is_valid_site_url("https://example.com"));
  CHECK(is_valid_site_url("HTTP://example.com/path?q=1"));
  CHECK(is_valid_site_url("http://127.0.0.1:8080/"));
  CHECK_FALSE(is_valid_site_url("ftp://example.com"));
  CHECK_FALSE(is_valid_site_url("example.com"));
  CHECK_FALSE(is_valid_site_url("https://"));
  CHECK_FALSE(is_valid_site_url("https:///path"));
  CHECK_FALSE(is_valid_site_url("https://exa mple.com"));
  CHECK_FALSE(is_valid_site_url(""));
}

TEST_CASE("added sites take defaults and are scheduled") {
  TempPath db("registry");
  RegistryHarness h(db.str());
  Site site = h.registry.add_site({"https://a.example/", std::nullopt,
                                   std::nullopt});
  CHECK(site.id > 0);
  CHECK(site.interval_secs == 45);
  CHECK(site.style == PollStyle::None);
  CHECK(site.status == SiteStatus::Pending);
  CHECK(site.current_backoff_secs == 45);
  CHECK(h.scheduler.is_scheduled(site.id));
  CHECK(h.store.find_site(site.id));

  Site custom = h.registry.add_site(
      {"https://b.example/", 5, PollStyle::Exponential});
  CHECK(custom.interval_secs == 5);
  CHECK(custom.style == PollStyle::Exponential);
  CHECK(custom.id != site.id);

  auto sites = h.registry.list_sites();
  REQUIRE(sites.size() == 2);
  CHECK(sites[0].id < sites[1].id);
  CHECK(h.registry.size() == 2);
}

TEST_CASE("invalid site specs are rejected") {
  TempPath db("registry");
  RegistryHarness h(db.str());
  CHECK_THROWS_AS(h.registry.add_site({"not a url", 10, std::nullopt}),
                  ConfigurationError);
  CHECK_THROWS_AS(h.registry.add_site({"https://a.example/", 0, std::nullopt}),
                  ConfigurationError);
  CHECK_THROWS_AS(
      h.registry.add_site({"https://a.example/", 3001, std::nullopt}),
      ConfigurationError);
  CHECK_NOTHROW(h.registry.add_site({"https://a.example/", 1, std::nullopt}));
  CHECK_NOTHROW(
      h.registry.add_site({"https://b.example/", 3000, std::nullopt}));
  CHECK_THROWS_AS(h.registry.add_site({"https://a.example/", 10, std::nullopt}),
                  ConfigurationError);
  CHECK(h.registry.size() == 2);
  CHECK(h.store.list_sites().size() == 2);
}

TEST_CASE("removing a site stops polling and drops its updates") {
  TempPath db("registry");
  RegistryHarness h(db.str());
  h.web.set_body("https://a.example/", "<p>a</p>");
  Site site = h.registry.add_site({"https://a.example/", 5, std::nullopt});
  REQUIRE(h.scheduler.poll_now(site.id)->outcome == CycleOutcome::Changed);
  REQUIRE(h.store.list_updates(site.id).size() == 1);

  CHECK(h.registry.remove_site(site.id));
  CHECK_FALSE(h.scheduler.is_scheduled(site.id));
  CHECK_FALSE(h.registry.find_site(site.id));
  CHECK_FALSE(h.store.find_site(site.id));
  CHECK(h.store.list_updates(site.id).empty());
  CHECK_FALSE(h.scheduler.poll_now(site.id));

  CHECK_FALSE(h.registry.remove_site(site.id));
  CHECK_FALSE(h.registry.remove_site(999));

  // The URL is free again.
  CHECK_NOTHROW(h.registry.add_site({"https://a.example/", 5, std::nullopt}));
}

TEST_CASE("load restores sites with their last fingerprint") {
  TempPath db("registry");
  SiteId id = 0;
  {
    RegistryHarness h(db.str());
    h.web.set_body("https://a.example/", "<p>persisted</p>");
    id = h.registry.add_site({"https://a.example/", 5, std::nullopt}).id;
    REQUIRE(h.scheduler.poll_now(id)->outcome == CycleOutcome::Changed);
  }
  RegistryHarness h(db.str());
  h.web.set_body("https://a.example/", "<p>persisted</p>");
  CHECK(h.registry.load() == 1);
  auto site = h.registry.find_site(id);
  REQUIRE(site);
  CHECK(site->status == SiteStatus::Ok);
  CHECK(site->last_updated);
  CHECK(h.scheduler.is_scheduled(id));
  CHECK(h.scheduler.poll_now(id)->outcome == CycleOutcome::Unchanged);
  CHECK(h.store.list_updates(id).size() == 1);

  // A second load does not duplicate tasks.
  CHECK(h.registry.load() == 0);
  CHECK(h.scheduler.task_count() == 1);
}

TEST_CASE("seed skips invalid entries") {
  TempPath db("registry");
  RegistryHarness h(db.str());
  std::vector<SiteSpec> specs = {{"https://a.example/", 10, std::nullopt},
                                 {"bogus", 10, std::nullopt},
                                 {"https://a.example/", 10, std::nullopt},
                                 {"https://b.example/", std::nullopt,
                                  PollStyle::Random}};
  CHECK(h.registry.seed(specs) == 2);
  CHECK(h.registry.size() == 2);
}

TEST_CASE("reset_all clears everything and reseeds") {
  TempPath db("registry");
  RegistryHarness h(db.str());
  h.web.set_body("https://old.example/", "<p>old</p>");
  Site old = h.registry.add_site({"https://old.example/", 5, std::nullopt});
  REQUIRE(h.scheduler.poll_now(old.id));

  h.registry.reset_all({{"https://seed.example/", 30, std::nullopt}});
  CHECK_FALSE(h.scheduler.is_scheduled(old.id));
  CHECK(h.store.list_updates(old.id).empty());
  auto sites = h.registry.list_sites();
  REQUIRE(sites.size() == 1);
  CHECK(sites[0].url == "https://seed.example/");
  CHECK(h.scheduler.task_count() == 1);
  CHECK(h.store.list_sites().size() == 1);

  h.registry.reset_all();
  CHECK(h.registry.size() == 0);
  CHECK(h.store.list_sites().empty());
  CHECK(h.scheduler.task_count() == 0);
}
