#include "broadcaster.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace sitewatch;
using namespace std::chrono_literals;

namespace {
UpdateEvent make_event(UpdateId id, SiteId site = 1) {
  UpdateEvent event;
  event.update_id = id;
  event.site_id = site;
  event.url = "https://example.com/" + std::to_string(site);
  event.timestamp = now_ms();
  event.content_hash = "hash";
  event.content_preview = "preview " + std::to_string(id);
  return event;
}
} // namespace

TEST_CASE("subscribers receive events published after they join") {
  Broadcaster broadcaster(8);
  auto early = broadcaster.subscribe();
  CHECK(broadcaster.publish(make_event(1)) == 1);
  auto late = broadcaster.subscribe();
  CHECK(broadcaster.publish(make_event(2)) == 2);

  auto first = early->next(100ms);
  REQUIRE(first);
  CHECK(first->update_id == 1);
  auto second = early->next(100ms);
  REQUIRE(second);
  CHECK(second->update_id == 2);

  auto only = late->next(100ms);
  REQUIRE(only);
  CHECK(only->update_id == 2);
  CHECK_FALSE(late->try_next());
}

TEST_CASE("events keep publish order per subscriber") {
  Broadcaster broadcaster(64);
  auto sub = broadcaster.subscribe();
  for (UpdateId id = 1; id <= 20; ++id) {
    broadcaster.publish(make_event(id, id % 3));
  }
  for (UpdateId id = 1; id <= 20; ++id) {
    auto event = sub->try_next();
    REQUIRE(event);
    CHECK(event->update_id == id);
  }
}

TEST_CASE("a full subscriber is dropped without affecting others") {
  Broadcaster broadcaster(2);
  auto slow = broadcaster.subscribe();
  auto fast = broadcaster.subscribe();
  for (UpdateId id = 1; id <= 5; ++id) {
    broadcaster.publish(make_event(id));
    auto event = fast->try_next();
    REQUIRE(event);
    CHECK(event->update_id == id);
  }
  CHECK(slow->closed());
  CHECK(slow->overflowed());
  CHECK_FALSE(fast->closed());
  CHECK(broadcaster.subscriber_count() == 1);
  CHECK(broadcaster.publish(make_event(6)) == 1);
}

TEST_CASE("dropping a subscription unsubscribes it") {
  Broadcaster broadcaster(4);
  {
    auto sub = broadcaster.subscribe();
    CHECK(broadcaster.subscriber_count() == 1);
  }
  CHECK(broadcaster.subscriber_count() == 0);
  CHECK(broadcaster.publish(make_event(1)) == 0);
}

TEST_CASE("next times out and wakes on close") {
  Broadcaster broadcaster(4);
  auto sub = broadcaster.subscribe();
  CHECK_FALSE(sub->next(20ms));

  std::thread closer([&] {
    std::this_thread::sleep_for(30ms);
    broadcaster.close_all();
  });
  auto start = std::chrono::steady_clock::now();
  CHECK_FALSE(sub->next(5s));
  CHECK(std::chrono::steady_clock::now() - start < 2s);
  closer.join();
  CHECK(sub->closed());
}

TEST_CASE("publishing while subscribers come and go is safe") {
  Broadcaster broadcaster(1024);
  std::atomic<bool> done{false};
  std::thread churn([&] {
    while (!done) {
      auto sub = broadcaster.subscribe();
      sub->try_next();
    }
  });
  auto steady = broadcaster.subscribe();
  for (UpdateId id = 1; id <= 500; ++id) {
    broadcaster.publish(make_event(id));
  }
  done = true;
  churn.join();
  CHECK(steady->pending() == 500);
}
