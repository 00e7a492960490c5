#include "delay_policy.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <limits>

using namespace sitewatch;
using namespace std::chrono;

TEST_CASE("none style always waits the interval") {
  DelayPolicy policy(milliseconds{1500}, hours{24});
  for (int interval : {1, 5, 3000}) {
    int backoff = interval;
    CHECK(policy.next_delay(PollStyle::None, interval, true, backoff) ==
          seconds{interval});
    CHECK(policy.next_delay(PollStyle::None, interval, false, backoff) ==
          seconds{interval});
    CHECK(policy.next_delay(PollStyle::None, interval, false, backoff) ==
          seconds{interval});
  }
}

TEST_CASE("random style adds bounded jitter") {
  DelayPolicy policy(milliseconds{1500}, hours{24});
  int backoff = 5;
  for (int i = 0; i < 500; ++i) {
    auto delay =
        policy.next_delay(PollStyle::Random, 5, i % 2 == 0, backoff);
    CHECK(delay >= milliseconds{5000});
    CHECK(delay <= milliseconds{6500});
  }
}

TEST_CASE("random jitter is clamped to the configured maximum") {
  DelayPolicy high(milliseconds{1500}, hours{24},
                   [](milliseconds) { return milliseconds{99999}; });
  DelayPolicy low(milliseconds{1500}, hours{24},
                  [](milliseconds) { return milliseconds{-5}; });
  int backoff = 5;
  CHECK(high.next_delay(PollStyle::Random, 5, true, backoff) ==
        milliseconds{6500});
  CHECK(low.next_delay(PollStyle::Random, 5, true, backoff) ==
        milliseconds{5000});

  DelayPolicy none(milliseconds{0}, hours{24});
  CHECK(none.next_delay(PollStyle::Random, 5, true, backoff) == seconds{5});
}

TEST_CASE("exponential style doubles on failure and resets on success") {
  DelayPolicy policy(milliseconds{1500}, hours{24});
  int backoff = 5;
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{10});
  CHECK(backoff == 10);
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{20});
  CHECK(policy.next_delay(PollStyle::Exponential, 5, true, backoff) ==
        seconds{5});
  CHECK(backoff == 5);
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{10});
}

TEST_CASE("exponential backoff stops at the ceiling") {
  DelayPolicy policy(milliseconds{0}, seconds{30});
  int backoff = 5;
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{10});
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{20});
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{30});
  CHECK(policy.next_delay(PollStyle::Exponential, 5, false, backoff) ==
        seconds{30});

  DelayPolicy tight(milliseconds{0}, seconds{1});
  int slow = 60;
  CHECK(tight.next_delay(PollStyle::Exponential, 60, false, slow) ==
        seconds{60});
}

TEST_CASE("exponential backoff saturates under a huge ceiling") {
  DelayPolicy policy(milliseconds{0}, hours{24 * 100000});
  CHECK(policy.max_backoff().count() == std::numeric_limits<int>::max());
  int backoff = 3000;
  seconds previous{3000};
  for (int i = 0; i < 40; ++i) {
    seconds delay = std::chrono::duration_cast<seconds>(
        policy.next_delay(PollStyle::Exponential, 3000, false, backoff));
    CHECK(delay >= previous);
    CHECK(backoff > 0);
    previous = delay;
  }
  CHECK(backoff == std::numeric_limits<int>::max());
  CHECK(previous.count() == std::numeric_limits<int>::max());
}
