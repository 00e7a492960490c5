#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace sitewatch;
using namespace std::chrono;

TEST_CASE("timestamps are formatted as UTC with milliseconds") {
  Timestamp epoch{};
  CHECK(format_timestamp(epoch) == "1970-01-01T00:00:00.000Z");
  Timestamp later = epoch + milliseconds{1714564800123LL};
  CHECK(format_timestamp(later) == "2024-05-01T12:00:00.123Z");
  CHECK(to_unix_millis(later) == 1714564800123LL);
}

TEST_CASE("parse_timestamp reads what format_timestamp writes") {
  auto parsed = parse_timestamp("2024-05-01T12:00:00.123Z");
  REQUIRE(parsed);
  CHECK(to_unix_millis(*parsed) == 1714564800123LL);

  Timestamp now = now_ms();
  auto again = parse_timestamp(format_timestamp(now));
  REQUIRE(again);
  CHECK(*again == now);
}

TEST_CASE("parse_timestamp applies offsets and short fractions") {
  auto offset = parse_timestamp("2024-05-01T14:00:00+02:00");
  REQUIRE(offset);
  CHECK(to_unix_millis(*offset) == 1714564800000LL);

  auto fraction = parse_timestamp("2024-05-01T12:00:00.5Z");
  REQUIRE(fraction);
  CHECK(to_unix_millis(*fraction) == 1714564800500LL);
}

TEST_CASE("parse_timestamp rejects malformed input") {
  CHECK_FALSE(parse_timestamp(""));
  CHECK_FALSE(parse_timestamp("2024-05-01"));
  CHECK_FALSE(parse_timestamp("2024-13-01T00:00:00Z"));
  CHECK_FALSE(parse_timestamp("2024-05-01T12:00:00"));
  CHECK_FALSE(parse_timestamp("2024-05-01T12:00:00.Z"));
  CHECK_FALSE(parse_timestamp("yesterday"));
}
