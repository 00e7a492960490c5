#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace sitewatch;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units") {
  CHECK(parse_duration("1h30m") == seconds{3600 + 30 * 60});
  CHECK(parse_duration("2d3h4m5s") ==
        seconds{2 * 86400 + 3 * 3600 + 4 * 60 + 5});
  CHECK(parse_duration("1w") == seconds{7 * 86400});
  CHECK(parse_duration("10") == seconds{10});
  CHECK(parse_duration("") == seconds{0});
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_THROWS_AS(parse_duration("1h30"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("10m5"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("abc"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("1.5h"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("5y"), std::runtime_error);
}

TEST_CASE("parse_duration_ms keeps milliseconds and honours the bare unit") {
  CHECK(parse_duration_ms("1500ms") == milliseconds{1500});
  CHECK(parse_duration_ms("1s250ms") == milliseconds{1250});
  CHECK(parse_duration_ms("750", milliseconds{1}) == milliseconds{750});
  CHECK(parse_duration_ms("2", milliseconds{1}) == milliseconds{2});
  CHECK(parse_duration("1500ms") == seconds{1});
}

TEST_CASE("format_duration renders compact strings") {
  CHECK(format_duration(milliseconds{0}) == "0s");
  CHECK(format_duration(milliseconds{250}) == "250ms");
  CHECK(format_duration(seconds{45}) == "45s");
  CHECK(format_duration(minutes{90}) == "1h30m");
  CHECK(format_duration(hours{25}) == "1d1h");
}
