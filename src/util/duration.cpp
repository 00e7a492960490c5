#include "util/duration.hpp"

#include <cctype>
#include <stdexcept>

namespace sitewatch {

namespace {

long long unit_millis(const std::string &unit) {
  if (unit == "ms") {
    return 1;
  }
  if (unit == "s") {
    return 1000;
  }
  if (unit == "m") {
    return 60LL * 1000;
  }
  if (unit == "h") {
    return 3600LL * 1000;
  }
  if (unit == "d") {
    return 86400LL * 1000;
  }
  if (unit == "w") {
    return 604800LL * 1000;
  }
  throw std::runtime_error("Invalid duration suffix '" + unit + "'");
}

} // namespace

std::chrono::milliseconds parse_duration_ms(const std::string &str,
                                            std::chrono::milliseconds bare_unit) {
  if (str.empty()) {
    return std::chrono::milliseconds{0};
  }

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string '" + str + "'");
    }
    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      if (value > 1000000000000LL) {
        throw std::runtime_error("Duration out of range '" + str + "'");
      }
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration '" + str + "'");
      }
      total += value * bare_unit.count();
      break;
    }

    std::string unit;
    while (i < str.size() && std::isalpha(static_cast<unsigned char>(str[i]))) {
      unit.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(str[i]))));
      ++i;
    }
    total += value * unit_millis(unit);
    has_unit = true;
  }

  return std::chrono::milliseconds{total};
}

std::chrono::seconds parse_duration(const std::string &str) {
  return std::chrono::duration_cast<std::chrono::seconds>(
      parse_duration_ms(str));
}

std::string format_duration(std::chrono::milliseconds value) {
  long long ms = value.count();
  if (ms <= 0) {
    return "0s";
  }
  std::string out;
  const struct {
    long long size;
    const char *suffix;
  } units[] = {{86400000LL, "d"}, {3600000LL, "h"}, {60000LL, "m"},
               {1000LL, "s"},     {1LL, "ms"}};
  for (const auto &u : units) {
    if (ms >= u.size) {
      out += std::to_string(ms / u.size) + u.suffix;
      ms %= u.size;
    }
  }
  return out;
}

} // namespace sitewatch
