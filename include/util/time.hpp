/**
 * @file time.hpp
 * @brief Clock and RFC 3339 timestamp helpers.
 *
 * Timestamps are stored and transmitted as RFC 3339 UTC strings with
 * millisecond precision, e.g. `2024-05-01T12:00:00.123Z`. Keeping one fixed
 * width format makes stored timestamps sort lexicographically.
 */
#ifndef SITEWATCH_UTIL_TIME_HPP
#define SITEWATCH_UTIL_TIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sitewatch {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// Current wall clock time truncated to milliseconds.
Timestamp now_ms();

/// Format @p tp as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
std::string format_timestamp(Timestamp tp);

/**
 * Parse an RFC 3339 timestamp.
 *
 * Accepts an optional fractional part of any length (truncated to
 * milliseconds) and either `Z` or a `+HH:MM` / `-HH:MM` offset.
 *
 * @return Parsed time point or `std::nullopt` when the text is malformed.
 */
std::optional<Timestamp> parse_timestamp(const std::string &text);

/// Milliseconds since the Unix epoch.
std::int64_t to_unix_millis(Timestamp tp);

} // namespace sitewatch

#endif // SITEWATCH_UTIL_TIME_HPP
