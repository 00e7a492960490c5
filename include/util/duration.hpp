/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Converts strings such as "90", "1500ms", "5m" or "1h30m" into chrono
 * durations for polling intervals, jitter bounds and backoff caps.
 */
#ifndef SITEWATCH_UTIL_DURATION_HPP
#define SITEWATCH_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace sitewatch {

/**
 * Parse a duration string into milliseconds.
 *
 * Supported units are `ms`, `s`, `m`, `h`, `d` and `w`; several number/unit
 * pairs may be chained ("1m30s"). A bare number uses @p bare_unit.
 *
 * @param str Duration string; an empty string yields zero.
 * @param bare_unit Unit applied to a number without suffix.
 * @return Parsed duration.
 * @throws std::runtime_error on malformed input or unknown suffixes.
 */
std::chrono::milliseconds
parse_duration_ms(const std::string &str,
                  std::chrono::milliseconds bare_unit = std::chrono::seconds{1});

/**
 * Parse a duration string into whole seconds. Sub-second parts are
 * truncated.
 */
std::chrono::seconds parse_duration(const std::string &str);

/// Render a duration compactly, e.g. `1h30m`, `45s` or `250ms`.
std::string format_duration(std::chrono::milliseconds value);

} // namespace sitewatch

#endif // SITEWATCH_UTIL_DURATION_HPP
