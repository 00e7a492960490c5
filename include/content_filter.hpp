/**
 * @file content_filter.hpp
 * @brief Markup cleanup used for fingerprints and live previews.
 *
 * Normalization removes fragments that change on every request (clock
 * times, dates, counters, scripts, embedded frames, ad slots, comments) so
 * that unchanged pages keep the same fingerprint. Previews turn an HTML page,
 * feed or JSON document into a short readable excerpt for live subscribers.
 */
#ifndef SITEWATCH_CONTENT_FILTER_HPP
#define SITEWATCH_CONTENT_FILTER_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace sitewatch {

/// Rough classification of a fetched body.
enum class ContentKind { Html, Feed, Json };

/// Guess the kind of @p content from its leading markup.
ContentKind detect_content_kind(const std::string &content);

/**
 * Strip volatile fragments from a fetched body.
 *
 * Removes `<script>`, `<iframe>`, `<ins>` blocks and HTML comments, clock
 * times, common date formats, JSON `timestamp` fields, view counters and
 * `data-timestamp` attributes. When an `<article>` or `<main>` element is
 * present only its inner markup is kept. Whitespace runs collapse to a
 * single space.
 */
std::string normalize_content(const std::string &body);

/**
 * Build a readable excerpt of @p content.
 *
 * Feeds yield their first title and item text, JSON yields a `JSON Data`
 * header and the leading text, HTML yields the page title (or first
 * heading) and de-tagged body text. Long text is cut at a sentence or word
 * boundary and marked with `...`.
 *
 * @param content Raw body.
 * @param max_len Hard byte limit of the result.
 * @return Excerpt of at most @p max_len bytes that never splits a UTF-8
 *         sequence.
 */
std::string make_preview(const std::string &content, std::size_t max_len);

/// Remove tags, decode common entities and collapse whitespace.
std::string html_to_text(const std::string &html);

/// Inner markup of the first `<tag ...>...</tag>` element, if any.
std::optional<std::string> extract_element(const std::string &html,
                                           const std::string &tag);

/// Largest prefix length not above @p limit that ends on a UTF-8 boundary.
std::size_t utf8_prefix_length(const std::string &text, std::size_t limit);

} // namespace sitewatch

#endif // SITEWATCH_CONTENT_FILTER_HPP
