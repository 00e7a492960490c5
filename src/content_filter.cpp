#include "content_filter.hpp"

#include <cctype>
#include <cstdint>
#include <regex>
#include <string_view>

namespace sitewatch {

namespace {

char lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Case-insensitive search for @p needle (given in lowercase).
std::size_t find_ci(const std::string &hay, std::string_view needle,
                    std::size_t from = 0) {
  if (needle.empty() || hay.size() < needle.size()) {
    return std::string::npos;
  }
  for (std::size_t i = from; i + needle.size() <= hay.size(); ++i) {
    std::size_t k = 0;
    while (k < needle.size() && lower(hay[i + k]) == needle[k]) {
      ++k;
    }
    if (k == needle.size()) {
      return i;
    }
  }
  return std::string::npos;
}

/// Position of the next `<tag` that is followed by a delimiter.
std::size_t find_tag_open(const std::string &html, const std::string &tag,
                          std::size_t from = 0) {
  const std::string needle = "<" + tag;
  std::size_t pos = from;
  while ((pos = find_ci(html, needle, pos)) != std::string::npos) {
    std::size_t after = pos + needle.size();
    if (after >= html.size()) {
      return std::string::npos;
    }
    char c = html[after];
    if (c == '>' || c == '/' || is_space(c)) {
      return pos;
    }
    pos = after;
  }
  return std::string::npos;
}

/// Drop every `<tag>...</tag>` block. Unterminated blocks are left alone.
std::string remove_blocks(const std::string &text, const std::string &tag) {
  std::string out;
  out.reserve(text.size());
  const std::string close = "</" + tag;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t open = find_tag_open(text, tag, pos);
    if (open == std::string::npos) {
      break;
    }
    std::size_t end = find_ci(text, close, open);
    if (end == std::string::npos) {
      break;
    }
    std::size_t gt = text.find('>', end);
    if (gt == std::string::npos) {
      break;
    }
    out.append(text, pos, open - pos);
    pos = gt + 1;
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }
  return out;
}

std::string remove_comments(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t open = text.find("<!--", pos);
    if (open == std::string::npos) {
      break;
    }
    std::size_t close = text.find("-->", open + 4);
    if (close == std::string::npos) {
      break;
    }
    out.append(text, pos, open - pos);
    pos = close + 3;
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }
  return out;
}

std::string collapse_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool decode_numeric_entity(std::string_view body, std::string &out) {
  if (body.size() < 2 || body[0] != '#') {
    return false;
  }
  std::uint32_t cp = 0;
  bool hex = body[1] == 'x' || body[1] == 'X';
  std::size_t i = hex ? 2 : 1;
  if (i >= body.size()) {
    return false;
  }
  for (; i < body.size(); ++i) {
    char c = body[i];
    int digit;
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digit = c - '0';
    } else if (hex && std::isxdigit(static_cast<unsigned char>(c))) {
      digit = lower(c) - 'a' + 10;
    } else {
      return false;
    }
    cp = cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(digit);
    if (cp > 0x10FFFF) {
      return false;
    }
  }
  append_utf8(out, cp);
  return true;
}

std::string decode_entities(const std::string &text) {
  static const struct {
    std::string_view name;
    std::string_view value;
  } named[] = {{"nbsp", " "},  {"amp", "&"},    {"lt", "<"},
               {"gt", ">"},    {"quot", "\""},  {"apos", "'"},
               {"ndash", "-"}, {"mdash", "-"},  {"lsquo", "'"},
               {"rsquo", "'"}, {"ldquo", "\""}, {"rdquo", "\""},
               {"hellip", "..."}};
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }
    std::size_t semi = text.find(';', i + 1);
    if (semi == std::string::npos || semi - i > 10) {
      out.push_back(text[i++]);
      continue;
    }
    std::string_view body(text.data() + i + 1, semi - i - 1);
    bool decoded = decode_numeric_entity(body, out);
    for (const auto &entity : named) {
      if (decoded) {
        break;
      }
      if (body == entity.name) {
        out.append(entity.value.data(), entity.value.size());
        decoded = true;
      }
    }
    if (decoded) {
      i = semi + 1;
    } else {
      out.push_back(text[i++]);
    }
  }
  return out;
}

std::string unwrap_cdata(const std::string &text) {
  std::size_t open = text.find("<![CDATA[");
  if (open == std::string::npos) {
    return text;
  }
  std::size_t close = text.find("]]>", open + 9);
  if (close == std::string::npos) {
    return text.substr(open + 9);
  }
  return text.substr(open + 9, close - open - 9);
}

/// Cut position at or below @p limit, preferring sentence then word breaks.
std::size_t boundary_before(const std::string &text, std::size_t limit,
                            bool prefer_sentence) {
  if (text.size() <= limit) {
    return text.size();
  }
  if (prefer_sentence) {
    for (std::size_t i = limit; i > limit / 2; --i) {
      char c = text[i - 1];
      if (c == '.' || c == '!' || c == '?' || c == '\n') {
        return i;
      }
    }
  }
  static constexpr std::string_view word_breaks = " .,;:!?\n\r";
  for (std::size_t i = limit; i > 0; --i) {
    if (word_breaks.find(text[i - 1]) != std::string_view::npos) {
      return i;
    }
  }
  return utf8_prefix_length(text, limit);
}

/// Shorten @p text to at most @p limit bytes, marking the cut with `...`.
std::string shorten(const std::string &text, std::size_t limit,
                    bool prefer_sentence) {
  if (text.size() <= limit) {
    return text;
  }
  if (limit < 4) {
    return text.substr(0, utf8_prefix_length(text, limit));
  }
  std::size_t cut = boundary_before(text, limit - 3, prefer_sentence);
  while (cut > 0 && is_space(text[cut - 1])) {
    --cut;
  }
  return text.substr(0, cut) + "...";
}

std::string compose(const std::string &header, const std::string &text,
                    std::size_t max_len, bool prefer_sentence) {
  if (header.empty()) {
    return shorten(text, max_len, prefer_sentence);
  }
  if (header.size() + 2 >= max_len) {
    return shorten(header, max_len, false);
  }
  std::string out = header + "\n\n";
  out += shorten(text, max_len - out.size(), prefer_sentence);
  return out;
}

std::string feed_preview(const std::string &xml, std::size_t max_len) {
  std::string title;
  if (auto raw = extract_element(xml, "title")) {
    title = html_to_text(unwrap_cdata(*raw));
  }
  std::string text;
  for (const char *tag : {"content", "description", "summary"}) {
    if (auto raw = extract_element(xml, tag)) {
      text = html_to_text(unwrap_cdata(*raw));
      if (text.find('<') != std::string::npos) {
        text = html_to_text(text);
      }
      if (!text.empty()) {
        break;
      }
    }
  }
  if (text.empty()) {
    std::string cdata = unwrap_cdata(xml);
    if (cdata.size() != xml.size()) {
      text = html_to_text(cdata);
    }
  }
  if (!text.empty()) {
    return compose(title, text, max_len, false);
  }
  if (!title.empty()) {
    return compose(title, "[Feed content not available]", max_len, false);
  }
  return shorten("Feed detected, but no readable content was found.", max_len,
                 false);
}

std::string json_preview(const std::string &json, std::size_t max_len) {
  return compose("JSON Data", collapse_whitespace(json), max_len, false);
}

std::string html_preview(const std::string &html, std::size_t max_len) {
  std::string title;
  if (auto raw = extract_element(html, "title")) {
    title = html_to_text(*raw);
  }
  if (title.empty()) {
    if (auto raw = extract_element(html, "h1")) {
      title = html_to_text(*raw);
    }
  }
  std::string text;
  for (const char *tag : {"article", "main", "body"}) {
    if (auto raw = extract_element(html, tag)) {
      text = html_to_text(*raw);
      if (!text.empty()) {
        break;
      }
    }
  }
  if (text.empty() && find_tag_open(html, "body") == std::string::npos) {
    text = html_to_text(remove_blocks(html, "head"));
  }
  if (!text.empty()) {
    return compose(title, text, max_len, true);
  }
  if (!title.empty()) {
    return compose(title, "[Content not available]", max_len, false);
  }
  return shorten("Unable to extract readable content from this page.",
                 max_len, false);
}

} // namespace

ContentKind detect_content_kind(const std::string &content) {
  for (const char *marker : {"<?xml", "<rss", "<feed", "<item>", "<entry>"}) {
    if (content.find(marker) != std::string::npos) {
      return ContentKind::Feed;
    }
  }
  std::size_t first = 0;
  while (first < content.size() && is_space(content[first])) {
    ++first;
  }
  std::size_t last = content.size();
  while (last > first && is_space(content[last - 1])) {
    --last;
  }
  if (last > first) {
    char open = content[first];
    char close = content[last - 1];
    if ((open == '{' && close == '}') || (open == '[' && close == ']')) {
      return ContentKind::Json;
    }
  }
  return ContentKind::Html;
}

std::string normalize_content(const std::string &body) {
  static const std::regex volatile_fragments(
      R"([A-Za-z]{3},\s\d{1,2}\s[A-Za-z]{3}\s\d{4})"
      R"(|\d{4}-\d{2}-\d{2})"
      R"(|\d{1,2}/\d{1,2}/\d{2,4})"
      R"(|\d{1,2}:\d{2}(?::\d{2})?)"
      R"(|viewcount["']?\s*:\s*["']?\d+)"
      R"(|["']timestamp["']\s*:\s*\d+)"
      R"(|data-timestamp=["']\d+["'])");

  std::string text = remove_comments(body);
  for (const char *tag : {"script", "iframe", "ins"}) {
    text = remove_blocks(text, tag);
  }
  text = std::regex_replace(text, volatile_fragments, "");
  for (const char *tag : {"article", "main"}) {
    if (auto inner = extract_element(text, tag)) {
      text = std::move(*inner);
      break;
    }
  }
  return collapse_whitespace(text);
}

std::optional<std::string> extract_element(const std::string &html,
                                           const std::string &tag) {
  std::size_t open = find_tag_open(html, tag);
  if (open == std::string::npos) {
    return std::nullopt;
  }
  std::size_t gt = html.find('>', open);
  if (gt == std::string::npos) {
    return std::nullopt;
  }
  if (html[gt - 1] == '/') {
    return std::string{};
  }
  std::size_t close = find_ci(html, "</" + tag, gt + 1);
  if (close == std::string::npos) {
    return std::nullopt;
  }
  return html.substr(gt + 1, close - gt - 1);
}

std::string html_to_text(const std::string &html) {
  std::string text = remove_comments(html);
  for (const char *tag : {"script", "style", "noscript"}) {
    text = remove_blocks(text, tag);
  }
  std::string stripped;
  stripped.reserve(text.size());
  bool in_tag = false;
  for (char c : text) {
    if (in_tag) {
      if (c == '>') {
        in_tag = false;
        stripped.push_back(' ');
      }
    } else if (c == '<') {
      in_tag = true;
    } else {
      stripped.push_back(c);
    }
  }
  return collapse_whitespace(decode_entities(stripped));
}

std::size_t utf8_prefix_length(const std::string &text, std::size_t limit) {
  if (limit >= text.size()) {
    return text.size();
  }
  std::size_t n = limit;
  while (n > 0 && (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) {
    --n;
  }
  return n;
}

std::string make_preview(const std::string &content, std::size_t max_len) {
  if (max_len == 0) {
    return {};
  }
  std::string preview;
  switch (detect_content_kind(content)) {
  case ContentKind::Feed:
    preview = feed_preview(content, max_len);
    break;
  case ContentKind::Json:
    preview = json_preview(content, max_len);
    break;
  case ContentKind::Html:
    preview = html_preview(content, max_len);
    break;
  }
  if (preview.size() > max_len) {
    preview.resize(utf8_prefix_length(preview, max_len));
  }
  return preview;
}

} // namespace sitewatch
