/**
 * @file content_hasher.hpp
 * @brief Content fingerprinting.
 */
#ifndef SITEWATCH_CONTENT_HASHER_HPP
#define SITEWATCH_CONTENT_HASHER_HPP

#include <string>
#include <string_view>

namespace sitewatch {

/**
 * Computes the fingerprint used to decide whether a site changed.
 *
 * The fingerprint is the lowercase hex SHA-256 digest of the body, taken
 * after volatile fragments are stripped when normalization is enabled. The
 * hasher holds no mutable state and is safe to share between threads.
 */
class ContentHasher {
public:
  explicit ContentHasher(bool normalize = true) : normalize_(normalize) {}

  /// Fingerprint of a fetched body.
  std::string fingerprint(const std::string &body) const;

  /// Whether bodies are normalized before hashing.
  bool normalizes() const { return normalize_; }

  /**
   * Hex encoded SHA-256 digest of @p data.
   *
   * @throws std::runtime_error if the digest cannot be computed.
   */
  static std::string sha256_hex(std::string_view data);

private:
  bool normalize_;
};

} // namespace sitewatch

#endif // SITEWATCH_CONTENT_HASHER_HPP
