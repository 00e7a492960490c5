/**
 * @file errors.hpp
 * @brief Exception types shared across the watcher.
 *
 * Network failures, storage failures and configuration errors are reported
 * with dedicated exception classes so callers can decide which failures are
 * local to one polling cycle and which must reach the requester.
 */
#ifndef SITEWATCH_ERRORS_HPP
#define SITEWATCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sitewatch {

/// Transport level failure such as a refused connection, DNS error, timeout
/// or aborted transfer.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-success HTTP response.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status, const std::string &message)
      : std::runtime_error(message), status_(status) {}

  /// HTTP status code returned by the server.
  int status() const noexcept { return status_; }

private:
  int status_;
};

/// Failure reported by the SQLite persistence layer.
class StorageError : public std::runtime_error {
public:
  StorageError(int code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  /// SQLite result code, or -1 when the failure did not originate in SQLite.
  int code() const noexcept { return code_; }

private:
  int code_;
};

/// Rejected input: invalid interval, duplicate or malformed URL, or an
/// invalid configuration value.
class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Lookup of a record that does not exist.
class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace sitewatch

#endif // SITEWATCH_ERRORS_HPP
