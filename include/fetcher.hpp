/**
 * @file fetcher.hpp
 * @brief One-shot retrieval of a site body.
 */
#ifndef SITEWATCH_FETCHER_HPP
#define SITEWATCH_FETCHER_HPP

#include "http_client.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sitewatch {

/// Outcome of one fetch attempt.
struct FetchResult {
  bool success = false;
  std::optional<std::string> content; ///< Body on success
  std::optional<std::string> error;   ///< Failure reason
  long status_code = 0;               ///< HTTP status, 0 without a response
};

/// Transport settings shared by every fetch.
struct FetcherOptions {
  long long max_content_bytes = 10 * 1024 * 1024;
  std::string http_proxy;
  std::string https_proxy;
  std::vector<std::string> user_agents;
};

/**
 * Performs a single HTTP GET per call and reports the outcome as a value.
 *
 * A fresh HttpClient is created for every fetch so concurrent calls for
 * different sites share no mutable state. Failures (transport errors,
 * timeouts, non-2xx statuses) never throw; there are no internal retries.
 */
class Fetcher {
public:
  /// Builds the client used for one fetch with the given timeout.
  using ClientFactory = std::function<std::unique_ptr<HttpClient>(
      std::chrono::milliseconds timeout)>;

  /**
   * @param options Transport settings.
   * @param factory Client factory; a CurlHttpClient factory is used when
   *        empty.
   */
  explicit Fetcher(FetcherOptions options, ClientFactory factory = {});

  /**
   * Fetch @p url once.
   *
   * @param url Absolute http(s) URL.
   * @param timeout Bound of the whole attempt.
   * @param abort Optional cancellation flag observed during the transfer.
   */
  FetchResult fetch(const std::string &url, std::chrono::milliseconds timeout,
                    const std::atomic<bool> *abort = nullptr) const;

  /// User-Agent chosen uniformly from the configured pool.
  std::string pick_user_agent() const;

  const FetcherOptions &options() const { return options_; }

private:
  FetcherOptions options_;
  ClientFactory factory_;
};

} // namespace sitewatch

#endif // SITEWATCH_FETCHER_HPP
