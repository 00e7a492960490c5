/**
 * @file http_client.hpp
 * @brief HTTP transport used by the fetcher.
 *
 * Declares the abstract HttpClient seam together with the libcurl backed
 * implementation and the RAII helpers it relies on.
 */
#ifndef SITEWATCH_HTTP_CLIENT_HPP
#define SITEWATCH_HTTP_CLIENT_HPP

#include <atomic>
#include <curl/curl.h>
#include <string>
#include <vector>

namespace sitewatch {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
  std::string effective_url;        ///< URL after redirects
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @param abort Optional flag polled during the transfer; once it reads
   *        true the transfer stops and TransientNetworkError is thrown.
   * @return Response of a 2xx request.
   * @throws TransientNetworkError On transport failures, timeouts, oversized
   *         bodies or aborted transfers.
   * @throws HttpStatusError On non-2xx responses.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers,
                           const std::atomic<bool> *abort) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Redirects are followed, the timeout applies to the whole attempt and the
 * body is capped at a configurable size.
 *
 * @note This class is not thread-safe; use one instance per thread or provide
 *       external synchronization.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Timeout of one request in milliseconds.
   * @param max_body_bytes Largest accepted body (0 = unlimited).
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 10000,
                          curl_off_t max_body_bytes = 0,
                          std::string http_proxy = {},
                          std::string https_proxy = {});

  /// @copydoc HttpClient::get()
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers,
                   const std::atomic<bool> *abort) override;

  /// Request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

  /// Largest accepted body in bytes.
  curl_off_t max_body_bytes() const { return max_body_bytes_; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void apply_proxy(CURL *curl, const std::string &url);
  CurlHandle curl_;
  long timeout_ms_;
  curl_off_t max_body_bytes_;
  std::string http_proxy_;
  std::string https_proxy_;
};

} // namespace sitewatch

#endif // SITEWATCH_HTTP_CLIENT_HPP
