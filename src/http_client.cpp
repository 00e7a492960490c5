/**
 * @file http_client.cpp
 * @brief libcurl implementation of the HttpClient interface.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <sstream>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 */
std::string format_curl_error(const std::string &url, CURLcode code,
                              const char *errbuf) {
  std::ostringstream oss;
  oss << "GET";
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

struct BodySink {
  std::string *body;
  curl_off_t limit;
  bool overflow{false};
};

size_t write_callback(void *contents, size_t size, size_t nmemb,
                      void *userp) {
  size_t total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userp);
  if (sink->limit > 0 &&
      static_cast<curl_off_t>(sink->body->size() + total) > sink->limit) {
    sink->overflow = true;
    return 0;
  }
  sink->body->append(static_cast<char *>(contents), total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  if (line.rfind("HTTP/", 0) == 0) {
    // A new status line starts the headers of a redirect target.
    hdrs->clear();
  }
  if (!line.empty()) {
    hdrs->push_back(line);
  }
  return total;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  const auto *abort = static_cast<const std::atomic<bool> *>(clientp);
  return abort != nullptr && abort->load() ? 1 : 0;
}

} // namespace

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, curl_off_t max_body_bytes,
                               std::string http_proxy, std::string https_proxy)
    : timeout_ms_(timeout_ms), max_body_bytes_(max_body_bytes),
      http_proxy_(std::move(http_proxy)), https_proxy_(std::move(https_proxy)) {
}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!https_proxy_.empty()) {
      proxy = &https_proxy_;
    } else if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0) {
    if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 0L);
    }
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers,
                                 const std::atomic<bool> *abort) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse response;
  BodySink sink{&response.body, max_body_bytes_};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                   const_cast<std::atomic<bool> *>(abort));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  char *effective = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) ==
          CURLE_OK &&
      effective != nullptr) {
    response.effective_url = effective;
  }
  if (res != CURLE_OK) {
    if (sink.overflow) {
      std::string msg = "GET " + url + " failed: body exceeds " +
                        std::to_string(max_body_bytes_) + " bytes";
      http_log()->warn(msg);
      throw TransientNetworkError(msg);
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
      http_log()->debug("GET {} aborted", url);
      throw TransientNetworkError("GET " + url + " aborted");
    }
    std::string msg = format_curl_error(url, res, errbuf);
    http_log()->debug(msg);
    throw TransientNetworkError(msg);
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    http_log()->debug("GET {} returned HTTP {}", url, response.status_code);
    throw HttpStatusError(static_cast<int>(response.status_code),
                          "GET " + url + " failed with HTTP code " +
                              std::to_string(response.status_code));
  }
  return response;
}

} // namespace sitewatch
