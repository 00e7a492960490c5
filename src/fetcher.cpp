#include "fetcher.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <random>
#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> fetcher_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("fetcher");
  }();
  return logger;
}

std::mt19937 &thread_rng() {
  thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

} // namespace

Fetcher::Fetcher(FetcherOptions options, ClientFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
  if (!factory_) {
    const auto max_bytes = static_cast<curl_off_t>(options_.max_content_bytes);
    const auto http_proxy = options_.http_proxy;
    const auto https_proxy = options_.https_proxy;
    factory_ = [max_bytes, http_proxy,
                https_proxy](std::chrono::milliseconds timeout) {
      return std::make_unique<CurlHttpClient>(
          static_cast<long>(timeout.count()), max_bytes, http_proxy,
          https_proxy);
    };
  }
}

std::string Fetcher::pick_user_agent() const {
  if (options_.user_agents.empty()) {
    return "sitewatch";
  }
  std::uniform_int_distribution<std::size_t> dist(
      0, options_.user_agents.size() - 1);
  return options_.user_agents[dist(thread_rng())];
}

FetchResult Fetcher::fetch(const std::string &url,
                           std::chrono::milliseconds timeout,
                           const std::atomic<bool> *abort) const {
  FetchResult result;
  std::vector<std::string> headers = {
      "User-Agent: " + pick_user_agent(),
      "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,"
      "application/json;q=0.8,*/*;q=0.7"};
  try {
    auto client = factory_(timeout);
    HttpResponse response = client->get(url, headers, abort);
    result.success = true;
    result.status_code = response.status_code;
    result.content = std::move(response.body);
    fetcher_log()->trace("Fetched {} ({} bytes, HTTP {})", url,
                         result.content->size(), result.status_code);
  } catch (const HttpStatusError &e) {
    result.status_code = e.status();
    result.error = e.what();
    fetcher_log()->debug("Fetch of {} rejected: {}", url, e.what());
  } catch (const TransientNetworkError &e) {
    result.error = e.what();
    fetcher_log()->debug("Fetch of {} failed: {}", url, e.what());
  } catch (const std::exception &e) {
    result.error = std::string("unexpected fetch failure: ") + e.what();
    fetcher_log()->warn("Unexpected failure fetching {}: {}", url, e.what());
  }
  return result;
}

} // namespace sitewatch
