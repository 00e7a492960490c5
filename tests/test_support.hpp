#ifndef SITEWATCH_TEST_SUPPORT_HPP
#define SITEWATCH_TEST_SUPPORT_HPP

#include "errors.hpp"
#include "fetcher.hpp"
#include "http_client.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace sitewatch_test {

using namespace sitewatch;

/// In-memory stand-in for the web, shared by every FakeHttpClient.
struct FakeWeb {
  std::mutex mutex;
  std::map<std::string, std::string> bodies;
  std::map<std::string, long> statuses;
  std::set<std::string> unreachable;
  std::vector<std::vector<std::string>> sent_headers;
  std::chrono::milliseconds latency{0};
  std::atomic<int> requests{0};
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};

  void set_body(const std::string &url, const std::string &body) {
    std::lock_guard<std::mutex> lock(mutex);
    bodies[url] = body;
    statuses.erase(url);
    unreachable.erase(url);
  }

  void set_status(const std::string &url, long status) {
    std::lock_guard<std::mutex> lock(mutex);
    statuses[url] = status;
  }

  void set_unreachable(const std::string &url) {
    std::lock_guard<std::mutex> lock(mutex);
    unreachable.insert(url);
  }

  int requests_for(const std::string &url) {
    std::lock_guard<std::mutex> lock(mutex);
    return per_url[url];
  }

  std::map<std::string, int> per_url;
};

class FakeHttpClient : public HttpClient {
public:
  explicit FakeHttpClient(FakeWeb &web) : web_(web) {}

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers,
                   const std::atomic<bool> *abort) override {
    ++web_.requests;
    int now_active = ++web_.active;
    int seen = web_.max_active.load();
    while (now_active > seen &&
           !web_.max_active.compare_exchange_weak(seen, now_active)) {
    }
    struct ActiveGuard {
      FakeWeb &web;
      ~ActiveGuard() { --web.active; }
    } guard{web_};

    std::chrono::milliseconds latency;
    {
      std::lock_guard<std::mutex> lock(web_.mutex);
      web_.sent_headers.push_back(headers);
      ++web_.per_url[url];
      latency = web_.latency;
    }
    auto deadline = std::chrono::steady_clock::now() + latency;
    while (std::chrono::steady_clock::now() < deadline) {
      if (abort != nullptr && abort->load()) {
        throw TransientNetworkError("transfer aborted");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    std::lock_guard<std::mutex> lock(web_.mutex);
    if (web_.unreachable.count(url) != 0) {
      throw TransientNetworkError("connection refused: " + url);
    }
    auto status = web_.statuses.find(url);
    if (status != web_.statuses.end()) {
      throw HttpStatusError(static_cast<int>(status->second),
                            "HTTP " + std::to_string(status->second));
    }
    auto body = web_.bodies.find(url);
    if (body == web_.bodies.end()) {
      throw HttpStatusError(404, "HTTP 404");
    }
    HttpResponse response;
    response.body = body->second;
    response.status_code = 200;
    response.effective_url = url;
    return response;
  }

private:
  FakeWeb &web_;
};

inline Fetcher make_fake_fetcher(FakeWeb &web,
                                 std::vector<std::string> user_agents = {}) {
  FetcherOptions options;
  options.user_agents = std::move(user_agents);
  return Fetcher(options, [&web](std::chrono::milliseconds) {
    return std::make_unique<FakeHttpClient>(web);
  });
}

/// Unique path in the temp directory, removed on destruction.
class TempPath {
public:
  explicit TempPath(const std::string &stem) {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("sitewatch_" + stem + "_" + std::to_string(rd()) + ".db");
    std::filesystem::remove(path_);
  }
  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_.string() + "-journal", ec);
    std::filesystem::remove(path_.string() + "-wal", ec);
    std::filesystem::remove(path_.string() + "-shm", ec);
  }
  TempPath(const TempPath &) = delete;
  TempPath &operator=(const TempPath &) = delete;

  std::string str() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

/// Poll @p pred until it holds or @p timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout =
                               std::chrono::milliseconds(3000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace sitewatch_test

#endif // SITEWATCH_TEST_SUPPORT_HPP
