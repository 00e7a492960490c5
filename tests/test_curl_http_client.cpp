#include "errors.hpp"
#include "http_client.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace sitewatch;
using namespace std::chrono_literals;

namespace {

/// Serves one canned HTTP response per connection on 127.0.0.1.
class LoopbackServer {
public:
  explicit LoopbackServer(std::string response,
                          std::chrono::milliseconds delay = 0ms)
      : response_(std::move(response)), delay_(delay) {
    // Loopback requests must not go through a proxy from the environment.
    setenv("NO_PROXY", "127.0.0.1", 1);
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd_ >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) ==
            0);
    REQUIRE(::listen(fd_, 8) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) ==
            0);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { serve(); });
  }

  ~LoopbackServer() {
    stop_ = true;
    ::shutdown(fd_, SHUT_RDWR);
    thread_.join();
    ::close(fd_);
  }

  std::string url(const std::string &path = "/") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  std::string last_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
  }

private:
  void serve() {
    while (!stop_) {
      int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      std::string request;
      char buf[1024];
      while (request.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(client, buf, sizeof(buf), 0);
        if (n <= 0) {
          break;
        }
        request.append(buf, static_cast<std::size_t>(n));
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_request_ = request;
      }
      auto until = std::chrono::steady_clock::now() + delay_;
      while (!stop_ && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(5ms);
      }
      ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
      ::close(client);
    }
  }

  std::string response_;
  std::chrono::milliseconds delay_;
  int fd_{-1};
  int port_{0};
  std::atomic<bool> stop_{false};
  std::thread thread_;
  std::mutex mutex_;
  std::string last_request_;
};

std::string http_response(int status, const std::string &body) {
  return "HTTP/1.1 " + std::to_string(status) + " X\r\nContent-Type: " +
         "text/html\r\nContent-Length: " + std::to_string(body.size()) +
         "\r\nConnection: close\r\n\r\n" + body;
}

int unused_port() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  ::close(fd);
  return ntohs(addr.sin_port);
}

} // namespace

TEST_CASE("CurlHttpClient configuration") {
  CurlHttpClient client(1500, 4096, "http://proxy", "http://secureproxy");
  CHECK(client.timeout_ms() == 1500);
  CHECK(client.max_body_bytes() == 4096);
  CHECK(client.http_proxy() == "http://proxy");
  CHECK(client.https_proxy() == "http://secureproxy");
}

TEST_CASE("successful responses return body, headers and status") {
  LoopbackServer server(http_response(200, "<p>hello</p>"));
  CurlHttpClient client(2000);
  HttpResponse response =
      client.get(server.url("/page"), {"User-Agent: sitewatch-test"}, nullptr);
  CHECK(response.status_code == 200);
  CHECK(response.body == "<p>hello</p>");
  CHECK_FALSE(response.headers.empty());
  std::string request = server.last_request();
  CHECK(request.find("GET /page HTTP/1.1") == 0);
  CHECK(request.find("User-Agent: sitewatch-test") != std::string::npos);
}

TEST_CASE("non-2xx responses raise HttpStatusError") {
  LoopbackServer server(http_response(503, "busy"));
  CurlHttpClient client(2000);
  try {
    client.get(server.url(), {}, nullptr);
    FAIL("expected HttpStatusError");
  } catch (const HttpStatusError &e) {
    CHECK(e.status() == 503);
  }
}

TEST_CASE("refused connections raise TransientNetworkError") {
  CurlHttpClient client(2000);
  std::string url = "http://127.0.0.1:" + std::to_string(unused_port()) + "/";
  CHECK_THROWS_AS(client.get(url, {}, nullptr), TransientNetworkError);
}

TEST_CASE("oversized bodies are rejected") {
  LoopbackServer server(http_response(200, std::string(10000, 'x')));
  CurlHttpClient client(2000, 1000);
  CHECK_THROWS_AS(client.get(server.url(), {}, nullptr),
                  TransientNetworkError);
}

TEST_CASE("slow responses time out") {
  LoopbackServer server(http_response(200, "late"), 3000ms);
  CurlHttpClient client(200);
  auto start = std::chrono::steady_clock::now();
  CHECK_THROWS_AS(client.get(server.url(), {}, nullptr),
                  TransientNetworkError);
  CHECK(std::chrono::steady_clock::now() - start < 2500ms);
}

TEST_CASE("setting the abort flag stops a transfer") {
  LoopbackServer server(http_response(200, "late"), 5000ms);
  CurlHttpClient client(10000);
  std::atomic<bool> abort{false};
  std::thread trigger([&] {
    std::this_thread::sleep_for(100ms);
    abort = true;
  });
  auto start = std::chrono::steady_clock::now();
  CHECK_THROWS_AS(client.get(server.url(), {}, &abort), TransientNetworkError);
  CHECK(std::chrono::steady_clock::now() - start < 4000ms);
  trigger.join();
}
