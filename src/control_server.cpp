#include "control_server.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sitewatch {

namespace {
std::shared_ptr<spdlog::logger> control_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("control");
  }();
  return logger;
}

std::optional<std::int64_t> integer_param(const nlohmann::json &params,
                                          const char *key) {
  auto it = params.find(key);
  if (it == params.end() ||
      !(it->is_number_integer() || it->is_number_unsigned())) {
    return std::nullopt;
  }
  return it->get<std::int64_t>();
}

nlohmann::json updates_to_json(const std::vector<Update> &updates) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &update : updates) {
    out.push_back(nlohmann::json(update));
  }
  return out;
}
} // namespace

RegistryBackend::RegistryBackend(Registry &registry, SiteStore &store,
                                 Broadcaster &broadcaster,
                                 std::vector<SiteSpec> default_sites)
    : registry_(registry), store_(store), broadcaster_(broadcaster),
      default_sites_(std::move(default_sites)) {}

std::vector<Site> RegistryBackend::list_sites() {
  return registry_.list_sites();
}

Site RegistryBackend::add_site(const SiteSpec &spec) {
  return registry_.add_site(spec);
}

bool RegistryBackend::remove_site(SiteId id) {
  return registry_.remove_site(id);
}

void RegistryBackend::require_site(SiteId site_id) const {
  if (!registry_.find_site(site_id)) {
    throw NotFoundError("Site " + std::to_string(site_id) + " not found");
  }
}

std::optional<Update> RegistryBackend::get_update(SiteId site_id,
                                                  UpdateId id) {
  require_site(site_id);
  return store_.get_update(site_id, id);
}

std::optional<Update> RegistryBackend::get_update_at(SiteId site_id,
                                                     Timestamp when) {
  require_site(site_id);
  return store_.get_update_at(site_id, when);
}

std::vector<Update> RegistryBackend::list_updates(SiteId site_id) {
  require_site(site_id);
  return store_.list_updates(site_id);
}

void RegistryBackend::reset_all() { registry_.reset_all(default_sites_); }

std::unique_ptr<Subscription> RegistryBackend::subscribe() {
  return broadcaster_.subscribe();
}

ControlServer::ControlServer(WatchBackend &backend) : backend_(backend) {}

nlohmann::json ControlServer::make_error(const nlohmann::json &id, int code,
                                         const std::string &message) const {
  return nlohmann::json{{"jsonrpc", "2.0"},
                        {"id", id},
                        {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json ControlServer::make_result(const nlohmann::json &id,
                                          const nlohmann::json &result) const {
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json make_update_notification(const UpdateEvent &event) {
  return nlohmann::json{
      {"jsonrpc", "2.0"}, {"method", "update"}, {"params", event}};
}

nlohmann::json
ControlServer::handle_request(const nlohmann::json &request,
                              std::unique_ptr<Subscription> *subscription) {
  if (!request.is_object()) {
    emit_event("reject: request not an object");
    return make_error(nullptr, rpc_error::kInvalidRequest,
                      "Invalid request object");
  }
  bool has_id = request.contains("id");
  nlohmann::json id = has_id ? request["id"] : nullptr;

  auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    emit_event("reject: missing method");
    if (!has_id) {
      control_log()->warn("Missing method name");
      return nlohmann::json{};
    }
    return make_error(id, rpc_error::kInvalidRequest, "Missing method name");
  }
  std::string method = method_it->get<std::string>();

  auto respond_error = [&](int code, const std::string &message) {
    emit_event("method=" + method + " error(" + std::to_string(code) +
               "): " + message);
    if (!has_id) {
      control_log()->warn("{}", message);
      return nlohmann::json{};
    }
    return make_error(id, code, message);
  };
  auto respond = [&](nlohmann::json result) {
    if (!has_id) {
      return nlohmann::json{};
    }
    return make_result(id, result);
  };

  nlohmann::json params = nlohmann::json::object();
  auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      return respond_error(rpc_error::kInvalidParams,
                           "Parameters must be an object");
    }
    params = *params_it;
  }

  try {
    if (method == "ping") {
      emit_event("method=ping ok");
      return respond(nlohmann::json{{"message", "pong"}});
    }
    if (method == "shutdown") {
      running_ = false;
      std::function<void()> handler;
      {
        std::lock_guard<std::mutex> lock(event_mutex_);
        handler = shutdown_handler_;
      }
      if (handler) {
        handler();
      }
      emit_event("method=shutdown acknowledged");
      return respond(nlohmann::json{{"acknowledged", true}});
    }
    if (method == "listSites") {
      auto sites = backend_.list_sites();
      nlohmann::json result = nlohmann::json::array();
      for (const auto &site : sites) {
        result.push_back(nlohmann::json(site));
      }
      emit_event("method=listSites count=" + std::to_string(result.size()));
      return respond(nlohmann::json{{"sites", result}});
    }
    if (method == "addSite") {
      auto url_it = params.find("url");
      if (url_it == params.end() || !url_it->is_string()) {
        return respond_error(rpc_error::kInvalidParams, "url must be a string");
      }
      SiteSpec spec;
      spec.url = url_it->get<std::string>();
      if (params.contains("interval_secs") &&
          !params["interval_secs"].is_null()) {
        auto interval = integer_param(params, "interval_secs");
        if (!interval) {
          return respond_error(rpc_error::kInvalidParams,
                               "interval_secs must be an integer");
        }
        if (*interval < kMinIntervalSecs || *interval > kMaxIntervalSecs) {
          return respond_error(rpc_error::kInvalidParams,
                               "interval_secs must be between 1 and 3000");
        }
        spec.interval_secs = static_cast<int>(*interval);
      }
      auto style_it = params.find("style");
      if (style_it != params.end() && !style_it->is_null()) {
        std::optional<PollStyle> style;
        if (style_it->is_string()) {
          style = parse_poll_style(style_it->get<std::string>());
        }
        if (!style) {
          return respond_error(rpc_error::kInvalidParams,
                               "style must be one of random, exponential, "
                               "none");
        }
        spec.style = *style;
      }
      Site site = backend_.add_site(spec);
      emit_event("method=addSite id=" + std::to_string(site.id) +
                 " url=" + site.url);
      return respond(nlohmann::json{{"site", site}});
    }
    if (method == "removeSite") {
      auto site_id = integer_param(params, "id");
      if (!site_id) {
        return respond_error(rpc_error::kInvalidParams,
                             "id must be an integer");
      }
      bool removed = backend_.remove_site(*site_id);
      emit_event("method=removeSite id=" + std::to_string(*site_id) +
                 (removed ? " removed" : " absent"));
      return respond(nlohmann::json{{"removed", removed}});
    }
    if (method == "getUpdate" || method == "listUpdates") {
      auto site_id = integer_param(params, "site_id");
      if (!site_id) {
        return respond_error(rpc_error::kInvalidParams,
                             "site_id must be an integer");
      }
      if (method == "listUpdates") {
        auto updates = backend_.list_updates(*site_id);
        emit_event("method=listUpdates site=" + std::to_string(*site_id) +
                   " count=" + std::to_string(updates.size()));
        return respond(nlohmann::json{{"updates", updates_to_json(updates)}});
      }
      std::optional<Update> update;
      if (auto update_id = integer_param(params, "id")) {
        update = backend_.get_update(*site_id, *update_id);
      } else if (params.contains("timestamp") &&
                 params["timestamp"].is_string()) {
        auto when = parse_timestamp(params["timestamp"].get<std::string>());
        if (!when) {
          return respond_error(rpc_error::kInvalidParams,
                               "timestamp must be an RFC 3339 time");
        }
        update = backend_.get_update_at(*site_id, *when);
      } else {
        return respond_error(rpc_error::kInvalidParams,
                             "id or timestamp is required");
      }
      if (!update) {
        return respond_error(rpc_error::kNotFound, "Update not found");
      }
      emit_event("method=getUpdate site=" + std::to_string(*site_id) +
                 " update=" + std::to_string(update->id));
      return respond(nlohmann::json{{"update", *update}});
    }
    if (method == "resetAll") {
      backend_.reset_all();
      emit_event("method=resetAll ok");
      return respond(nlohmann::json{{"reset", true}});
    }
    if (method == "subscribe") {
      if (subscription == nullptr) {
        return respond_error(rpc_error::kMethodNotFound,
                             "subscribe is not available on this connection");
      }
      *subscription = backend_.subscribe();
      emit_event("method=subscribe id=" +
                 std::to_string((*subscription)->id()));
      return respond(nlohmann::json{{"subscribed", true}});
    }
    return respond_error(rpc_error::kMethodNotFound, "Method not found");
  } catch (const ConfigurationError &e) {
    return respond_error(rpc_error::kInvalidParams, e.what());
  } catch (const NotFoundError &e) {
    return respond_error(rpc_error::kNotFound, e.what());
  } catch (const std::exception &e) {
    control_log()->error("Exception while handling control request: {}",
                         e.what());
    return respond_error(rpc_error::kInternalError, e.what());
  }
}

void ControlServer::reset() { running_.store(true); }

bool ControlServer::running() const { return running_.load(); }

void ControlServer::set_event_callback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(event_mutex_);
  event_callback_ = std::move(cb);
}

void ControlServer::set_shutdown_handler(std::function<void()> handler) {
  std::lock_guard<std::mutex> lock(event_mutex_);
  shutdown_handler_ = std::move(handler);
}

void ControlServer::emit_event(const std::string &message) const {
  control_log()->debug("{}", message);
  EventCallback callback;
  {
    std::lock_guard<std::mutex> lock(event_mutex_);
    callback = event_callback_;
  }
  if (callback) {
    callback(message);
  }
}

ControlServerRunner::ControlServerRunner(ControlServer &server,
                                         ControlServerOptions options)
    : server_(server), options_(std::move(options)) {}

ControlServerRunner::~ControlServerRunner() { stop(); }

void ControlServerRunner::start() {
  if (running_) {
    return;
  }
  auto fail = [](int fd, const std::string &what) {
    int err = errno;
    if (fd >= 0) {
      ::close(fd);
    }
    throw std::runtime_error(what + ": " +
                             std::system_category().message(err));
  };

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    fail(fd, "Failed to create control socket");
  }
  int enable = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (options_.bind_address.empty() || options_.bind_address == "*") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, options_.bind_address.c_str(),
                       &addr.sin_addr) != 1) {
    ::close(fd);
    throw std::runtime_error("Invalid control bind address '" +
                             options_.bind_address + "'");
  }
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    fail(fd, "Failed to bind control socket");
  }
  if (::listen(fd, options_.backlog) < 0) {
    fail(fd, "Failed to listen on control socket");
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) ==
      0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  listener_ = fd;
  stop_requested_ = false;
  server_.reset();
  running_ = true;
  control_log()->info("Control socket listening on {}:{}",
                      options_.bind_address.empty() ? "0.0.0.0"
                                                    : options_.bind_address,
                      bound_port_.load());
  thread_ = std::thread([this] { accept_loop(); });
}

void ControlServerRunner::wake_listener() {
  int fd = listener_.load();
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
  }
}

void ControlServerRunner::stop() {
  stop_requested_ = true;
  wake_listener();
  if (thread_.joinable()) {
    thread_.join();
  }
  reap_clients(true);
  running_ = false;
}

std::size_t ControlServerRunner::client_count() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  std::size_t count = 0;
  for (const auto &client : clients_) {
    if (!client.done) {
      ++count;
    }
  }
  return count;
}

void ControlServerRunner::reap_clients(bool all) {
  std::list<Client> finished;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (all || it->done) {
        if (all && !it->done) {
          ::shutdown(it->fd, SHUT_RDWR);
        }
        auto next = std::next(it);
        finished.splice(finished.end(), clients_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  for (auto &client : finished) {
    if (client.thread.joinable()) {
      client.thread.join();
    }
    ::close(client.fd);
  }
}

void ControlServerRunner::accept_loop() {
  while (!stop_requested_) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int fd = ::accept(listener_, reinterpret_cast<sockaddr *>(&client_addr),
                      &client_len);
    if (fd < 0) {
      if (stop_requested_) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      control_log()->error("accept failed: {}",
                           std::system_category().message(errno));
      break;
    }
    reap_clients(false);

    std::array<char, INET_ADDRSTRLEN> addr_buf{};
    const char *remote = inet_ntop(AF_INET, &client_addr.sin_addr,
                                   addr_buf.data(), addr_buf.size());
    std::string remote_str =
        (remote != nullptr ? std::string(remote) : std::string{"unknown"}) +
        ":" + std::to_string(ntohs(client_addr.sin_port));

    if (options_.max_clients > 0 &&
        client_count() >= static_cast<std::size_t>(options_.max_clients)) {
      control_log()->warn("Rejecting {}: {} clients connected", remote_str,
                          options_.max_clients);
      send_line(fd, server_
                        .make_error(nullptr, rpc_error::kTooManyClients,
                                    "Too many clients")
                        .dump());
      ::close(fd);
      continue;
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.emplace_back();
    Client &client = clients_.back();
    client.fd = fd;
    client.remote = remote_str;
    client.thread = std::thread([this, &client] { serve_client(client); });
  }

  int fd = listener_.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
  control_log()->info("Control socket stopped");
}

bool ControlServerRunner::send_line(int fd, const std::string &line) {
  std::string serialized = line;
  serialized.push_back('\n');
  const char *data = serialized.data();
  std::size_t remaining = serialized.size();
  while (remaining > 0) {
    ssize_t sent = ::send(fd, data, remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (sent < 0 && errno == EINTR) {
        continue;
      }
      return false;
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

void ControlServerRunner::serve_client(Client &client) {
  control_log()->debug("client connected: {}", client.remote);
  std::unique_ptr<Subscription> subscription;
  std::string buffer;
  buffer.reserve(4096);
  bool active = true;
  while (active && !stop_requested_) {
    if (subscription) {
      while (auto event = subscription->try_next()) {
        if (!send_line(client.fd, make_update_notification(*event).dump())) {
          active = false;
          break;
        }
      }
      if (!active) {
        break;
      }
      if (subscription->closed()) {
        control_log()->warn("Dropping subscriber {} ({}): {}",
                            subscription->id(), client.remote,
                            subscription->overflowed() ? "queue overflow"
                                                       : "stream closed");
        break;
      }
    }

    pollfd pfd{};
    pfd.fd = client.fd;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, subscription ? 50 : 250);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    std::array<char, 4096> chunk{};
    ssize_t received = ::recv(client.fd, chunk.data(), chunk.size(), 0);
    if (received <= 0) {
      break;
    }
    buffer.append(chunk.data(), static_cast<std::size_t>(received));
    std::size_t newline_pos = 0;
    while ((newline_pos = buffer.find('\n')) != std::string::npos) {
      std::string payload = buffer.substr(0, newline_pos);
      buffer.erase(0, newline_pos + 1);
      if (!payload.empty() && payload.back() == '\r') {
        payload.pop_back();
      }
      if (payload.empty()) {
        continue;
      }
      control_log()->trace("request from {}: {}", client.remote, payload);
      nlohmann::json response;
      try {
        auto request = nlohmann::json::parse(payload);
        response = server_.handle_request(
            request, subscription ? nullptr : &subscription);
      } catch (const nlohmann::json::parse_error &e) {
        control_log()->debug("parse error from {}: {}", client.remote,
                             e.what());
        response = server_.make_error(nullptr, rpc_error::kParseError,
                                      e.what());
      }
      if (!response.is_null() && !send_line(client.fd, response.dump())) {
        active = false;
        break;
      }
      if (!server_.running()) {
        stop_requested_ = true;
        wake_listener();
        active = false;
        break;
      }
    }
  }
  if (subscription) {
    subscription->close();
  }
  ::shutdown(client.fd, SHUT_RDWR);
  control_log()->debug("client disconnected: {}", client.remote);
  client.done = true;
}

} // namespace sitewatch
