/**
 * @file control_server.hpp
 * @brief Line-delimited JSON-RPC control socket for sitewatch.
 *
 * Declares the backend interface the control socket talks to, the request
 * handler and the TCP runner that serves clients and live update streams.
 */

#ifndef SITEWATCH_CONTROL_SERVER_HPP
#define SITEWATCH_CONTROL_SERVER_HPP

#include "broadcaster.hpp"
#include "registry.hpp"
#include "site.hpp"
#include "site_store.hpp"
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sitewatch {

/**
 * Operations exposed through the control socket.
 */
class WatchBackend {
public:
  virtual ~WatchBackend() = default;

  virtual std::vector<Site> list_sites() = 0;

  /// Add a site; throws ConfigurationError when rejected.
  virtual Site add_site(const SiteSpec &spec) = 0;

  /// Remove a site; returns false when it did not exist.
  virtual bool remove_site(SiteId id) = 0;

  /// Fetch one stored update; throws NotFoundError for an unknown site.
  virtual std::optional<Update> get_update(SiteId site_id, UpdateId id) = 0;

  /// Fetch the update recorded at @p when.
  virtual std::optional<Update> get_update_at(SiteId site_id,
                                              Timestamp when) = 0;

  /// Stored updates of a site, oldest first.
  virtual std::vector<Update> list_updates(SiteId site_id) = 0;

  /// Wipe every site and update, then re-seed the defaults.
  virtual void reset_all() = 0;

  /// Open a live stream of update events.
  virtual std::unique_ptr<Subscription> subscribe() = 0;
};

/**
 * Backend wired to the running Registry, store and broadcaster.
 */
class RegistryBackend : public WatchBackend {
public:
  RegistryBackend(Registry &registry, SiteStore &store,
                  Broadcaster &broadcaster,
                  std::vector<SiteSpec> default_sites = {});

  std::vector<Site> list_sites() override;
  Site add_site(const SiteSpec &spec) override;
  bool remove_site(SiteId id) override;
  std::optional<Update> get_update(SiteId site_id, UpdateId id) override;
  std::optional<Update> get_update_at(SiteId site_id, Timestamp when) override;
  std::vector<Update> list_updates(SiteId site_id) override;
  void reset_all() override;
  std::unique_ptr<Subscription> subscribe() override;

private:
  void require_site(SiteId site_id) const;

  Registry &registry_;
  SiteStore &store_;
  Broadcaster &broadcaster_;
  std::vector<SiteSpec> default_sites_;
};

/// JSON-RPC error codes used by the control socket.
namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kNotFound = -32004;
constexpr int kTooManyClients = -32000;
} // namespace rpc_error

/**
 * JSON-RPC 2.0 request handler.
 */
class ControlServer {
public:
  explicit ControlServer(WatchBackend &backend);

  /**
   * Process a single request object.
   *
   * @param request Parsed request.
   * @param subscription Receives the opened stream for `subscribe`; when
   *        null, `subscribe` is rejected.
   * @return Response object, or null for notifications.
   */
  nlohmann::json handle_request(
      const nlohmann::json &request,
      std::unique_ptr<Subscription> *subscription = nullptr);

  /// Reset to an accepting state.
  void reset();

  /// False once `shutdown` was requested.
  bool running() const;

  using EventCallback = std::function<void(const std::string &)>;

  /// Register a callback invoked whenever the server records an event.
  void set_event_callback(EventCallback cb);

  /// Register a callback invoked when a client requests `shutdown`.
  void set_shutdown_handler(std::function<void()> handler);

  nlohmann::json make_error(const nlohmann::json &id, int code,
                            const std::string &message) const;
  nlohmann::json make_result(const nlohmann::json &id,
                             const nlohmann::json &result) const;

private:
  void emit_event(const std::string &message) const;

  WatchBackend &backend_;
  std::atomic<bool> running_{true};
  mutable std::mutex event_mutex_;
  EventCallback event_callback_;
  std::function<void()> shutdown_handler_;
};

/// Build the push message carrying one update event.
nlohmann::json make_update_notification(const UpdateEvent &event);

struct ControlServerOptions {
  std::string bind_address{"127.0.0.1"};
  int port{7340};
  int backlog{16};
  int max_clients{16};
};

/**
 * TCP listener serving each control connection on its own thread.
 */
class ControlServerRunner {
public:
  ControlServerRunner(ControlServer &server, ControlServerOptions options);
  ~ControlServerRunner();
  ControlServerRunner(const ControlServerRunner &) = delete;
  ControlServerRunner &operator=(const ControlServerRunner &) = delete;

  /**
   * @brief Bind the listener and start accepting clients.
   * @throws std::runtime_error when the socket cannot be bound.
   */
  void start();
  /**
   * @brief Stop accepting, disconnect every client and join all threads.
   */
  void stop();
  bool running() const { return running_; }

  /// Port actually bound; differs from the option when it was 0.
  int port() const { return bound_port_; }

  /// Number of connected clients.
  std::size_t client_count() const;

private:
  struct Client {
    int fd{-1};
    std::string remote;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void accept_loop();
  void serve_client(Client &client);
  bool send_line(int fd, const std::string &line);
  void reap_clients(bool all);
  void wake_listener();

  ControlServer &server_;
  ControlServerOptions options_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<int> listener_{-1};
  std::atomic<int> bound_port_{0};
  mutable std::mutex clients_mutex_;
  std::list<Client> clients_;
};

} // namespace sitewatch

#endif // SITEWATCH_CONTROL_SERVER_HPP
