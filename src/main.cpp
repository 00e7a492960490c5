#include "app.hpp"
#include "broadcaster.hpp"
#include "content_hasher.hpp"
#include "control_server.hpp"
#include "delay_policy.hpp"
#include "errors.hpp"
#include "fetcher.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "scheduler.hpp"
#include "site_store.hpp"
#include "util/duration.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    sitewatch::ensure_default_logger();
    return sitewatch::category_logger("main");
  }();
  return logger;
}

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

int run_service(const sitewatch::CliOptions &opts,
                const sitewatch::Config &cfg) {
  using namespace sitewatch;

  SiteStore store(cfg.database_path(), cfg.update_cache_size());
  main_log()->info("Using database {}", cfg.database_path());
  if (opts.reset_db) {
    store.reset_all();
    main_log()->warn("Database reset requested; all sites and updates "
                     "were deleted");
  }

  Broadcaster broadcaster(static_cast<std::size_t>(cfg.subscriber_queue_size()));
  FetcherOptions fetch_options;
  fetch_options.max_content_bytes = cfg.max_content_bytes();
  fetch_options.http_proxy = cfg.http_proxy();
  fetch_options.https_proxy = cfg.https_proxy();
  fetch_options.user_agents = cfg.user_agents();
  Fetcher fetcher(fetch_options);
  ContentHasher hasher(cfg.normalize_content());
  DelayPolicy policy(std::chrono::milliseconds(cfg.interval_jitter_max_ms()),
                     cfg.max_backoff());

  WorkerPool pool(cfg.workers(), cfg.max_request_rate());
  pool.set_backlog_alert(
      static_cast<std::size_t>(cfg.workers()) * 4, std::chrono::seconds(30),
      [](std::size_t jobs, std::chrono::seconds clearance) {
        main_log()->warn("{} fetch cycle(s) waiting; backlog clears in about "
                         "{}",
                         jobs,
                         format_duration(std::chrono::duration_cast<
                                         std::chrono::milliseconds>(clearance)));
      });

  SchedulerOptions scheduler_options;
  scheduler_options.fetch_timeout = std::chrono::seconds(cfg.http_timeout());
  scheduler_options.preview_length =
      static_cast<std::size_t>(cfg.preview_length());
  Scheduler scheduler(store, broadcaster, fetcher, hasher, policy, pool,
                      scheduler_options);

  RegistryDefaults defaults;
  defaults.interval_secs = cfg.default_interval_secs();
  defaults.style = cfg.default_style();
  Registry registry(store, scheduler, defaults);

  std::size_t loaded = registry.load();
  if (loaded == 0 && !cfg.default_sites().empty()) {
    std::size_t seeded = registry.seed(cfg.default_sites());
    main_log()->info("Seeded {} default site(s)", seeded);
  }

  pool.start();
  scheduler.start();

  RegistryBackend backend(registry, store, broadcaster, cfg.default_sites());
  ControlServer control(backend);
  control.set_shutdown_handler([] { g_stop_requested = true; });
  std::unique_ptr<ControlServerRunner> runner;
  if (cfg.control_enabled()) {
    ControlServerOptions control_options;
    control_options.bind_address = cfg.control_bind_address();
    control_options.port = cfg.control_port();
    control_options.max_clients = cfg.control_max_clients();
    runner = std::make_unique<ControlServerRunner>(control, control_options);
    runner->start();
  }

  main_log()->info("Monitoring {} site(s) with {} worker(s)", registry.size(),
                   cfg.workers());
  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  main_log()->info("Shutting down");
  if (runner) {
    runner->stop();
  }
  scheduler.stop();
  pool.stop();
  broadcaster.close_all();
  return 0;
}
} // namespace

/**
 * Program entry point: resolve configuration, start the monitor and run
 * until SIGINT, SIGTERM or a `shutdown` request.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code.
 */
int main(int argc, char **argv) {
  sitewatch::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  install_signal_handlers();
  try {
    ret = run_service(app.options(), app.config());
  } catch (const sitewatch::StorageError &e) {
    main_log()->critical("Storage failure: {}", e.what());
    ret = 1;
  } catch (const std::exception &e) {
    main_log()->critical("Fatal error: {}", e.what());
    ret = 1;
  }
  spdlog::shutdown();
  return ret;
}
