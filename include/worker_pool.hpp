/**
 * @file worker_pool.hpp
 * @brief Fixed thread pool executing fetch cycles with optional rate limiting.
 *
 * Defines the WorkerPool class, which runs submitted jobs on a fixed set of
 * worker threads, spaces job starts with a token bucket when a global request
 * rate is configured and keeps throughput statistics for logging.
 */
#ifndef SITEWATCH_WORKER_POOL_HPP
#define SITEWATCH_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace sitewatch {

/**
 * Thread pool executing submitted jobs across multiple workers while
 * enforcing a maximum start rate using a token bucket.
 */
class WorkerPool {
public:
  /**
   * Construct the pool. Threads start with start().
   *
   * @param workers Number of worker threads (minimum 1).
   * @param max_rate Maximum job starts per minute (0 = unlimited).
   * @param smoothing_factor Exponential moving-average factor in (0, 1]
   *        applied to throughput sampling.
   */
  WorkerPool(int workers, int max_rate, double smoothing_factor = 0.2);

  /// Stops the worker threads.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Start the worker threads.
  void start();

  /// Stop the workers. Queued jobs that have not started are discarded.
  void stop();

  /// Whether the worker threads are running.
  bool running() const { return running_; }

  /**
   * Queue a job.
   *
   * Exceptions derived from std::exception escaping the job are logged.
   *
   * @return false when the pool is stopped and the job was dropped.
   */
  bool submit(std::function<void()> job);

  /// Adjust the requests-per-minute ceiling (0 disables the limiter).
  void set_max_rate(int max_rate);

  /// Exponentially smoothed job starts per minute.
  double smoothed_requests_per_minute() const;

  /// Queued plus running jobs.
  std::size_t outstanding_jobs() const;

  /// Jobs finished since start.
  std::size_t completed_jobs() const {
    return completed_.load(std::memory_order_relaxed);
  }

  /// Estimated time to drain the outstanding jobs, if it can be computed.
  std::optional<std::chrono::seconds> estimate_clearance_time() const;

  /**
   * Configure a backlog alert.
   *
   * @param job_threshold Minimum outstanding jobs before alerting.
   * @param clearance_threshold Minimum estimated clearance time.
   * @param cb Callback receiving the backlog size and clearance estimate; it
   *        fires at most once every 30 seconds.
   */
  void
  set_backlog_alert(std::size_t job_threshold,
                    std::chrono::seconds clearance_threshold,
                    std::function<void(std::size_t, std::chrono::seconds)> cb);

  int workers() const { return workers_; }

private:
  void worker();
  bool acquire_token();
  void record_execution();
  void check_backlog();

  int workers_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;

  // Token bucket
  std::mutex rate_mutex_;
  std::condition_variable rate_cv_;
  int max_rate_;
  std::chrono::steady_clock::duration min_interval_{};
  std::chrono::steady_clock::time_point next_allowed_{};

  // Statistics
  double smoothing_factor_;
  mutable std::mutex stats_mutex_;
  std::chrono::steady_clock::time_point last_execution_{};
  double ema_rpm_{0.0};
  std::atomic<std::size_t> queued_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> completed_{0};

  // Backlog alerting
  std::mutex backlog_mutex_;
  std::size_t backlog_job_threshold_{0};
  std::chrono::seconds backlog_time_threshold_{0};
  std::function<void(std::size_t, std::chrono::seconds)> backlog_callback_;
  std::chrono::steady_clock::time_point last_backlog_alert_{};
  std::chrono::seconds backlog_alert_cooldown_{std::chrono::seconds(30)};
};

} // namespace sitewatch

#endif // SITEWATCH_WORKER_POOL_HPP
