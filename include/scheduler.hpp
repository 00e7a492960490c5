/**
 * @file scheduler.hpp
 * @brief Per-site polling tasks multiplexed over a worker pool.
 *
 * Each scheduled site owns one task that cycles through
 * `Scheduled -> Fetching -> Changed | Unchanged | Failed -> Scheduled` until
 * it is cancelled. A single timer thread tracks when every task is due and
 * hands due cycles to the WorkerPool, so hundreds of sites need neither one
 * thread each nor block one another.
 */
#ifndef SITEWATCH_SCHEDULER_HPP
#define SITEWATCH_SCHEDULER_HPP

#include "broadcaster.hpp"
#include "content_hasher.hpp"
#include "delay_policy.hpp"
#include "fetcher.hpp"
#include "site_state.hpp"
#include "site_store.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sitewatch {

/// Result of one polling cycle.
enum class CycleOutcome { Changed, Unchanged, Failed, Discarded };

const char *to_string(CycleOutcome outcome);

/// Summary returned by Scheduler::poll_now().
struct CycleReport {
  CycleOutcome outcome = CycleOutcome::Discarded;
  std::chrono::milliseconds next_delay{0};
  std::optional<UpdateId> update_id;
};

/// Tunables of the polling loop.
struct SchedulerOptions {
  std::chrono::milliseconds fetch_timeout{std::chrono::seconds(10)};
  std::size_t preview_length = 400;
  /// Interval of the periodic statistics log line.
  std::chrono::seconds stats_interval{std::chrono::minutes(1)};
};

/**
 * Drives one independent polling task per site.
 *
 * Effects of a cycle (store writes, state transitions, broadcasts) are only
 * applied while the task is not cancelled. cancel() waits for a cycle that is
 * already running on a worker, so after it returns no further effect of that
 * site can happen. A cycle still queued in the pool is dropped when a worker
 * picks it up and never fetches.
 */
class Scheduler {
public:
  Scheduler(SiteStore &store, Broadcaster &broadcaster, const Fetcher &fetcher,
            const ContentHasher &hasher, DelayPolicy policy, WorkerPool &pool,
            SchedulerOptions options = {});
  ~Scheduler();
  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /// Start the timer thread.
  void start();

  /// Cancel every task and stop the timer thread.
  void stop();

  /**
   * Start polling a site.
   *
   * @param state Shared runtime state of the site.
   * @param initial_delay Delay before the first cycle.
   * @return false when a task for the same id already exists.
   */
  bool schedule(std::shared_ptr<SiteState> state,
                std::chrono::milliseconds initial_delay =
                    std::chrono::milliseconds{0});

  /**
   * Cancel the task of @p id and wait for a running cycle to finish.
   * A running transfer is aborted; a queued cycle is not waited for.
   * Unknown ids are ignored.
   *
   * @return true when a task was cancelled.
   */
  bool cancel(SiteId id);

  /// Cancel every task, waiting for running cycles.
  void cancel_all();

  /// Whether a task exists for @p id.
  bool is_scheduled(SiteId id) const;

  /// Number of scheduled tasks.
  std::size_t task_count() const;

  /**
   * Run one cycle of @p id on the calling thread without rescheduling.
   *
   * @return Report of the cycle, or `std::nullopt` when no such task exists
   *         or a cycle of the same site is already running.
   */
  std::optional<CycleReport> poll_now(SiteId id);

private:
  struct Task {
    explicit Task(std::shared_ptr<SiteState> s) : state(std::move(s)) {}
    std::shared_ptr<SiteState> state;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> abort{false};
    /// A cycle is queued or running; guarded by Scheduler::mutex_.
    bool pending{false};
    /// The cycle has started on a thread; guarded by run_mutex.
    bool running{false};
    std::mutex run_mutex;
    std::condition_variable run_cv;
  };

  struct Due {
    std::chrono::steady_clock::time_point when;
    std::uint64_t sequence;
    std::shared_ptr<Task> task;
    bool operator>(const Due &other) const {
      if (when != other.when) {
        return when > other.when;
      }
      return sequence > other.sequence;
    }
  };

  void timer_loop();
  void dispatch(const std::shared_ptr<Task> &task);
  static bool begin_run(Task &task);
  static void end_run(Task &task);
  static void cancel_and_wait(Task &task);
  void finish_cycle(const std::shared_ptr<Task> &task,
                    std::chrono::milliseconds delay);
  void enqueue_locked(const std::shared_ptr<Task> &task,
                      std::chrono::milliseconds delay);
  CycleReport run_cycle(Task &task);
  void log_stats();

  SiteStore &store_;
  Broadcaster &broadcaster_;
  const Fetcher &fetcher_;
  const ContentHasher &hasher_;
  DelayPolicy policy_;
  WorkerPool &pool_;
  SchedulerOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable timer_cv_;
  std::unordered_map<SiteId, std::shared_ptr<Task>> tasks_;
  std::priority_queue<Due, std::vector<Due>, std::greater<Due>> due_;
  std::uint64_t sequence_{0};
  bool running_{false};
  std::thread timer_;
  std::chrono::steady_clock::time_point last_stats_{};

  std::atomic<std::uint64_t> cycles_{0};
  std::atomic<std::uint64_t> changes_{0};
  std::atomic<std::uint64_t> failures_{0};
};

} // namespace sitewatch

#endif // SITEWATCH_SCHEDULER_HPP
