/**
 * @file scheduler.cpp
 * @brief Polling loop, change detection and task lifecycle.
 */
#include "scheduler.hpp"
#include "content_filter.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> scheduler_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("scheduler");
  }();
  return logger;
}

} // namespace

const char *to_string(CycleOutcome outcome) {
  switch (outcome) {
  case CycleOutcome::Changed:
    return "changed";
  case CycleOutcome::Unchanged:
    return "unchanged";
  case CycleOutcome::Failed:
    return "failed";
  case CycleOutcome::Discarded:
    return "discarded";
  }
  return "discarded";
}

Scheduler::Scheduler(SiteStore &store, Broadcaster &broadcaster,
                     const Fetcher &fetcher, const ContentHasher &hasher,
                     DelayPolicy policy, WorkerPool &pool,
                     SchedulerOptions options)
    : store_(store), broadcaster_(broadcaster), fetcher_(fetcher),
      hasher_(hasher), policy_(std::move(policy)), pool_(pool),
      options_(options) {}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  last_stats_ = std::chrono::steady_clock::now();
  timer_ = std::thread([this] { timer_loop(); });
  scheduler_log()->debug("Scheduler started with {} task(s)", tasks_.size());
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  timer_cv_.notify_all();
  if (timer_.joinable()) {
    timer_.join();
  }
  cancel_all();
}

bool Scheduler::schedule(std::shared_ptr<SiteState> state,
                         std::chrono::milliseconds initial_delay) {
  const SiteId id = state->id();
  std::lock_guard<std::mutex> lock(mutex_);
  if (tasks_.count(id) != 0) {
    scheduler_log()->warn("Site {} is already scheduled", id);
    return false;
  }
  auto task = std::make_shared<Task>(std::move(state));
  tasks_.emplace(id, task);
  enqueue_locked(task, initial_delay);
  timer_cv_.notify_one();
  scheduler_log()->debug("Scheduled site {} (first poll in {} ms)", id,
                         initial_delay.count());
  return true;
}

bool Scheduler::cancel(SiteId id) {
  std::shared_ptr<Task> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return false;
    }
    task = it->second;
    tasks_.erase(it);
  }
  cancel_and_wait(*task);
  scheduler_log()->debug("Cancelled site {}", id);
  return true;
}

void Scheduler::cancel_all() {
  std::vector<std::shared_ptr<Task>> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks.reserve(tasks_.size());
    for (auto &entry : tasks_) {
      tasks.push_back(entry.second);
    }
    tasks_.clear();
    while (!due_.empty()) {
      due_.pop();
    }
  }
  for (auto &task : tasks) {
    task->cancelled = true;
    task->abort = true;
  }
  for (auto &task : tasks) {
    cancel_and_wait(*task);
  }
  if (!tasks.empty()) {
    scheduler_log()->debug("Cancelled {} task(s)", tasks.size());
  }
}

void Scheduler::cancel_and_wait(Task &task) {
  std::unique_lock<std::mutex> lock(task.run_mutex);
  task.cancelled = true;
  task.abort = true;
  if (task.running) {
    scheduler_log()->debug("Waiting for running cycle of site {}",
                           task.state->id());
  }
  task.run_cv.wait(lock, [&task] { return !task.running; });
}

bool Scheduler::begin_run(Task &task) {
  std::lock_guard<std::mutex> lock(task.run_mutex);
  if (task.cancelled) {
    return false;
  }
  task.running = true;
  return true;
}

void Scheduler::end_run(Task &task) {
  {
    std::lock_guard<std::mutex> lock(task.run_mutex);
    task.running = false;
  }
  task.run_cv.notify_all();
}

bool Scheduler::is_scheduled(SiteId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.count(id) != 0;
}

std::size_t Scheduler::task_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

std::optional<CycleReport> Scheduler::poll_now(SiteId id) {
  std::shared_ptr<Task> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second->pending) {
      return std::nullopt;
    }
    task = it->second;
    task->pending = true;
  }
  struct PendingGuard {
    Scheduler &self;
    Task &task;
    ~PendingGuard() {
      std::lock_guard<std::mutex> lock(self.mutex_);
      task.pending = false;
    }
  } pending{*this, *task};
  if (!begin_run(*task)) {
    return std::nullopt;
  }
  struct RunGuard {
    Task &task;
    ~RunGuard() { end_run(task); }
  } running{*task};
  return run_cycle(*task);
}

void Scheduler::enqueue_locked(const std::shared_ptr<Task> &task,
                               std::chrono::milliseconds delay) {
  due_.push(Due{std::chrono::steady_clock::now() + delay, sequence_++, task});
}

void Scheduler::timer_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    auto now = std::chrono::steady_clock::now();
    if (now - last_stats_ >= options_.stats_interval) {
      last_stats_ = now;
      lock.unlock();
      log_stats();
      lock.lock();
      continue;
    }
    auto wake = last_stats_ + options_.stats_interval;
    if (due_.empty() || due_.top().when > now) {
      if (!due_.empty()) {
        wake = std::min(wake, due_.top().when);
      }
      timer_cv_.wait_until(lock, wake);
      continue;
    }
    Due next = due_.top();
    due_.pop();
    if (next.task->cancelled) {
      continue;
    }
    if (next.task->pending) {
      // A manual poll is running; try again shortly.
      enqueue_locked(next.task, std::chrono::milliseconds(100));
      continue;
    }
    next.task->pending = true;
    lock.unlock();
    dispatch(next.task);
    lock.lock();
  }
}

void Scheduler::dispatch(const std::shared_ptr<Task> &task) {
  bool accepted = pool_.submit([this, task] {
    // A task cancelled while queued is dropped without touching the
    // scheduler, which may already be gone.
    if (!begin_run(*task)) {
      return;
    }
    CycleReport report;
    try {
      report = run_cycle(*task);
    } catch (const std::exception &e) {
      const Site site = task->state->snapshot();
      scheduler_log()->error("Cycle of site {} aborted: {}", site.id,
                             e.what());
      report.next_delay = std::chrono::seconds(site.interval_secs);
    }
    finish_cycle(task, report.next_delay);
  });
  if (!accepted) {
    std::lock_guard<std::mutex> lock(mutex_);
    task->pending = false;
    scheduler_log()->debug("Worker pool stopped; site {} not polled",
                           task->state->id());
  }
}

void Scheduler::finish_cycle(const std::shared_ptr<Task> &task,
                             std::chrono::milliseconds delay) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task->pending = false;
    if (!task->cancelled && running_) {
      enqueue_locked(task, delay);
    }
  }
  timer_cv_.notify_one();
  end_run(*task);
}

CycleReport Scheduler::run_cycle(Task &task) {
  const Site site = task.state->snapshot();
  CycleReport report;
  if (task.cancelled) {
    return report;
  }

  FetchResult result =
      fetcher_.fetch(site.url, options_.fetch_timeout, &task.abort);
  if (task.cancelled) {
    scheduler_log()->debug("Site {} cancelled during fetch; result discarded",
                           site.id);
    return report;
  }

  const Timestamp now = now_ms();
  bool success = false;
  if (result.success) {
    const std::string &body = *result.content;
    try {
      std::string hash = hasher_.fingerprint(body);
      auto previous = task.state->last_hash();
      if (previous && *previous == hash) {
        if (!store_.record_check(site.id, SiteStatus::Ok, now)) {
          scheduler_log()->debug("Site {} missing from store", site.id);
        }
        task.state->mark_unchanged(now);
        report.outcome = CycleOutcome::Unchanged;
      } else {
        Update update;
        update.site_id = site.id;
        update.timestamp = now;
        update.content_hash = hash;
        update.content = body;
        UpdateId update_id = store_.append_update(site.id, update);
        task.state->mark_changed(hash, now);
        report.outcome = CycleOutcome::Changed;
        report.update_id = update_id;

        UpdateEvent event;
        event.update_id = update_id;
        event.site_id = site.id;
        event.url = site.url;
        event.timestamp = now;
        event.content_hash = hash;
        event.content_preview = make_preview(body, options_.preview_length);
        event.has_full_content = true;
        std::size_t delivered = broadcaster_.publish(event);
        changes_.fetch_add(1, std::memory_order_relaxed);
        scheduler_log()->info("Change detected on {} (site {}, update {}, "
                              "{} subscriber(s))",
                              site.url, site.id, update_id, delivered);
      }
      success = true;
    } catch (const NotFoundError &e) {
      scheduler_log()->debug("Site {} vanished before its change was stored: "
                             "{}",
                             site.id, e.what());
      report.next_delay = std::chrono::seconds(site.interval_secs);
      return report;
    } catch (const StorageError &e) {
      scheduler_log()->warn("Storing result of site {} failed: {}", site.id,
                            e.what());
    } catch (const std::runtime_error &e) {
      scheduler_log()->error("Fingerprinting site {} failed: {}", site.id,
                             e.what());
    }
  } else {
    scheduler_log()->debug("Fetch of {} (site {}) failed: {}", site.url,
                           site.id, result.error.value_or("unknown error"));
  }

  if (!success) {
    report.outcome = CycleOutcome::Failed;
    failures_.fetch_add(1, std::memory_order_relaxed);
    try {
      store_.record_check(site.id, SiteStatus::Error, now);
    } catch (const StorageError &e) {
      scheduler_log()->warn("Recording failure of site {} failed: {}",
                            site.id, e.what());
    }
    task.state->mark_failed(now);
  }

  int backoff = site.current_backoff_secs;
  report.next_delay =
      policy_.next_delay(site.style, site.interval_secs, success, backoff);
  task.state->set_current_backoff(backoff);
  cycles_.fetch_add(1, std::memory_order_relaxed);
  scheduler_log()->trace("Site {} cycle {}; next poll in {} ms", site.id,
                         to_string(report.outcome), report.next_delay.count());
  return report;
}

void Scheduler::log_stats() {
  scheduler_log()->info(
      "{} site task(s), {} cycle(s), {} change(s), {} failure(s); "
      "{} job(s) outstanding at {:.1f} rpm",
      task_count(), cycles_.load(), changes_.load(), failures_.load(),
      pool_.outstanding_jobs(), pool_.smoothed_requests_per_minute());
}

} // namespace sitewatch
