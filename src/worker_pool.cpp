#include "worker_pool.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> pool_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pool");
  }();
  return logger;
}

std::chrono::steady_clock::duration interval_for_rate(int max_rate) {
  if (max_rate <= 0) {
    return std::chrono::steady_clock::duration::zero();
  }
  auto interval =
      std::chrono::duration<double>(60.0 / static_cast<double>(max_rate));
  auto result =
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);
  if (result.count() <= 0) {
    result = std::chrono::nanoseconds(1);
  }
  return result;
}

} // namespace

WorkerPool::WorkerPool(int workers, int max_rate, double smoothing_factor)
    : workers_(std::max(1, workers)), max_rate_(std::max(0, max_rate)),
      min_interval_(interval_for_rate(max_rate)),
      next_allowed_(std::chrono::steady_clock::now()),
      smoothing_factor_(std::clamp(smoothing_factor, 0.01, 1.0)),
      last_execution_(std::chrono::steady_clock::time_point::min()),
      last_backlog_alert_(std::chrono::steady_clock::time_point::min()) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
    return;
  running_ = true;
  {
    std::lock_guard<std::mutex> rate_lock(rate_mutex_);
    next_allowed_ = std::chrono::steady_clock::now();
  }
  threads_.reserve(workers_);
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
  pool_log()->debug("Started {} worker(s), rate limit {} rpm", workers_,
                    max_rate_);
}

void WorkerPool::stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    running_ = false;
    std::size_t dropped = jobs_.size();
    std::queue<std::function<void()>>().swap(jobs_);
    queued_.store(0, std::memory_order_relaxed);
    threads.swap(threads_);
    if (dropped > 0) {
      pool_log()->debug("Discarded {} queued job(s) on stop", dropped);
    }
  }
  cv_.notify_all();
  {
    std::lock_guard<std::mutex> rate_lock(rate_mutex_);
  }
  rate_cv_.notify_all();
  for (auto &t : threads) {
    if (t.joinable())
      t.join();
  }
}

bool WorkerPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return false;
    }
    jobs_.push(std::move(job));
    queued_.fetch_add(1, std::memory_order_relaxed);
  }
  cv_.notify_one();
  check_backlog();
  return true;
}

void WorkerPool::set_max_rate(int max_rate) {
  std::lock_guard<std::mutex> lock(rate_mutex_);
  max_rate_ = std::max(0, max_rate);
  min_interval_ = interval_for_rate(max_rate_);
  next_allowed_ = std::chrono::steady_clock::now();
  rate_cv_.notify_all();
}

double WorkerPool::smoothed_requests_per_minute() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return ema_rpm_;
}

std::size_t WorkerPool::outstanding_jobs() const {
  return queued_.load(std::memory_order_relaxed) +
         in_flight_.load(std::memory_order_relaxed);
}

std::optional<std::chrono::seconds>
WorkerPool::estimate_clearance_time() const {
  auto outstanding = outstanding_jobs();
  if (outstanding == 0) {
    return std::chrono::seconds(0);
  }
  double rpm = smoothed_requests_per_minute();
  if (rpm <= std::numeric_limits<double>::epsilon()) {
    return std::nullopt;
  }
  double minutes = static_cast<double>(outstanding) / rpm;
  return std::chrono::seconds(
      static_cast<long>(std::ceil(std::max(0.0, minutes) * 60.0)));
}

void WorkerPool::set_backlog_alert(
    std::size_t job_threshold, std::chrono::seconds clearance_threshold,
    std::function<void(std::size_t, std::chrono::seconds)> cb) {
  std::lock_guard<std::mutex> lock(backlog_mutex_);
  backlog_job_threshold_ = job_threshold;
  backlog_time_threshold_ = clearance_threshold;
  backlog_callback_ = std::move(cb);
  last_backlog_alert_ = std::chrono::steady_clock::time_point::min();
}

/**
 * Wait for the token bucket to admit one job start.
 *
 * @return false when the pool stops while waiting.
 */
bool WorkerPool::acquire_token() {
  std::unique_lock<std::mutex> lock(rate_mutex_);
  while (running_) {
    if (min_interval_ <= std::chrono::steady_clock::duration::zero()) {
      return true;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= next_allowed_) {
      next_allowed_ = std::max(next_allowed_ + min_interval_, now);
      return true;
    }
    rate_cv_.wait_until(lock, next_allowed_);
  }
  return false;
}

void WorkerPool::worker() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (!running_)
        return;
      job = std::move(jobs_.front());
      jobs_.pop();
      queued_.fetch_sub(1, std::memory_order_relaxed);
      in_flight_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!acquire_token()) {
      in_flight_.fetch_sub(1, std::memory_order_relaxed);
      return;
    }
    try {
      job();
    } catch (const std::exception &e) {
      pool_log()->error("Job failed: {}", e.what());
    }
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
    completed_.fetch_add(1, std::memory_order_relaxed);
    record_execution();
    check_backlog();
  }
}

void WorkerPool::record_execution() {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(stats_mutex_);
  if (last_execution_ == std::chrono::steady_clock::time_point::min()) {
    last_execution_ = now;
    return;
  }
  auto delta = now - last_execution_;
  double minutes = std::chrono::duration<double>(delta).count() / 60.0;
  if (minutes <= std::numeric_limits<double>::epsilon()) {
    minutes = std::numeric_limits<double>::epsilon();
  }
  double rpm = 1.0 / minutes;
  if (ema_rpm_ <= 0.0) {
    ema_rpm_ = rpm;
  } else {
    ema_rpm_ = smoothing_factor_ * rpm + (1.0 - smoothing_factor_) * ema_rpm_;
  }
  last_execution_ = now;
}

void WorkerPool::check_backlog() {
  std::function<void(std::size_t, std::chrono::seconds)> callback;
  std::size_t outstanding = 0;
  std::chrono::seconds clearance{0};
  {
    std::lock_guard<std::mutex> lock(backlog_mutex_);
    if (!backlog_callback_ || backlog_job_threshold_ == 0)
      return;
    auto now = std::chrono::steady_clock::now();
    if (last_backlog_alert_ != std::chrono::steady_clock::time_point::min() &&
        now - last_backlog_alert_ < backlog_alert_cooldown_) {
      return;
    }
    outstanding = outstanding_jobs();
    if (outstanding < backlog_job_threshold_)
      return;
    auto estimate = estimate_clearance_time();
    if (!estimate || *estimate < backlog_time_threshold_)
      return;
    clearance = *estimate;
    last_backlog_alert_ = now;
    callback = backlog_callback_;
  }
  callback(outstanding, clearance);
}

} // namespace sitewatch
