#include "broadcaster.hpp"
#include "log.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace sitewatch {

namespace {

std::shared_ptr<spdlog::logger> broadcast_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("broadcast");
  }();
  return logger;
}

void close_channel(detail::Channel &channel) {
  {
    std::lock_guard<std::mutex> lock(channel.mutex);
    channel.closed = true;
  }
  channel.cv.notify_all();
}

} // namespace

Subscription::Subscription(std::shared_ptr<detail::Channel> channel)
    : channel_(std::move(channel)) {}

Subscription::~Subscription() { close(); }

std::optional<UpdateEvent>
Subscription::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(channel_->mutex);
  channel_->cv.wait_for(lock, timeout, [this] {
    return !channel_->queue.empty() || channel_->closed;
  });
  if (channel_->queue.empty()) {
    return std::nullopt;
  }
  UpdateEvent event = std::move(channel_->queue.front());
  channel_->queue.pop_front();
  return event;
}

std::optional<UpdateEvent> Subscription::try_next() {
  std::lock_guard<std::mutex> lock(channel_->mutex);
  if (channel_->queue.empty()) {
    return std::nullopt;
  }
  UpdateEvent event = std::move(channel_->queue.front());
  channel_->queue.pop_front();
  return event;
}

void Subscription::close() { close_channel(*channel_); }

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(channel_->mutex);
  return channel_->closed;
}

bool Subscription::overflowed() const {
  std::lock_guard<std::mutex> lock(channel_->mutex);
  return channel_->overflowed;
}

std::size_t Subscription::pending() const {
  std::lock_guard<std::mutex> lock(channel_->mutex);
  return channel_->queue.size();
}

Broadcaster::Broadcaster(std::size_t queue_capacity)
    : capacity_(std::max<std::size_t>(queue_capacity, 1)) {}

Broadcaster::~Broadcaster() { close_all(); }

std::unique_ptr<Subscription> Broadcaster::subscribe() {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  prune_locked();
  auto channel = std::make_shared<detail::Channel>(next_id_++, capacity_);
  subscribers_.push_back(channel);
  broadcast_log()->debug("Subscriber {} connected ({} open)", channel->id,
                         subscribers_.size());
  return std::make_unique<Subscription>(std::move(channel));
}

std::size_t Broadcaster::publish(const UpdateEvent &event) {
  std::lock_guard<std::mutex> publish_lock(publish_mutex_);
  std::vector<std::shared_ptr<detail::Channel>> snapshot;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    snapshot = subscribers_;
  }
  std::size_t delivered = 0;
  bool dropped = false;
  for (const auto &channel : snapshot) {
    bool overflow = false;
    {
      std::lock_guard<std::mutex> lock(channel->mutex);
      if (channel->closed) {
        dropped = true;
        continue;
      }
      if (channel->queue.size() >= channel->capacity) {
        channel->overflowed = true;
        channel->closed = true;
        overflow = true;
      } else {
        channel->queue.push_back(event);
        ++delivered;
      }
    }
    channel->cv.notify_all();
    if (overflow) {
      dropped = true;
      broadcast_log()->warn("Subscriber {} fell behind ({} queued events); "
                            "disconnecting",
                            channel->id, channel->capacity);
    }
  }
  if (dropped) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    prune_locked();
  }
  broadcast_log()->trace("Published update {} of site {} to {} subscriber(s)",
                         event.update_id, event.site_id, delivered);
  return delivered;
}

std::size_t Broadcaster::subscriber_count() const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  return static_cast<std::size_t>(
      std::count_if(subscribers_.begin(), subscribers_.end(),
                    [](const std::shared_ptr<detail::Channel> &channel) {
                      std::lock_guard<std::mutex> channel_lock(channel->mutex);
                      return !channel->closed;
                    }));
}

void Broadcaster::close_all() {
  std::vector<std::shared_ptr<detail::Channel>> channels;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    channels.swap(subscribers_);
  }
  for (const auto &channel : channels) {
    close_channel(*channel);
  }
}

void Broadcaster::prune_locked() {
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [](const std::shared_ptr<detail::Channel> &channel) {
                       std::lock_guard<std::mutex> lock(channel->mutex);
                       return channel->closed;
                     }),
      subscribers_.end());
}

} // namespace sitewatch
