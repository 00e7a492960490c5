/**
 * @file broadcaster.hpp
 * @brief Fan-out of update events to live subscribers.
 */
#ifndef SITEWATCH_BROADCASTER_HPP
#define SITEWATCH_BROADCASTER_HPP

#include "site.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sitewatch {

namespace detail {

/// Bounded event queue shared by a Subscription and the Broadcaster.
struct Channel {
  explicit Channel(std::uint64_t id, std::size_t capacity)
      : id(id), capacity(capacity) {}

  const std::uint64_t id;
  const std::size_t capacity;
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<UpdateEvent> queue;
  bool closed{false};
  bool overflowed{false};
};

} // namespace detail

/**
 * Receiving end of a subscription.
 *
 * Events arrive in publish order. The subscription closes when the consumer
 * calls close(), when it is destroyed, when the broadcaster shuts down, or
 * when its queue overflows; in the last case overflowed() reports true.
 * Events queued before closing can still be drained.
 */
class Subscription {
public:
  explicit Subscription(std::shared_ptr<detail::Channel> channel);
  ~Subscription();
  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  /**
   * Wait up to @p timeout for the next event.
   *
   * @return The event, or `std::nullopt` on timeout or once the
   *         subscription is closed and drained.
   */
  std::optional<UpdateEvent> next(std::chrono::milliseconds timeout);

  /// Next queued event without waiting.
  std::optional<UpdateEvent> try_next();

  /// Stop receiving events.
  void close();

  bool closed() const;
  bool overflowed() const;
  std::size_t pending() const;
  std::uint64_t id() const { return channel_->id; }

private:
  std::shared_ptr<detail::Channel> channel_;
};

/**
 * Distributes UpdateEvent values to every open subscription.
 *
 * publish() never waits for a consumer: each subscription has a bounded
 * queue and a subscription whose queue is full is closed and dropped.
 * Publishes are serialized so all subscribers observe the same order.
 */
class Broadcaster {
public:
  /// @param queue_capacity Per-subscriber queue bound (minimum 1).
  explicit Broadcaster(std::size_t queue_capacity = 64);
  ~Broadcaster();
  Broadcaster(const Broadcaster &) = delete;
  Broadcaster &operator=(const Broadcaster &) = delete;

  /// Open a subscription that receives events published from now on.
  std::unique_ptr<Subscription> subscribe();

  /**
   * Deliver @p event to all open subscriptions.
   *
   * @return Number of subscriptions that accepted the event.
   */
  std::size_t publish(const UpdateEvent &event);

  /// Open subscriptions.
  std::size_t subscriber_count() const;

  /// Close every subscription; later subscriptions still work.
  void close_all();

  std::size_t queue_capacity() const { return capacity_; }

private:
  void prune_locked();

  const std::size_t capacity_;
  std::mutex publish_mutex_;
  mutable std::mutex subscribers_mutex_;
  std::vector<std::shared_ptr<detail::Channel>> subscribers_;
  std::uint64_t next_id_{1};
};

} // namespace sitewatch

#endif // SITEWATCH_BROADCASTER_HPP
