/**
 * @file delay_policy.hpp
 * @brief Computes the wait before a site's next poll.
 */
#ifndef SITEWATCH_DELAY_POLICY_HPP
#define SITEWATCH_DELAY_POLICY_HPP

#include "site.hpp"
#include <chrono>
#include <functional>

namespace sitewatch {

/**
 * Delay rules per poll style.
 *
 * - None: always the site interval.
 * - Random: interval plus a uniform jitter in `[0, jitter_max]`, drawn anew
 *   every cycle.
 * - Exponential: the interval after a success; after a failure the previous
 *   backoff doubled, capped at `max(max_backoff, interval)`.
 */
class DelayPolicy {
public:
  /// Returns a uniformly distributed value in `[0, max]`.
  using JitterSource =
      std::function<std::chrono::milliseconds(std::chrono::milliseconds max)>;

  /**
   * @param jitter_max Upper bound of the Random style jitter.
   * @param max_backoff Exponential ceiling.
   * @param jitter Random source; a thread-local Mersenne Twister when empty.
   */
  DelayPolicy(std::chrono::milliseconds jitter_max,
              std::chrono::seconds max_backoff, JitterSource jitter = {});

  /**
   * Compute the delay following a cycle.
   *
   * @param style Poll style of the site.
   * @param interval_secs Base interval of the site.
   * @param success Outcome of the cycle that just finished.
   * @param current_backoff_secs Working backoff, updated in place. It stays
   *        at @p interval_secs for the None and Random styles.
   */
  std::chrono::milliseconds next_delay(PollStyle style, int interval_secs,
                                       bool success,
                                       int &current_backoff_secs) const;

  std::chrono::milliseconds jitter_max() const { return jitter_max_; }
  std::chrono::seconds max_backoff() const { return max_backoff_; }

private:
  std::chrono::milliseconds jitter_max_;
  std::chrono::seconds max_backoff_;
  JitterSource jitter_;
};

} // namespace sitewatch

#endif // SITEWATCH_DELAY_POLICY_HPP
