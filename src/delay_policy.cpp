#include "delay_policy.hpp"

#include <algorithm>
#include <limits>
#include <random>

namespace sitewatch {

DelayPolicy::DelayPolicy(std::chrono::milliseconds jitter_max,
                         std::chrono::seconds max_backoff, JitterSource jitter)
    : jitter_max_(std::max(jitter_max, std::chrono::milliseconds{0})),
      max_backoff_(std::min<std::chrono::seconds::rep>(
          max_backoff.count(), std::numeric_limits<int>::max())),
      jitter_(std::move(jitter)) {
  if (!jitter_) {
    jitter_ = [](std::chrono::milliseconds max) {
      thread_local std::mt19937_64 rng{std::random_device{}()};
      std::uniform_int_distribution<long long> dist(0, max.count());
      return std::chrono::milliseconds{dist(rng)};
    };
  }
}

std::chrono::milliseconds
DelayPolicy::next_delay(PollStyle style, int interval_secs, bool success,
                        int &current_backoff_secs) const {
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  const milliseconds base = seconds{interval_secs};
  switch (style) {
  case PollStyle::None:
    current_backoff_secs = interval_secs;
    return base;
  case PollStyle::Random: {
    current_backoff_secs = interval_secs;
    if (jitter_max_.count() == 0) {
      return base;
    }
    milliseconds extra = jitter_(jitter_max_);
    extra = std::clamp(extra, milliseconds{0}, jitter_max_);
    return base + extra;
  }
  case PollStyle::Exponential: {
    if (success) {
      current_backoff_secs = interval_secs;
      return base;
    }
    const long long cap =
        std::max<long long>(max_backoff_.count(), interval_secs);
    long long previous = std::max(current_backoff_secs, interval_secs);
    long long next = std::min(previous * 2, cap);
    current_backoff_secs = static_cast<int>(next);
    return seconds{next};
  }
  }
  return base;
}

} // namespace sitewatch
