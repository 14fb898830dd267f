#pragma once

#include <chrono>
#include <cstdint>

namespace collector::delivery {

struct RetryPolicy {
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{60000};
  double                    multiplier = 2.0;

  // Total attempts including the first one; 0 = unbounded.
  uint32_t max_attempts = 0;
};

/*
  Exponential backoff as an explicit state machine.

  Each RecordFailure() advances the attempt count and computes the instant
  the next attempt may start. The caller decides how to wait (thread sleep,
  timer), which keeps this usable from either model.
*/
class Backoff {
 public:
  using SteadyClock = std::chrono::steady_clock;

  explicit Backoff(RetryPolicy policy);

  // Records a failed attempt made at `now`. Returns false when the policy
  // allows no further attempt.
  bool RecordFailure(SteadyClock::time_point now);

  void Reset();

  uint32_t Attempts() const {
    return attempts_;
  }

  // Delay applied after the most recent failure.
  std::chrono::milliseconds CurrentDelay() const {
    return current_delay_;
  }

  SteadyClock::time_point NextRetryAt() const {
    return next_retry_at_;
  }

  const RetryPolicy& Policy() const {
    return policy_;
  }

 private:
  RetryPolicy               policy_;
  uint32_t                  attempts_ = 0;
  std::chrono::milliseconds current_delay_{0};
  SteadyClock::time_point   next_retry_at_{};
};

} // namespace collector::delivery
