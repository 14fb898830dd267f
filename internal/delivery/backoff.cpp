#include "backoff.hpp"

#include <algorithm>

namespace collector::delivery {

Backoff::Backoff(RetryPolicy policy) : policy_(policy) {
}

bool Backoff::RecordFailure(SteadyClock::time_point now) {
  ++attempts_;
  if (policy_.max_attempts > 0 && attempts_ >= policy_.max_attempts) {
    return false;
  }

  if (attempts_ == 1) {
    current_delay_ = policy_.initial_backoff;
  } else {
    const double next = static_cast<double>(current_delay_.count()) * policy_.multiplier;
    const double cap  = static_cast<double>(policy_.max_backoff.count());
    current_delay_    = std::chrono::milliseconds(static_cast<int64_t>(std::min(next, cap)));
  }
  current_delay_ = std::min(current_delay_, policy_.max_backoff);
  next_retry_at_ = now + current_delay_;
  return true;
}

void Backoff::Reset() {
  attempts_      = 0;
  current_delay_ = std::chrono::milliseconds(0);
  next_retry_at_ = SteadyClock::time_point{};
}

} // namespace collector::delivery
