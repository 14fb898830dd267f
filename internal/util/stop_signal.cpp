#include "stop_signal.hpp"

namespace collector::util {

void StopSignal::RequestStop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
}

bool StopSignal::StopRequested() const {
  std::lock_guard lock(mutex_);
  return stop_;
}

bool StopSignal::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, timeout, [&] { return stop_; });
}

} // namespace collector::util
