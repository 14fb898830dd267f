#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace collector::util {

/*
  Process-wide cancellation flag.

  Loops check StopRequested() at every suspension point; sleeps go through
  WaitFor() so that RequestStop() wakes them immediately.
*/
class StopSignal {
 public:
  void RequestStop();

  bool StopRequested() const;

  // Sleeps for up to `timeout`. Returns false if stop was requested
  // before or during the wait.
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            stop_ = false;
};

} // namespace collector::util
