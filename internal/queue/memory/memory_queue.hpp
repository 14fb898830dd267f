#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include "internal/queue/durable_queue.hpp"

namespace collector::queue::memory {

/*
  In-process queue with the DurableQueue semantics minus durability.

  Used by tests and when no queue file is configured. `max_entries` of 0
  means unbounded; a full queue reports Unavailable like a full disk.
*/
class MemoryQueue final : public DurableQueue {
 public:
  explicit MemoryQueue(uint64_t max_entries = 0);

  Result   Enqueue(const std::string& line) override;
  Result   PeekBatch(size_t max_count, std::vector<QueueEntry>* out) override;
  Result   Acknowledge(uint64_t sequence) override;
  uint64_t Size() override;
  bool     WaitForEntries(std::chrono::milliseconds timeout) override;

 private:
  const uint64_t max_entries_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<QueueEntry>  entries_;
  uint64_t                next_sequence_ = 1;
};

} // namespace collector::queue::memory
