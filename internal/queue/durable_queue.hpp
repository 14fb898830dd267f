#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

namespace collector::queue {

struct QueueEntry {
  uint64_t    sequence = 0;
  std::string line;
};

/*
  Durable FIFO of wire lines.

  GUARANTEES (all backends):

  - Enqueue returns OK only once the line is recoverable after a crash
    (for the durable backend)
  - PeekBatch returns the oldest pending entries in sequence order
  - Sequences strictly increase and are never reused
  - Acknowledge is idempotent; acknowledging past an older pending entry
    fails with OutOfOrder and removes nothing
  - All methods are safe to call concurrently
*/
class DurableQueue {
 public:
  virtual ~DurableQueue() = default;

  virtual Result Enqueue(const std::string& line) = 0;

  virtual Result PeekBatch(size_t max_count, std::vector<QueueEntry>* out) = 0;

  virtual Result Acknowledge(uint64_t sequence) = 0;

  // Number of pending (not yet acknowledged) entries.
  virtual uint64_t Size() = 0;

  // Blocks until at least one entry is pending or `timeout` elapses.
  // Returns true if entries are pending.
  virtual bool WaitForEntries(std::chrono::milliseconds timeout) = 0;
};

} // namespace collector::queue
