#include "memory_queue.hpp"

#include <algorithm>

namespace collector::queue::memory {

MemoryQueue::MemoryQueue(uint64_t max_entries) : max_entries_(max_entries) {
}

Result MemoryQueue::Enqueue(const std::string& line) {
  {
    std::lock_guard lock(mutex_);
    if (max_entries_ > 0 && entries_.size() >= max_entries_) {
      return Result::Err(QueueError::Unavailable, "memory queue full (" + std::to_string(max_entries_) + " entries)");
    }
    entries_.push_back(QueueEntry{next_sequence_++, line});
  }
  cv_.notify_all();
  return Result::Ok();
}

Result MemoryQueue::PeekBatch(size_t max_count, std::vector<QueueEntry>* out) {
  std::lock_guard lock(mutex_);
  const auto      count = std::min(max_count, entries_.size());
  out->assign(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count));
  return Result::Ok();
}

Result MemoryQueue::Acknowledge(uint64_t sequence) {
  std::lock_guard lock(mutex_);
  if (entries_.empty() || sequence < entries_.front().sequence) {
    return Result::Ok();
  }

  const auto oldest = entries_.front().sequence;
  if (sequence > oldest) {
    const bool found = std::any_of(entries_.begin(), entries_.end(), [&](const QueueEntry& e) { return e.sequence == sequence; });
    if (!found) {
      return Result::Ok();
    }
    return Result::Err(QueueError::OutOfOrder,
                       "entry " + std::to_string(sequence) + " acknowledged before pending entry " + std::to_string(oldest));
  }

  entries_.pop_front();
  return Result::Ok();
}

uint64_t MemoryQueue::Size() {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

bool MemoryQueue::WaitForEntries(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return !entries_.empty(); });
}

} // namespace collector::queue::memory
