#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

#include "internal/queue/durable_queue.hpp"
#include "sqlite_db.hpp"

namespace collector::queue::sqlite {

/*
  DurableQueue backed by a single sqlite table:

    queue_entries(seq INTEGER PRIMARY KEY AUTOINCREMENT, line, enqueued_at_ms)

  AUTOINCREMENT keeps sequences monotonic even after the tail is deleted.
  Every Enqueue is its own committed transaction, so a returned OK survives
  a crash (with synchronous=FULL, a power loss as well).
*/
class SqliteQueue final : public DurableQueue {
 public:
  explicit SqliteQueue(std::shared_ptr<SqliteDB> db);

  Result   Enqueue(const std::string& line) override;
  Result   PeekBatch(size_t max_count, std::vector<QueueEntry>* out) override;
  Result   Acknowledge(uint64_t sequence) override;
  uint64_t Size() override;
  bool     WaitForEntries(std::chrono::milliseconds timeout) override;

 private:
  static void BootstrapSchema(SqliteDB& db);
  static Result Translate(sqlite3* db, int rc, const char* op);

  // Oldest pending sequence, 0 when the queue is empty. Caller holds mutex_.
  Result OldestSequence(uint64_t* out);
  bool   Contains(uint64_t sequence);

  std::shared_ptr<SqliteDB> db_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  uint64_t                pending_ = 0;
};

} // namespace collector::queue::sqlite
