#include "internal/queue/memory/memory_queue.hpp"
#include "internal/queue/sqlite/sqlite_db.hpp"
#include "internal/queue/sqlite/sqlite_queue.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace collector::queue;

namespace {

std::filesystem::path TempQueuePath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "serial_collector_queue_tests";
  std::filesystem::create_directories(base_dir);

  const auto path = base_dir / (test_name + ".sqlite");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

std::shared_ptr<DurableQueue> OpenSqlite(const std::filesystem::path& path, uint64_t max_size_bytes = 0) {
  sqlite::SqliteOptions options;
  options.path           = path.string();
  options.max_size_bytes = max_size_bytes;
  return std::make_shared<sqlite::SqliteQueue>(std::make_shared<sqlite::SqliteDB>(options));
}

// ------------------------------------------------------------
// Contract shared by every backend
// ------------------------------------------------------------

void CheckPeekIsOrderedAndNonDestructive(DurableQueue& queue) {
  for (int i = 0; i < 5; ++i) {
    assert(queue.Enqueue("line " + std::to_string(i)));
  }
  assert(queue.Size() == 5);

  std::vector<QueueEntry> batch;
  assert(queue.PeekBatch(3, &batch));
  assert(batch.size() == 3);
  assert(batch[0].line == "line 0" && batch[2].line == "line 2");
  assert(batch[0].sequence < batch[1].sequence && batch[1].sequence < batch[2].sequence);

  std::vector<QueueEntry> again;
  assert(queue.PeekBatch(10, &again));
  assert(again.size() == 5);
  assert(again[0].sequence == batch[0].sequence);
  assert(queue.Size() == 5);
}

void CheckAcknowledgeSemantics(DurableQueue& queue) {
  std::vector<QueueEntry> batch;
  assert(queue.PeekBatch(5, &batch));
  assert(batch.size() == 5);

  // skipping ahead of the oldest pending entry is refused
  auto out_of_order = queue.Acknowledge(batch[2].sequence);
  assert(!out_of_order);
  assert(out_of_order.code == QueueError::OutOfOrder);
  assert(queue.Size() == 5);

  assert(queue.Acknowledge(batch[0].sequence));
  assert(queue.Size() == 4);

  // already acknowledged and never issued sequences are no-ops
  assert(queue.Acknowledge(batch[0].sequence));
  assert(queue.Acknowledge(batch[4].sequence + 1000));
  assert(queue.Size() == 4);

  for (size_t i = 1; i < batch.size(); ++i) {
    assert(queue.Acknowledge(batch[i].sequence));
  }
  assert(queue.Size() == 0);

  std::vector<QueueEntry> empty;
  assert(queue.PeekBatch(5, &empty));
  assert(empty.empty());
  assert(queue.Acknowledge(batch[4].sequence));
}

void CheckSequencesAreNotReused(DurableQueue& queue) {
  assert(queue.Enqueue("a"));
  std::vector<QueueEntry> batch;
  assert(queue.PeekBatch(1, &batch));
  const auto first = batch[0].sequence;
  assert(queue.Acknowledge(first));

  assert(queue.Enqueue("b"));
  assert(queue.PeekBatch(1, &batch));
  assert(batch[0].sequence > first);
  assert(queue.Acknowledge(batch[0].sequence));
}

void CheckWaitForEntriesWakesOnEnqueue(DurableQueue& queue) {
  assert(queue.Size() == 0);
  assert(!queue.WaitForEntries(std::chrono::milliseconds(20)));

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(queue.Enqueue("late"));
  });

  const auto start = std::chrono::steady_clock::now();
  assert(queue.WaitForEntries(std::chrono::seconds(5)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  producer.join();

  std::vector<QueueEntry> batch;
  assert(queue.PeekBatch(1, &batch));
  assert(queue.Acknowledge(batch[0].sequence));
}

void RunContract(const std::function<std::shared_ptr<DurableQueue>()>& make) {
  {
    auto queue = make();
    CheckPeekIsOrderedAndNonDestructive(*queue);
    CheckAcknowledgeSemantics(*queue);
    CheckSequencesAreNotReused(*queue);
    CheckWaitForEntriesWakesOnEnqueue(*queue);
  }
}

// ------------------------------------------------------------
// Backend specifics
// ------------------------------------------------------------

void TestSqliteSurvivesReopenInOrder() {
  const auto path = TempQueuePath("reopen");
  const int  n    = 200;

  {
    auto queue = OpenSqlite(path);
    for (int i = 0; i < n; ++i) {
      assert(queue->Enqueue("plant moisture=" + std::to_string(i) + " " + std::to_string(1000 + i)));
    }
  }

  std::vector<std::string> drained;
  {
    auto queue = OpenSqlite(path);
    assert(queue->Size() == static_cast<uint64_t>(n));

    std::vector<QueueEntry> batch;
    while (queue->Size() > 0) {
      assert(queue->PeekBatch(64, &batch));
      for (const auto& entry : batch) {
        drained.push_back(entry.line);
        assert(queue->Acknowledge(entry.sequence));
      }
    }
  }

  assert(drained.size() == static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    assert(drained[static_cast<size_t>(i)] == "plant moisture=" + std::to_string(i) + " " + std::to_string(1000 + i));
  }

  auto queue = OpenSqlite(path);
  assert(queue->Size() == 0);
}

void TestSqliteSequenceMonotonicAcrossReopen() {
  const auto path = TempQueuePath("monotonic");
  uint64_t   last = 0;
  {
    auto queue = OpenSqlite(path);
    assert(queue->Enqueue("a"));
    std::vector<QueueEntry> batch;
    assert(queue->PeekBatch(1, &batch));
    last = batch[0].sequence;
    assert(queue->Acknowledge(last));
  }
  {
    auto queue = OpenSqlite(path);
    assert(queue->Enqueue("b"));
    std::vector<QueueEntry> batch;
    assert(queue->PeekBatch(1, &batch));
    assert(batch[0].sequence > last);
  }
}

void TestSqliteSizeCapReportsUnavailable() {
  const auto  path = TempQueuePath("size_cap");
  auto        queue = OpenSqlite(path, 16 * 1024);
  std::string big(2000, 'x');

  Result last;
  int    accepted = 0;
  for (int i = 0; i < 200; ++i) {
    last = queue->Enqueue("m v=\"" + big + "\"");
    if (!last) break;
    ++accepted;
  }
  assert(!last);
  assert(last.code == QueueError::Unavailable);
  assert(!last.message.empty());
  assert(queue->Size() == static_cast<uint64_t>(accepted));

  // what was accepted stays readable
  std::vector<QueueEntry> batch;
  assert(queue->PeekBatch(1000, &batch));
  assert(batch.size() == static_cast<size_t>(accepted));
}

void TestSqliteRejectsUnknownSynchronousMode() {
  sqlite::SqliteOptions options;
  options.path        = TempQueuePath("bad_sync").string();
  options.synchronous = "OFF";

  bool threw = false;
  try {
    sqlite::SqliteDB db(options);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMemoryCapacityReportsUnavailable() {
  memory::MemoryQueue queue(2);
  assert(queue.Enqueue("a"));
  assert(queue.Enqueue("b"));

  auto full = queue.Enqueue("c");
  assert(!full);
  assert(full.code == QueueError::Unavailable);
  assert(queue.Size() == 2);
}

} // namespace

int main() {
  RunContract([] { return std::make_shared<memory::MemoryQueue>(); });
  RunContract([] { return OpenSqlite(TempQueuePath("contract")); });

  TestSqliteSurvivesReopenInOrder();
  TestSqliteSequenceMonotonicAcrossReopen();
  TestSqliteSizeCapReportsUnavailable();
  TestSqliteRejectsUnknownSynchronousMode();
  TestMemoryCapacityReportsUnavailable();

  std::cout << "serial_collector_unit_durable_queue: pass\n";
  return 0;
}
