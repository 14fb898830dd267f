#include "internal/pipeline/pipeline.hpp"
#include "internal/queue/memory/memory_queue.hpp"
#include "internal/queue/sqlite/sqlite_db.hpp"
#include "internal/queue/sqlite/sqlite_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace collector;
using std::chrono::milliseconds;

namespace {

constexpr int64_t kCaptureNanos = 1700000000000000000;

// Hands out scripted lines, then idles until stopped. An empty string in
// the script simulates the device disappearing.
class ScriptedSource final : public serial::LineSource {
 public:
  explicit ScriptedSource(std::vector<std::string> lines, bool openable = true)
      : lines_(lines.begin(), lines.end()), openable_(openable) {
  }

  bool Open(std::string* error) override {
    ++opens_;
    if (!openable_) {
      *error = "No such file or directory";
      return false;
    }
    return true;
  }

  void Close() override {
  }

  serial::ReadStatus ReadLine(const util::StopSignal& stop, std::string* line, std::string* error) override {
    {
      std::lock_guard lock(mutex_);
      if (!lines_.empty()) {
        auto next = lines_.front();
        lines_.pop_front();
        if (next.empty()) {
          *error = "end of stream";
          return serial::ReadStatus::Closed;
        }
        *line = next;
        return serial::ReadStatus::Line;
      }
    }
    while (stop.WaitFor(milliseconds(20))) {
    }
    return serial::ReadStatus::Stopped;
  }

  std::string Describe() const override {
    return "scripted";
  }

  int Opens() const {
    return opens_;
  }

 private:
  std::mutex              mutex_;
  std::deque<std::string> lines_;
  bool                    openable_;
  std::atomic<int>        opens_{0};
};

// Answers every request through a replaceable handler, records bodies.
class FakeInflux final : public transport::HttpTransport {
 public:
  using Handler = std::function<transport::TransportResult(const transport::HttpRequest&)>;

  FakeInflux() {
    SetHandler([](const transport::HttpRequest&) { return Status(204); });
  }

  static transport::TransportResult Status(int code) {
    transport::TransportResult result;
    result.http_status = code;
    return result;
  }

  static transport::TransportResult Refused() {
    transport::TransportResult result;
    result.status  = transport::TransportStatus::ConnectFailed;
    result.message = "connection refused";
    return result;
  }

  void SetHandler(Handler handler) {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
  }

  transport::TransportResult Send(const transport::HttpRequest& request) override {
    std::lock_guard lock(mutex_);
    auto            result = handler_(request);
    bodies_.push_back(request.body);
    if (result && result.http_status / 100 == 2) accepted_.push_back(request.body);
    return result;
  }

  std::vector<std::string> Bodies() {
    std::lock_guard lock(mutex_);
    return bodies_;
  }

  // Lines of every accepted request, in delivery order.
  std::vector<std::string> AcceptedLines() {
    std::lock_guard          lock(mutex_);
    std::vector<std::string> lines;
    for (const auto& body : accepted_) {
      size_t start = 0;
      while (start < body.size()) {
        const auto end = body.find('\n', start);
        lines.push_back(body.substr(start, end - start));
        start = end + 1;
      }
    }
    return lines;
  }

 private:
  std::mutex               mutex_;
  Handler                  handler_;
  std::vector<std::string> bodies_;
  std::vector<std::string> accepted_;
};

// Memory queue whose reads fail, as if the database file went bad under
// the drain loop while appends still succeed.
class UnreadableQueue final : public queue::DurableQueue {
 public:
  queue::Result Enqueue(const std::string& line) override {
    return inner_.Enqueue(line);
  }
  queue::Result PeekBatch(size_t, std::vector<queue::QueueEntry>*) override {
    return queue::Result::Err(queue::QueueError::Unavailable, "disk I/O error");
  }
  queue::Result Acknowledge(uint64_t sequence) override {
    return inner_.Acknowledge(sequence);
  }
  uint64_t Size() override {
    return inner_.Size();
  }
  bool WaitForEntries(std::chrono::milliseconds timeout) override {
    return inner_.WaitForEntries(timeout);
  }

 private:
  queue::memory::MemoryQueue inner_;
};

bool WaitUntil(const std::function<bool()>& predicate, milliseconds timeout = milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(milliseconds(10));
  }
  return predicate();
}

std::shared_ptr<delivery::DeliveryClient> MakeClient(std::shared_ptr<FakeInflux> influx, uint32_t max_attempts = 0) {
  delivery::InfluxTarget target;
  target.database = "sensors";

  delivery::RetryPolicy policy;
  policy.initial_backoff = milliseconds(5);
  policy.max_backoff     = milliseconds(20);
  policy.max_attempts    = max_attempts;
  return std::make_shared<delivery::DeliveryClient>(std::move(influx), target, policy);
}

pipeline::IngestOptions FastIngest() {
  pipeline::IngestOptions options;
  options.reconnect.initial_backoff = milliseconds(5);
  options.reconnect.max_backoff     = milliseconds(20);
  return options;
}

pipeline::DrainOptions FastDrain(size_t batch_size = 100) {
  pipeline::DrainOptions options;
  options.batch_size              = batch_size;
  options.poll_interval           = milliseconds(20);
  options.rejected_retry_interval = milliseconds(30);
  return options;
}

util::TimePoint FixedClock() {
  return util::FromUnixNanos(kCaptureNanos);
}

std::string Captured(const std::string& line) {
  return line + " " + std::to_string(kCaptureNanos);
}

void TestLinesFlowToDatabaseEnriched() {
  auto source = std::make_shared<ScriptedSource>(std::vector<std::string>{
      "plant,pin=A15 moisture=140,temperature=27.4",
      "plant,pin=A15 moisture=oops",
      "plant,pin=B2 moisture=141,temperature=27.5",
  });
  auto queue  = std::make_shared<queue::memory::MemoryQueue>();
  auto influx = std::make_shared<FakeInflux>();

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {{"location", "foo"}}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return influx->AcceptedLines().size() == 2; }));
  assert(WaitUntil([&] { return queue->Size() == 0; }));
  pipeline.Stop();

  const auto lines = influx->AcceptedLines();
  assert(lines[0] == Captured("plant,pin=A15,location=foo moisture=140,temperature=27.4"));
  assert(lines[1] == Captured("plant,pin=B2,location=foo moisture=141,temperature=27.5"));

  assert(pipeline.Ingest().LinesRead() == 3);
  assert(pipeline.Ingest().ParseErrors() == 1);
  assert(pipeline.Ingest().Enqueued() == 2);
  assert(pipeline.Result() == runtime::ExitCode::Ok);
}

void TestTransientFailuresAreAcknowledgedOnceAfterSuccess() {
  const auto path = std::filesystem::temp_directory_path() / "serial_collector_pipeline_transient.sqlite";
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  queue::sqlite::SqliteOptions sqlite_options;
  sqlite_options.path = path.string();
  auto queue = std::make_shared<queue::sqlite::SqliteQueue>(std::make_shared<queue::sqlite::SqliteDB>(sqlite_options));

  // Fill the queue before the drain loop runs so the first batch holds everything.
  for (int i = 0; i < 3; ++i) {
    assert(queue->Enqueue(Captured("plant moisture=" + std::to_string(i))));
  }

  auto             influx = std::make_shared<FakeInflux>();
  std::atomic<int> calls{0};
  influx->SetHandler([&](const transport::HttpRequest&) {
    const int n = ++calls;
    if (n == 1) return FakeInflux::Refused();
    if (n == 2) return FakeInflux::Status(503);
    return FakeInflux::Status(204);
  });

  auto source = std::make_shared<ScriptedSource>(std::vector<std::string>{});
  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return queue->Size() == 0; }));
  pipeline.Stop();

  const auto bodies = influx->Bodies();
  assert(bodies.size() == 3);
  assert(bodies[0] == bodies[1] && bodies[1] == bodies[2]);

  const auto lines = influx->AcceptedLines();
  assert(lines.size() == 3);
  assert(lines[0] == Captured("plant moisture=0"));
  assert(lines[2] == Captured("plant moisture=2"));
  assert(pipeline.Drain().LinesDelivered() == 3);
  assert(pipeline.Drain().BatchesDelivered() == 1);
}

void TestRejectedBatchStaysQueuedAndProcessKeepsRunning() {
  auto source = std::make_shared<ScriptedSource>(std::vector<std::string>{"plant moisture=1"});
  auto queue  = std::make_shared<queue::memory::MemoryQueue>();
  auto influx = std::make_shared<FakeInflux>();
  influx->SetHandler([](const transport::HttpRequest&) { return FakeInflux::Status(400); });

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  // retried on later cycles, never acknowledged
  assert(WaitUntil([&] { return pipeline.Drain().Rejected() >= 3; }));
  assert(queue->Size() == 1);
  assert(!pipeline.Finished());

  // once the database accepts it, it is delivered
  influx->SetHandler([](const transport::HttpRequest&) { return FakeInflux::Status(204); });
  assert(WaitUntil([&] { return queue->Size() == 0; }));
  pipeline.Stop();

  assert(influx->AcceptedLines().size() == 1);
  assert(pipeline.Result() == runtime::ExitCode::Ok);
}

void TestSkipOnStatusDropsOnlyTheOffendingLine() {
  auto queue = std::make_shared<queue::memory::MemoryQueue>();
  assert(queue->Enqueue(Captured("plant moisture=1")));
  assert(queue->Enqueue(Captured("plant moisture=2,bad=1")));
  assert(queue->Enqueue(Captured("plant moisture=3")));

  auto influx = std::make_shared<FakeInflux>();
  influx->SetHandler([](const transport::HttpRequest& request) {
    return FakeInflux::Status(request.body.find("bad") == std::string::npos ? 204 : 400);
  });

  auto drain           = FastDrain();
  drain.skip_on_status = {400};
  auto source          = std::make_shared<ScriptedSource>(std::vector<std::string>{});

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {}, FastIngest(), drain, FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return queue->Size() == 0; }));
  pipeline.Stop();

  const auto lines = influx->AcceptedLines();
  assert(lines.size() == 2);
  assert(lines[0] == Captured("plant moisture=1"));
  assert(lines[1] == Captured("plant moisture=3"));
  assert(pipeline.Drain().Dropped() == 1);
}

void TestFullQueueHaltsIngestAndFlushesBacklog() {
  auto source = std::make_shared<ScriptedSource>(std::vector<std::string>{
      "plant moisture=1",
      "plant moisture=2",
      "plant moisture=3",
      "plant moisture=4",
  });
  auto queue  = std::make_shared<queue::memory::MemoryQueue>(2);
  auto influx = std::make_shared<FakeInflux>();
  influx->SetHandler([](const transport::HttpRequest&) { return FakeInflux::Refused(); });

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx, 1), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return pipeline.Ingest().Finished(); }));
  assert(pipeline.Ingest().Code() == runtime::ExitCode::QueueUnavailable);
  assert(pipeline.Ingest().Enqueued() == 2);
  assert(!pipeline.Finished());

  // database comes back: the backlog drains, then the pipeline ends
  influx->SetHandler([](const transport::HttpRequest&) { return FakeInflux::Status(204); });
  assert(WaitUntil([&] { return pipeline.Finished(); }));
  pipeline.Stop();

  assert(queue->Size() == 0);
  assert(influx->AcceptedLines().size() == 2);
  assert(pipeline.Result() == runtime::ExitCode::QueueUnavailable);
}

void TestDrainFailureLeavesIngestRunning() {
  std::vector<std::string> script;
  for (int i = 0; i < 5; ++i) script.push_back("plant moisture=" + std::to_string(i));

  auto source = std::make_shared<ScriptedSource>(script);
  auto queue  = std::make_shared<UnreadableQueue>();
  auto influx = std::make_shared<FakeInflux>();

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return pipeline.Drain().Finished(); }));
  assert(pipeline.Drain().Code() == runtime::ExitCode::QueueUnavailable);

  // every line still reaches the queue after delivery stopped
  assert(WaitUntil([&] { return pipeline.Ingest().Enqueued() == 5; }));
  assert(queue->Size() == 5);
  assert(!pipeline.Ingest().Finished());
  assert(!pipeline.Finished());

  pipeline.Stop();
  assert(pipeline.Ingest().Code() == runtime::ExitCode::Ok);
  assert(pipeline.Result() == runtime::ExitCode::QueueUnavailable);
  assert(influx->Bodies().empty());
}

void TestShutdownDuringRetryKeepsBatchQueued() {
  auto queue = std::make_shared<queue::memory::MemoryQueue>();
  assert(queue->Enqueue(Captured("plant moisture=1")));
  assert(queue->Enqueue(Captured("plant moisture=2")));

  auto influx = std::make_shared<FakeInflux>();
  influx->SetHandler([](const transport::HttpRequest&) { return FakeInflux::Refused(); });

  // unbounded attempts: only shutdown ends the delivery
  auto               source = std::make_shared<ScriptedSource>(std::vector<std::string>{});
  pipeline::Pipeline pipeline(source, queue, MakeClient(influx, 0), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return influx->Bodies().size() >= 3; }));
  pipeline.Stop();

  assert(pipeline.Drain().Cancelled() == 1);
  assert(pipeline.Drain().LinesDelivered() == 0);
  assert(pipeline.Drain().TransientFailures() == 0);
  assert(queue->Size() == 2);

  std::vector<queue::QueueEntry> pending;
  assert(queue->PeekBatch(10, &pending));
  assert(pending.size() == 2);
  assert(pending[0].line == Captured("plant moisture=1"));
  assert(pipeline.Result() == runtime::ExitCode::Ok);
}

void TestUnavailableDeviceAtStartEndsPipeline() {
  auto source = std::make_shared<ScriptedSource>(std::vector<std::string>{}, false);
  auto queue  = std::make_shared<queue::memory::MemoryQueue>();
  auto influx = std::make_shared<FakeInflux>();

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return pipeline.Finished(); }));
  pipeline.Stop();
  assert(pipeline.Result() == runtime::ExitCode::SerialUnavailable);
  assert(source->Opens() == 1);
}

void TestDeviceLossReconnects() {
  auto source = std::make_shared<ScriptedSource>(std::vector<std::string>{
      "plant moisture=1",
      "",
      "plant moisture=2",
  });
  auto queue  = std::make_shared<queue::memory::MemoryQueue>();
  auto influx = std::make_shared<FakeInflux>();

  pipeline::Pipeline pipeline(source, queue, MakeClient(influx), {}, FastIngest(), FastDrain(), FixedClock);
  pipeline.Start();

  assert(WaitUntil([&] { return influx->AcceptedLines().size() == 2; }));
  pipeline.Stop();

  assert(source->Opens() == 2);
  assert(pipeline.Result() == runtime::ExitCode::Ok);
}

} // namespace

int main() {
  TestLinesFlowToDatabaseEnriched();
  TestTransientFailuresAreAcknowledgedOnceAfterSuccess();
  TestRejectedBatchStaysQueuedAndProcessKeepsRunning();
  TestSkipOnStatusDropsOnlyTheOffendingLine();
  TestFullQueueHaltsIngestAndFlushesBacklog();
  TestDrainFailureLeavesIngestRunning();
  TestShutdownDuringRetryKeepsBatchQueued();
  TestUnavailableDeviceAtStartEndsPipeline();
  TestDeviceLossReconnects();

  std::cout << "serial_collector_unit_pipeline: pass\n";
  return 0;
}
