#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "internal/delivery/backoff.hpp"
#include "internal/line/metric_record.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/runtime/exit_code.hpp"
#include "internal/serial/line_source.hpp"
#include "internal/util/stop_signal.hpp"
#include "internal/util/time.hpp"

namespace collector::pipeline {

struct IngestOptions {
  // Delay between attempts to reopen a device that went away.
  delivery::RetryPolicy reconnect;
};

/*
  Background worker that moves lines from the device into the queue.

      read line -> parse -> enrich -> enqueue

  Malformed lines are logged and dropped. A queue that stops accepting
  writes halts the loop; the device failing after a successful start is
  reopened with backoff.
*/
class IngestLoop {
 public:
  using ExitCallback = std::function<void(runtime::ExitCode)>;

  IngestLoop(std::shared_ptr<serial::LineSource>   source,
             std::shared_ptr<queue::DurableQueue>  queue,
             line::TagSet                          static_tags,
             IngestOptions                         options,
             const util::StopSignal&               stop,
             util::ClockFn                         clock = util::Now);
  ~IngestLoop();

  IngestLoop(const IngestLoop&)            = delete;
  IngestLoop& operator=(const IngestLoop&) = delete;

  // Called once from the ingest thread when the loop ends.
  void SetExitCallback(ExitCallback callback);

  void Start();
  void Join();

  bool Finished() const {
    return finished_;
  }

  runtime::ExitCode Code() const {
    return code_;
  }

  uint64_t LinesRead() const {
    return lines_read_;
  }
  uint64_t ParseErrors() const {
    return parse_errors_;
  }
  uint64_t Enqueued() const {
    return enqueued_;
  }

  // Parses, enriches and enqueues one raw line. Returns false only when
  // the queue refused the write.
  bool HandleLine(const std::string& raw);

 private:
  void Run();
  bool Reconnect(delivery::Backoff* backoff);
  void Finish(runtime::ExitCode code);

  std::shared_ptr<serial::LineSource>  source_;
  std::shared_ptr<queue::DurableQueue> queue_;
  line::TagSet                         static_tags_;
  IngestOptions                        options_;
  const util::StopSignal&              stop_;
  util::ClockFn                        clock_;
  ExitCallback                         on_exit_;

  std::thread                    thread_;
  std::atomic<bool>              finished_{false};
  std::atomic<runtime::ExitCode> code_{runtime::ExitCode::Ok};

  std::atomic<uint64_t> lines_read_{0};
  std::atomic<uint64_t> parse_errors_{0};
  std::atomic<uint64_t> enqueued_{0};
};

} // namespace collector::pipeline
