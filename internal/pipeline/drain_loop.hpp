#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "internal/delivery/delivery_client.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/runtime/exit_code.hpp"
#include "internal/util/stop_signal.hpp"

namespace collector::pipeline {

struct DrainOptions {
  size_t                    batch_size = 100;
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds rejected_retry_interval{60000};

  // Rejection statuses for which a single offending line is dropped
  // instead of blocking the queue. Empty by default.
  std::vector<int> skip_on_status;
};

/*
  Background worker that empties the queue into the database.

      peek batch -> deliver -> acknowledge in order

  Entries are acknowledged only after their batch was accepted, so a
  crash between delivery and acknowledge replays them (at-least-once).
  Failed batches stay queued and are retried on a later cycle.
*/
class DrainLoop {
 public:
  using ExitCallback = std::function<void(runtime::ExitCode)>;

  DrainLoop(std::shared_ptr<queue::DurableQueue>      queue,
            std::shared_ptr<delivery::DeliveryClient> client,
            DrainOptions                              options,
            const util::StopSignal&                   stop);
  ~DrainLoop();

  DrainLoop(const DrainLoop&)            = delete;
  DrainLoop& operator=(const DrainLoop&) = delete;

  void SetExitCallback(ExitCallback callback);

  void Start();
  void Join();

  // Deliver what is queued, then exit once the queue is empty.
  void RequestFlush() {
    flush_requested_ = true;
  }

  bool Finished() const {
    return finished_;
  }

  runtime::ExitCode Code() const {
    return code_;
  }

  uint64_t BatchesDelivered() const {
    return batches_delivered_;
  }
  uint64_t LinesDelivered() const {
    return lines_delivered_;
  }
  uint64_t Rejected() const {
    return rejected_;
  }
  uint64_t TransientFailures() const {
    return transient_failures_;
  }
  uint64_t Dropped() const {
    return dropped_;
  }
  uint64_t Cancelled() const {
    return cancelled_;
  }

 private:
  void Run();
  void Finish(runtime::ExitCode code);

  // False when the queue became unavailable.
  bool AcknowledgeBatch(const std::vector<queue::QueueEntry>& batch);
  bool Skippable(int http_status) const;

  std::shared_ptr<queue::DurableQueue>      queue_;
  std::shared_ptr<delivery::DeliveryClient> client_;
  DrainOptions                              options_;
  const util::StopSignal&                   stop_;
  ExitCallback                              on_exit_;

  std::thread                    thread_;
  std::atomic<bool>              flush_requested_{false};
  std::atomic<bool>              finished_{false};
  std::atomic<runtime::ExitCode> code_{runtime::ExitCode::Ok};

  std::atomic<uint64_t> batches_delivered_{0};
  std::atomic<uint64_t> lines_delivered_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> transient_failures_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> cancelled_{0};
};

} // namespace collector::pipeline
