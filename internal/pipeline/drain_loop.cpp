#include "drain_loop.hpp"

#include <algorithm>
#include <string>

#include "internal/observability/logging.hpp"

namespace collector::pipeline {

using collector::observability::IntField;
using collector::observability::StringField;

DrainLoop::DrainLoop(std::shared_ptr<queue::DurableQueue>      queue,
                     std::shared_ptr<delivery::DeliveryClient> client,
                     DrainOptions                              options,
                     const util::StopSignal&                   stop)
    : queue_(std::move(queue)), client_(std::move(client)), options_(std::move(options)), stop_(stop) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

DrainLoop::~DrainLoop() {
  Join();
}

void DrainLoop::SetExitCallback(ExitCallback callback) {
  on_exit_ = std::move(callback);
}

void DrainLoop::Start() {
  thread_ = std::thread(&DrainLoop::Run, this);
}

void DrainLoop::Join() {
  if (thread_.joinable()) thread_.join();
}

bool DrainLoop::Skippable(int http_status) const {
  return std::find(options_.skip_on_status.begin(), options_.skip_on_status.end(), http_status) !=
         options_.skip_on_status.end();
}

bool DrainLoop::AcknowledgeBatch(const std::vector<queue::QueueEntry>& batch) {
  for (const auto& entry : batch) {
    auto result = queue_->Acknowledge(entry.sequence);
    if (result) continue;

    COLLECTOR_LOG_ERROR("Acknowledge failed, entries will be delivered again",
                        {IntField("sequence", static_cast<int64_t>(entry.sequence)),
                         StringField("error", queue::ToString(result.code)),
                         StringField("detail", result.message)});
    return result.code != queue::QueueError::Unavailable;
  }
  return true;
}

void DrainLoop::Finish(runtime::ExitCode code) {
  COLLECTOR_LOG_INFO("Drain loop stopped",
                     {StringField("status", runtime::ToString(code)),
                      IntField("batches_delivered", static_cast<int64_t>(batches_delivered_.load())),
                      IntField("lines_delivered", static_cast<int64_t>(lines_delivered_.load())),
                      IntField("rejected", static_cast<int64_t>(rejected_.load())),
                      IntField("transient_failures", static_cast<int64_t>(transient_failures_.load())),
                      IntField("dropped", static_cast<int64_t>(dropped_.load())),
                      IntField("pending", static_cast<int64_t>(queue_->Size()))});
  code_     = code;
  finished_ = true;
  if (on_exit_) on_exit_(code);
}

void DrainLoop::Run() {
  auto                          code = runtime::ExitCode::Ok;
  std::vector<queue::QueueEntry> batch;
  std::vector<std::string>       lines;

  // Sequence of the last entry of a batch rejected with a skippable
  // status; entries up to it are sent one at a time to isolate the bad one.
  uint64_t isolate_through = 0;

  while (!stop_.StopRequested()) {
    if (flush_requested_ && queue_->Size() == 0) {
      COLLECTOR_LOG_INFO("Queue flushed");
      break;
    }
    if (!queue_->WaitForEntries(options_.poll_interval)) {
      continue;
    }

    batch.clear();
    auto peek = queue_->PeekBatch(isolate_through > 0 ? 1 : options_.batch_size, &batch);
    if (!peek) {
      COLLECTOR_LOG_ERROR("Queue read failed, halting delivery",
                          {StringField("error", queue::ToString(peek.code)), StringField("detail", peek.message)});
      code = runtime::ExitCode::QueueUnavailable;
      break;
    }
    if (batch.empty()) continue;

    lines.clear();
    for (const auto& entry : batch) lines.push_back(entry.line);

    const uint64_t first = batch.front().sequence;
    const uint64_t last  = batch.back().sequence;
    auto           result = client_->Deliver(lines, stop_);

    switch (result.code) {
      case delivery::DeliveryError::OK:
        if (!AcknowledgeBatch(batch)) {
          code = runtime::ExitCode::QueueUnavailable;
          break;
        }
        ++batches_delivered_;
        lines_delivered_ += batch.size();
        if (isolate_through > 0 && last >= isolate_through) isolate_through = 0;
        COLLECTOR_LOG_DEBUG("Batch delivered",
                            {IntField("first_sequence", static_cast<int64_t>(first)),
                             IntField("lines", static_cast<int64_t>(batch.size())),
                             IntField("attempts", result.attempts)});
        break;

      case delivery::DeliveryError::Cancelled:
        ++cancelled_;
        COLLECTOR_LOG_INFO("Delivery cancelled by shutdown, batch stays queued",
                           {IntField("first_sequence", static_cast<int64_t>(first))});
        break;

      case delivery::DeliveryError::Rejected:
        ++rejected_;
        if (Skippable(result.http_status)) {
          if (batch.size() == 1) {
            COLLECTOR_LOG_WARN("Dropping line rejected by database",
                               {IntField("sequence", static_cast<int64_t>(first)),
                                IntField("http_status", result.http_status),
                                StringField("line", batch.front().line),
                                StringField("error", result.message)});
            if (!AcknowledgeBatch(batch)) {
              code = runtime::ExitCode::QueueUnavailable;
              break;
            }
            ++dropped_;
            if (isolate_through > 0 && last >= isolate_through) isolate_through = 0;
          } else {
            COLLECTOR_LOG_WARN("Batch rejected, retrying line by line",
                               {IntField("first_sequence", static_cast<int64_t>(first)),
                                IntField("last_sequence", static_cast<int64_t>(last)),
                                IntField("http_status", result.http_status)});
            isolate_through = last;
          }
          break;
        }
        COLLECTOR_LOG_ERROR("Batch rejected by database, keeping it queued",
                            {IntField("first_sequence", static_cast<int64_t>(first)),
                             IntField("lines", static_cast<int64_t>(batch.size())),
                             IntField("http_status", result.http_status),
                             StringField("error", result.message),
                             IntField("retry_in_ms", options_.rejected_retry_interval.count())});
        stop_.WaitFor(options_.rejected_retry_interval);
        break;

      case delivery::DeliveryError::Transient:
        ++transient_failures_;
        COLLECTOR_LOG_ERROR("Delivery failed after retries, keeping batch queued",
                            {IntField("first_sequence", static_cast<int64_t>(first)),
                             IntField("attempts", result.attempts),
                             StringField("error", result.message),
                             IntField("retry_in_ms", client_->Policy().max_backoff.count())});
        stop_.WaitFor(client_->Policy().max_backoff);
        break;
    }

    if (code != runtime::ExitCode::Ok) break;
  }

  Finish(code);
}

} // namespace collector::pipeline
