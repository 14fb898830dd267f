#include "ingest_loop.hpp"

#include "internal/line/enricher.hpp"
#include "internal/line/line_parser.hpp"
#include "internal/observability/logging.hpp"

namespace collector::pipeline {

using collector::observability::IntField;
using collector::observability::StringField;

namespace {

constexpr size_t kMaxLoggedLine = 128;

std::string Excerpt(const std::string& raw) {
  if (raw.size() <= kMaxLoggedLine) return raw;
  return raw.substr(0, kMaxLoggedLine) + "...";
}

} // namespace

IngestLoop::IngestLoop(std::shared_ptr<serial::LineSource>  source,
                       std::shared_ptr<queue::DurableQueue> queue,
                       line::TagSet                         static_tags,
                       IngestOptions                        options,
                       const util::StopSignal&              stop,
                       util::ClockFn                        clock)
    : source_(std::move(source)),
      queue_(std::move(queue)),
      static_tags_(std::move(static_tags)),
      options_(options),
      stop_(stop),
      clock_(std::move(clock)) {
}

IngestLoop::~IngestLoop() {
  Join();
}

void IngestLoop::SetExitCallback(ExitCallback callback) {
  on_exit_ = std::move(callback);
}

void IngestLoop::Start() {
  thread_ = std::thread(&IngestLoop::Run, this);
}

void IngestLoop::Join() {
  if (thread_.joinable()) thread_.join();
}

bool IngestLoop::HandleLine(const std::string& raw) {
  ++lines_read_;

  auto parsed = line::Parse(raw);
  if (!parsed) {
    ++parse_errors_;
    COLLECTOR_LOG_WARN("Dropping malformed line", {StringField("reason", parsed.message), StringField("line", Excerpt(raw))});
    return true;
  }

  const std::string wire = line::Enrich(*parsed.record, static_tags_, clock_());

  auto result = queue_->Enqueue(wire);
  if (!result) {
    COLLECTOR_LOG_ERROR("Queue refused write, halting ingestion",
                        {StringField("error", queue::ToString(result.code)), StringField("detail", result.message)});
    return false;
  }
  ++enqueued_;
  return true;
}

bool IngestLoop::Reconnect(delivery::Backoff* backoff) {
  std::string error;
  while (!stop_.StopRequested()) {
    backoff->RecordFailure(delivery::Backoff::SteadyClock::now());
    if (!stop_.WaitFor(backoff->CurrentDelay())) {
      return false;
    }

    if (source_->Open(&error)) {
      COLLECTOR_LOG_INFO("Serial device reopened",
                         {StringField("device", source_->Describe()), IntField("attempts", backoff->Attempts())});
      backoff->Reset();
      return true;
    }
    COLLECTOR_LOG_WARN("Serial device reopen failed",
                       {StringField("device", source_->Describe()),
                        StringField("error", error),
                        IntField("next_retry_ms", backoff->CurrentDelay().count())});
  }
  return false;
}

void IngestLoop::Finish(runtime::ExitCode code) {
  COLLECTOR_LOG_INFO("Ingest loop stopped",
                     {StringField("status", runtime::ToString(code)),
                      IntField("lines_read", static_cast<int64_t>(lines_read_.load())),
                      IntField("parse_errors", static_cast<int64_t>(parse_errors_.load())),
                      IntField("enqueued", static_cast<int64_t>(enqueued_.load()))});
  code_     = code;
  finished_ = true;
  if (on_exit_) on_exit_(code);
}

void IngestLoop::Run() {
  std::string error;
  if (!source_->Open(&error)) {
    COLLECTOR_LOG_ERROR("Serial device unavailable", {StringField("device", source_->Describe()), StringField("error", error)});
    Finish(runtime::ExitCode::SerialUnavailable);
    return;
  }
  COLLECTOR_LOG_INFO("Serial device opened", {StringField("device", source_->Describe())});

  // Reconnects never give up; only stop ends them.
  auto reconnect_policy         = options_.reconnect;
  reconnect_policy.max_attempts = 0;
  delivery::Backoff backoff(reconnect_policy);

  auto        code = runtime::ExitCode::Ok;
  std::string raw;
  while (!stop_.StopRequested()) {
    const auto status = source_->ReadLine(stop_, &raw, &error);

    if (status == serial::ReadStatus::Line) {
      if (!HandleLine(raw)) {
        code = runtime::ExitCode::QueueUnavailable;
        break;
      }
      continue;
    }
    if (status == serial::ReadStatus::Stopped) {
      break;
    }

    COLLECTOR_LOG_WARN("Serial device failed, reconnecting",
                       {StringField("device", source_->Describe()),
                        StringField("status", serial::ToString(status)),
                        StringField("error", error)});
    source_->Close();
    if (!Reconnect(&backoff)) {
      break;
    }
  }

  source_->Close();
  Finish(code);
}

} // namespace collector::pipeline
