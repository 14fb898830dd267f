#include "pipeline.hpp"

#include "internal/observability/logging.hpp"

namespace collector::pipeline {

Pipeline::Pipeline(std::shared_ptr<serial::LineSource>       source,
                   std::shared_ptr<queue::DurableQueue>      queue,
                   std::shared_ptr<delivery::DeliveryClient> client,
                   line::TagSet                              static_tags,
                   IngestOptions                             ingest_options,
                   DrainOptions                              drain_options,
                   util::ClockFn                             clock)
    : ingest_(std::make_unique<IngestLoop>(std::move(source), queue, std::move(static_tags), ingest_options, stop_, std::move(clock))),
      drain_(std::make_unique<DrainLoop>(queue, std::move(client), std::move(drain_options), stop_)) {
  ingest_->SetExitCallback([this](runtime::ExitCode code) {
    if (code != runtime::ExitCode::Ok) {
      COLLECTOR_LOG_WARN("Ingestion halted, flushing queued lines before exit");
      drain_->RequestFlush();
    }
  });
  drain_->SetExitCallback([](runtime::ExitCode code) {
    if (code != runtime::ExitCode::Ok) {
      COLLECTOR_LOG_WARN("Delivery halted, ingestion keeps queueing lines",
                         {observability::StringField("status", runtime::ToString(code))});
    }
  });
}

Pipeline::~Pipeline() {
  Stop();
}

void Pipeline::Start() {
  started_ = true;
  drain_->Start();
  ingest_->Start();
}

void Pipeline::Stop() {
  stop_.RequestStop();
  ingest_->Join();
  drain_->Join();
}

bool Pipeline::Finished() const {
  return started_ && ingest_->Finished() && drain_->Finished();
}

runtime::ExitCode Pipeline::Result() const {
  if (ingest_->Code() != runtime::ExitCode::Ok) return ingest_->Code();
  return drain_->Code();
}

} // namespace collector::pipeline
