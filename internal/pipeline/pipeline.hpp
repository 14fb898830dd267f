#pragma once

#include <memory>

#include "drain_loop.hpp"
#include "ingest_loop.hpp"
#include "internal/util/stop_signal.hpp"

namespace collector::pipeline {

/*
  Owns the ingest and drain loops and the stop signal they share.

  The loops meet only at the queue. When ingestion halts with an error
  the drain loop is told to flush the backlog and exit. When the drain
  loop halts, ingestion keeps queueing lines for a later restart.
  Finished() turns true once both threads are done.
*/
class Pipeline {
 public:
  Pipeline(std::shared_ptr<serial::LineSource>       source,
           std::shared_ptr<queue::DurableQueue>      queue,
           std::shared_ptr<delivery::DeliveryClient> client,
           line::TagSet                              static_tags,
           IngestOptions                             ingest_options,
           DrainOptions                              drain_options,
           util::ClockFn                             clock = util::Now);
  ~Pipeline();

  Pipeline(const Pipeline&)            = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  void Start();

  // Requests stop and joins both threads. Idempotent.
  void Stop();

  bool Finished() const;

  // First failure of either loop, ExitCode::Ok after a clean stop.
  runtime::ExitCode Result() const;

  IngestLoop& Ingest() {
    return *ingest_;
  }
  DrainLoop& Drain() {
    return *drain_;
  }

 private:
  util::StopSignal            stop_;
  std::unique_ptr<IngestLoop> ingest_;
  std::unique_ptr<DrainLoop>  drain_;
  bool                        started_ = false;
};

} // namespace collector::pipeline
