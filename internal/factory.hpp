#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/delivery/delivery_client.hpp"
#include "internal/pipeline/pipeline.hpp"
#include "internal/queue/durable_queue.hpp"

namespace collector::factory {

/*
  Composition root.

  The only place that knows concrete queue, transport and serial types.
  Construction failures throw util::QueueUnavailable or
  util::InvalidConfig.
*/
struct Application {
  std::shared_ptr<queue::DurableQueue>      queue;
  std::shared_ptr<delivery::DeliveryClient> client;
  std::unique_ptr<pipeline::Pipeline>       pipeline;
};

std::shared_ptr<queue::DurableQueue> BuildQueue(const collector::runtime::config::QueueConfig& config);

std::shared_ptr<delivery::DeliveryClient> BuildDeliveryClient(const collector::runtime::config::RuntimeConfig& config);

Application Build(const collector::runtime::config::RuntimeConfig& config);

} // namespace collector::factory
