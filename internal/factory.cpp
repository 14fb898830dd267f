#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/line/static_tags.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/memory/memory_queue.hpp"
#include "internal/queue/sqlite/sqlite_db.hpp"
#include "internal/queue/sqlite/sqlite_queue.hpp"
#include "internal/serial/serial_line_source.hpp"
#include "internal/transport/socket_http_transport.hpp"
#include "internal/util/errors.hpp"

namespace collector::factory {

using collector::observability::IntField;
using collector::observability::StringField;
using collector::runtime::config::QueueConfig;
using collector::runtime::config::RuntimeConfig;

namespace {

delivery::RetryPolicy ToRetryPolicy(const collector::runtime::config::RetryConfig& retry) {
  delivery::RetryPolicy policy;
  policy.initial_backoff = std::chrono::milliseconds(retry.initial_backoff_ms());
  policy.max_backoff     = std::chrono::milliseconds(retry.max_backoff_ms());
  policy.multiplier      = retry.multiplier();
  policy.max_attempts    = retry.max_attempts();
  return policy;
}

std::shared_ptr<serial::LineSource> BuildLineSource(const collector::runtime::config::SerialConfig& config) {
  serial::SerialOptions port;
  port.device    = config.device();
  port.baud_rate = config.baud_rate();

  serial::LineReaderOptions reader;
  reader.max_line_length    = config.max_line_length();
  reader.inactivity_timeout = std::chrono::seconds(config.read_timeout_sec());
  reader.skip_first_line    = config.skip_first_line();

  return std::make_shared<serial::SerialLineSource>(std::move(port), reader);
}

} // namespace

std::shared_ptr<queue::DurableQueue> BuildQueue(const QueueConfig& config) {
  if (config.path().empty() || config.path() == ":memory:") {
    COLLECTOR_LOG_WARN("Using in-memory queue; queued lines are lost on exit",
                       {IntField("max_entries", config.max_entries())});
    return std::make_shared<queue::memory::MemoryQueue>(config.max_entries());
  }

  queue::sqlite::SqliteOptions options;
  options.path               = config.path();
  options.synchronous        = config.synchronous();
  options.wal_autocheckpoint = config.wal_autocheckpoint();
  options.max_size_bytes     = config.max_size_bytes();

  try {
    auto db    = std::make_shared<queue::sqlite::SqliteDB>(options);
    auto sqlite_queue = std::make_shared<queue::sqlite::SqliteQueue>(std::move(db));
    COLLECTOR_LOG_INFO("Durable queue opened",
                       {StringField("path", config.path()), IntField("pending", static_cast<int64_t>(sqlite_queue->Size()))});
    return sqlite_queue;
  } catch (const std::runtime_error& e) {
    throw util::QueueUnavailable(e.what());
  }
}

std::shared_ptr<delivery::DeliveryClient> BuildDeliveryClient(const RuntimeConfig& config) {
  const auto& influx = config.influxdb();

  auto transport = std::make_shared<transport::SocketHttpTransport>(transport::ParseEndpoint(influx.host()),
                                                                    std::chrono::milliseconds(influx.timeout_ms()));

  delivery::InfluxTarget target;
  target.api              = influx.api() == "v2" ? delivery::ApiVersion::V2 : delivery::ApiVersion::V1;
  target.database         = influx.database();
  target.retention_policy = influx.retention_policy();
  target.username         = influx.username();
  target.password         = influx.password();
  target.org              = influx.org();
  target.bucket           = influx.bucket();
  target.token            = influx.token();

  return std::make_shared<delivery::DeliveryClient>(std::move(transport), std::move(target), ToRetryPolicy(config.retry()));
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  const std::vector<std::string> tag_entries(config.tags().begin(), config.tags().end());
  auto                           static_tags = line::ParseStaticTags(tag_entries);

  app.queue  = BuildQueue(config.queue());
  app.client = BuildDeliveryClient(config);

  pipeline::IngestOptions ingest;
  ingest.reconnect.initial_backoff = std::chrono::milliseconds(config.serial().reconnect_initial_backoff_ms());
  ingest.reconnect.max_backoff     = std::chrono::milliseconds(config.serial().reconnect_max_backoff_ms());

  pipeline::DrainOptions drain;
  drain.batch_size              = config.queue().batch_size();
  drain.poll_interval           = std::chrono::milliseconds(config.queue().poll_interval_ms());
  drain.rejected_retry_interval = std::chrono::milliseconds(config.influxdb().rejected_retry_interval_ms());
  drain.skip_on_status.assign(config.influxdb().skip_on_status().begin(), config.influxdb().skip_on_status().end());

  app.pipeline = std::make_unique<pipeline::Pipeline>(BuildLineSource(config.serial()),
                                                      app.queue,
                                                      app.client,
                                                      std::move(static_tags),
                                                      ingest,
                                                      std::move(drain));
  return app;
}

} // namespace collector::factory
