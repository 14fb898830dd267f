#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/exit_code.hpp"
#include "internal/util/errors.hpp"

using collector::observability::IntField;
using collector::observability::StringField;
using collector::runtime::ExitCode;
using collector::runtime::ToInt;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static int Fail(ExitCode code, const char* what, const std::exception& e) {
  COLLECTOR_LOG_ERROR(what, {StringField("error", e.what()), IntField("exit_code", ToInt(code))});
  collector::observability::ShutdownLogging();
  return ToInt(code);
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2 && std::string(argv[1]) != "--config") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: serial-collector <config.yaml> OR serial-collector --config <config.yaml>" << std::endl;
    return ToInt(ExitCode::Usage);
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = collector::config::ConfigLoader::LoadFromYaml(config_path);

    collector::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = collector::factory::Build(config);

    // Register signal handlers before starting the threads to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.pipeline->Start();
    COLLECTOR_LOG_INFO("Serial collector started",
                       {StringField("device", config.serial().device()),
                        StringField("influxdb", config.influxdb().host()),
                        StringField("queue", config.queue().path())});

    while (g_running && !app.pipeline->Finished()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    COLLECTOR_LOG_INFO("Shutting down serial collector");

    app.pipeline->Stop();
    const auto code = app.pipeline->Result();

    COLLECTOR_LOG_INFO("Serial collector stopped",
                       {StringField("status", collector::runtime::ToString(code)),
                        IntField("pending", static_cast<int64_t>(app.queue->Size()))});
    collector::observability::ShutdownLogging();
    return ToInt(code);
  } catch (const collector::util::InvalidConfig& e) {
    return Fail(ExitCode::InvalidConfig, "Invalid configuration", e);
  } catch (const collector::util::QueueUnavailable& e) {
    return Fail(ExitCode::QueueUnavailable, "Durable queue unavailable", e);
  } catch (const std::exception& e) {
    return Fail(ExitCode::Fatal, "Fatal error", e);
  }
}
