#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <vector>

#include "internal/line/static_tags.hpp"
#include "internal/serial/serial_port.hpp"
#include "internal/util/errors.hpp"

namespace collector::config {

using collector::runtime::config::RuntimeConfig;
using collector::util::InvalidConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are strings, whatever they look like
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw InvalidConfig("Unsupported YAML node");
  }
}

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  if (!yaml.IsMap()) {
    throw InvalidConfig("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* serial = config->mutable_serial();
  if (serial->baud_rate() == 0) serial->set_baud_rate(9600);
  if (serial->max_line_length() == 0) serial->set_max_line_length(1024);
  if (!serial->has_skip_first_line()) serial->set_skip_first_line(true);
  if (serial->reconnect_initial_backoff_ms() == 0) serial->set_reconnect_initial_backoff_ms(1000);
  if (serial->reconnect_max_backoff_ms() == 0) serial->set_reconnect_max_backoff_ms(60000);

  auto* queue = config->mutable_queue();
  if (queue->synchronous().empty()) queue->set_synchronous("FULL");
  if (queue->wal_autocheckpoint() == 0) queue->set_wal_autocheckpoint(10);
  if (queue->batch_size() == 0) queue->set_batch_size(100);
  if (queue->poll_interval_ms() == 0) queue->set_poll_interval_ms(1000);

  auto* influx = config->mutable_influxdb();
  if (influx->host().empty()) influx->set_host("localhost:8086");
  if (influx->api().empty()) influx->set_api("v1");
  if (influx->timeout_ms() == 0) influx->set_timeout_ms(10000);
  if (influx->rejected_retry_interval_ms() == 0) influx->set_rejected_retry_interval_ms(60000);

  auto* retry = config->mutable_retry();
  if (retry->initial_backoff_ms() == 0) retry->set_initial_backoff_ms(1000);
  if (retry->max_backoff_ms() == 0) retry->set_max_backoff_ms(60000);
  if (retry->multiplier() == 0) retry->set_multiplier(2.0);

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& port = config.serial();
  if (port.device().empty()) {
    throw InvalidConfig("serial.device is required");
  }
  if (!serial::IsSupportedBaudRate(port.baud_rate())) {
    throw InvalidConfig("serial.baud_rate " + std::to_string(port.baud_rate()) + " is not supported");
  }
  if (port.reconnect_initial_backoff_ms() > port.reconnect_max_backoff_ms()) {
    throw InvalidConfig("serial.reconnect_initial_backoff_ms exceeds serial.reconnect_max_backoff_ms");
  }

  const std::vector<std::string> tags(config.tags().begin(), config.tags().end());
  line::ValidateStaticTags(tags);

  const auto& queue = config.queue();
  if (queue.synchronous() != "FULL" && queue.synchronous() != "NORMAL") {
    throw InvalidConfig("queue.synchronous must be FULL or NORMAL, got '" + queue.synchronous() + "'");
  }

  const auto& influx = config.influxdb();
  if (influx.api() == "v1") {
    if (influx.database().empty()) throw InvalidConfig("influxdb.database is required for api v1");
  } else if (influx.api() == "v2") {
    if (influx.bucket().empty()) throw InvalidConfig("influxdb.bucket is required for api v2");
  } else {
    throw InvalidConfig("influxdb.api must be v1 or v2, got '" + influx.api() + "'");
  }
  for (auto status : influx.skip_on_status()) {
    if (status < 400 || status > 599) {
      throw InvalidConfig("influxdb.skip_on_status entries must be HTTP error statuses, got " + std::to_string(status));
    }
  }

  const auto& retry = config.retry();
  if (retry.multiplier() < 1.0) {
    throw InvalidConfig("retry.multiplier must be at least 1.0");
  }
  if (retry.initial_backoff_ms() > retry.max_backoff_ms()) {
    throw InvalidConfig("retry.initial_backoff_ms exceeds retry.max_backoff_ms");
  }
}

} // namespace collector::config
