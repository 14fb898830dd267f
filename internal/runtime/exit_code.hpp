#pragma once

namespace collector::runtime {

// Process exit status of serial-collector.
enum class ExitCode : int {
  Ok                = 0,
  Usage             = 1,
  InvalidConfig     = 2,
  QueueUnavailable  = 3,
  SerialUnavailable = 4,
  Fatal             = 5
};

inline int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

inline const char* ToString(ExitCode code) {
  switch (code) {
    case ExitCode::Ok:
      return "ok";
    case ExitCode::Usage:
      return "usage";
    case ExitCode::InvalidConfig:
      return "invalid_config";
    case ExitCode::QueueUnavailable:
      return "queue_unavailable";
    case ExitCode::SerialUnavailable:
      return "serial_unavailable";
    case ExitCode::Fatal:
      return "fatal";
  }
  return "unknown";
}

} // namespace collector::runtime
