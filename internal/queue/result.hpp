#pragma once

#include <string>

namespace collector::queue {

/*
  Portable queue result codes.

  Backends translate their own failures (sqlite return codes, capacity
  limits) into these. Callers never see sqlite error types.
*/

enum class QueueError {
  OK = 0,

  // The durable log cannot accept or serve data: disk full, I/O error,
  // corruption, size cap reached. Ingestion must stop.
  Unavailable,

  // Acknowledge of an entry while an older one is still pending.
  OutOfOrder
};

struct Result {
  QueueError  code = QueueError::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(QueueError c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == QueueError::OK;
  }
};

const char* ToString(QueueError code);

} // namespace collector::queue
