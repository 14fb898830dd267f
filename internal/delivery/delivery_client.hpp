#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "backoff.hpp"
#include "internal/transport/http_transport.hpp"
#include "internal/util/stop_signal.hpp"

namespace collector::delivery {

enum class ApiVersion {
  V1,
  V2
};

struct InfluxTarget {
  ApiVersion api = ApiVersion::V1;

  // v1
  std::string database;
  std::string retention_policy;
  std::string username;
  std::string password;

  // v2
  std::string org;
  std::string bucket;
  std::string token;
};

enum class DeliveryError {
  OK = 0,

  // retries exhausted on connection errors, timeouts, 5xx or 429
  Transient,

  // 4xx: the batch or the credentials are wrong; retrying the same
  // request cannot succeed
  Rejected,

  // stop requested while waiting for the next attempt
  Cancelled
};

struct DeliveryResult {
  DeliveryError code        = DeliveryError::OK;
  int           http_status = 0;
  uint32_t      attempts    = 0;
  std::string   message;

  explicit operator bool() const {
    return code == DeliveryError::OK;
  }
};

const char* ToString(DeliveryError code);

/*
  Writes batches of line protocol to InfluxDB.

  One Deliver() call issues one write request per attempt and retries
  transient failures with exponential backoff. Nothing is kept between
  calls; the backoff state lives on the stack of Deliver().
*/
class DeliveryClient {
 public:
  DeliveryClient(std::shared_ptr<transport::HttpTransport> transport, InfluxTarget target, RetryPolicy policy);

  DeliveryResult Deliver(const std::vector<std::string>& lines, const util::StopSignal& stop);

  transport::HttpRequest BuildRequest(const std::vector<std::string>& lines) const;

  // Outcome of a single attempt, before any retry decision.
  static DeliveryResult Classify(const transport::TransportResult& response);

  const RetryPolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<transport::HttpTransport> transport_;
  InfluxTarget                              target_;
  RetryPolicy                               policy_;
  std::string                               target_path_;
};

} // namespace collector::delivery
