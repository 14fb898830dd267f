#include "delivery_client.hpp"

#include "internal/observability/logging.hpp"

namespace collector::delivery {

using collector::observability::IntField;
using collector::observability::StringField;

namespace {

constexpr size_t kMaxBodyInMessage = 512;

std::string Truncate(const std::string& s) {
  if (s.size() <= kMaxBodyInMessage) return s;
  return s.substr(0, kMaxBodyInMessage) + "...";
}

void AppendParam(std::string* target, const char* name, const std::string& value) {
  if (value.empty()) return;
  *target += (target->find('?') == std::string::npos) ? '?' : '&';
  *target += name;
  *target += '=';
  *target += transport::UrlEncode(value);
}

std::string BuildTargetPath(const InfluxTarget& target) {
  std::string path;
  if (target.api == ApiVersion::V2) {
    path = "/api/v2/write";
    AppendParam(&path, "org", target.org);
    AppendParam(&path, "bucket", target.bucket);
  } else {
    path = "/write";
    AppendParam(&path, "db", target.database);
    AppendParam(&path, "rp", target.retention_policy);
    AppendParam(&path, "u", target.username);
    AppendParam(&path, "p", target.password);
  }
  AppendParam(&path, "precision", "ns");
  return path;
}

} // namespace

const char* ToString(DeliveryError code) {
  switch (code) {
    case DeliveryError::OK:
      return "ok";
    case DeliveryError::Transient:
      return "transient";
    case DeliveryError::Rejected:
      return "rejected";
    case DeliveryError::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

DeliveryClient::DeliveryClient(std::shared_ptr<transport::HttpTransport> transport, InfluxTarget target, RetryPolicy policy)
    : transport_(std::move(transport)), target_(std::move(target)), policy_(policy), target_path_(BuildTargetPath(target_)) {
}

transport::HttpRequest DeliveryClient::BuildRequest(const std::vector<std::string>& lines) const {
  transport::HttpRequest request;
  request.method = "POST";
  request.target = target_path_;
  request.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
  if (target_.api == ApiVersion::V2 && !target_.token.empty()) {
    request.headers.emplace_back("Authorization", "Token " + target_.token);
  }

  size_t size = 0;
  for (const auto& line : lines) size += line.size() + 1;
  request.body.reserve(size);
  for (const auto& line : lines) {
    request.body += line;
    request.body += '\n';
  }
  return request;
}

DeliveryResult DeliveryClient::Classify(const transport::TransportResult& response) {
  DeliveryResult result;
  if (!response) {
    result.code    = DeliveryError::Transient;
    result.message = std::string(transport::ToString(response.status)) + ": " + response.message;
    return result;
  }

  const int status   = response.http_status;
  result.http_status = status;
  if (status >= 200 && status < 300) {
    return result;
  }
  if (status >= 500 || status == 429 || status == 408) {
    result.code    = DeliveryError::Transient;
    result.message = "status " + std::to_string(status) + ": " + Truncate(response.body);
    return result;
  }

  result.code    = DeliveryError::Rejected;
  result.message = "status " + std::to_string(status) + ": " + Truncate(response.body);
  return result;
}

DeliveryResult DeliveryClient::Deliver(const std::vector<std::string>& lines, const util::StopSignal& stop) {
  const auto request = BuildRequest(lines);
  Backoff    backoff(policy_);

  while (true) {
    auto result     = Classify(transport_->Send(request));
    result.attempts = backoff.Attempts() + 1;
    if (result.code != DeliveryError::Transient) {
      return result;
    }

    const auto now = Backoff::SteadyClock::now();
    if (!backoff.RecordFailure(now)) {
      return result;
    }

    COLLECTOR_LOG_WARN("InfluxDB write failed, retrying",
                       {IntField("attempt", backoff.Attempts()), IntField("lines", static_cast<int64_t>(lines.size())),
                        IntField("retry_in_ms", backoff.CurrentDelay().count()), StringField("error", result.message)});

    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(backoff.NextRetryAt() - now);
    if (!stop.WaitFor(wait)) {
      result.code = DeliveryError::Cancelled;
      result.message += " (stopped while waiting to retry)";
      return result;
    }
  }
}

} // namespace collector::delivery
