#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace collector::transport {

struct HttpRequest {
  std::string method = "POST";
  // origin-form target, e.g. "/write?db=sensors&precision=ns"
  std::string target;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

enum class TransportStatus {
  OK = 0,

  // name resolution failed or no address accepted the connection
  ConnectFailed,
  Timeout,
  IOError,

  // the peer answered with something that is not HTTP/1.x
  ProtocolError
};

struct TransportResult {
  TransportStatus status      = TransportStatus::OK;
  int             http_status = 0;
  std::string     body;
  std::string     message;

  explicit operator bool() const {
    return status == TransportStatus::OK;
  }
};

const char* ToString(TransportStatus status);

// Serializes `request` as HTTP/1.1 with Host, Content-Length and
// "Connection: close" added.
std::string FormatRequest(const HttpRequest& request, std::string_view host_header);

// Parses a complete response (read until EOF). Handles Content-Length and
// chunked bodies. Returns false with out->message set on malformed input.
bool ParseResponse(std::string_view raw, TransportResult* out);

// RFC 3986 percent-encoding for query values.
std::string UrlEncode(std::string_view value);

} // namespace collector::transport
