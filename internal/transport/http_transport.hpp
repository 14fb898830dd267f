#pragma once

#include "http_message.hpp"

namespace collector::transport {

/*
  One request, one response. Implementations never throw for network
  failures; they report them through TransportResult.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual TransportResult Send(const HttpRequest& request) = 0;
};

} // namespace collector::transport
