#pragma once

#include <chrono>
#include <string>

#include "http_transport.hpp"

namespace collector::transport {

struct Endpoint {
  std::string host;
  std::string port;
};

// "host", "host:port", "[v6addr]:port". Missing port uses `default_port`.
// Throws util::InvalidConfig on an empty host or a non-numeric port.
Endpoint ParseEndpoint(const std::string& host_port, const std::string& default_port = "8086");

/*
  Plain HTTP/1.1 over a fresh TCP connection per request.

  Connect, send and receive share one deadline of `timeout` from the start
  of Send(). The response is read until the peer closes the connection.
*/
class SocketHttpTransport final : public HttpTransport {
 public:
  SocketHttpTransport(Endpoint endpoint, std::chrono::milliseconds timeout);

  TransportResult Send(const HttpRequest& request) override;

 private:
  Endpoint                  endpoint_;
  std::chrono::milliseconds timeout_;
};

} // namespace collector::transport
