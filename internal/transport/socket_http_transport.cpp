#include "socket_http_transport.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace collector::transport {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr size_t kMaxResponseBytes = 1 << 20;

class ScopedFd {
 public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {
  }
  ~ScopedFd() {
    if (fd_ >= 0) ::close(fd_);
  }

  ScopedFd(const ScopedFd&)            = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  void Reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

  int Get() const {
    return fd_;
  }

  int Release() {
    const int fd = fd_;
    fd_          = -1;
    return fd;
  }

 private:
  int fd_;
};

int RemainingMs(SteadyClock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

// Waits for `events` on fd. Returns 1 ready, 0 timeout, -1 error.
int WaitFd(int fd, short events, SteadyClock::time_point deadline) {
  pollfd pfd{};
  pfd.fd     = fd;
  pfd.events = events;
  while (true) {
    const int rc = ::poll(&pfd, 1, RemainingMs(deadline));
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) return rc;
    return 1;
  }
}

TransportResult Failure(TransportStatus status, std::string message) {
  TransportResult result;
  result.status  = status;
  result.message = std::move(message);
  return result;
}

TransportResult Connect(const Endpoint& endpoint, SteadyClock::time_point deadline, ScopedFd* out) {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* addrs = nullptr;
  const int gai   = ::getaddrinfo(endpoint.host.c_str(), endpoint.port.c_str(), &hints, &addrs);
  if (gai != 0) {
    return Failure(TransportStatus::ConnectFailed, "resolve " + endpoint.host + ": " + ::gai_strerror(gai));
  }

  std::string last_error = "no usable address";
  bool        timed_out  = false;
  for (addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
    ScopedFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (fd.Get() < 0) {
      last_error = std::strerror(errno);
      continue;
    }

    const int flags = ::fcntl(fd.Get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd.Get(), F_SETFL, flags | O_NONBLOCK) < 0) {
      last_error = std::strerror(errno);
      continue;
    }

    if (::connect(fd.Get(), ai->ai_addr, ai->ai_addrlen) < 0) {
      if (errno != EINPROGRESS) {
        last_error = std::strerror(errno);
        continue;
      }
      const int ready = WaitFd(fd.Get(), POLLOUT, deadline);
      if (ready == 0) {
        timed_out  = true;
        last_error = "connect timed out";
        break;
      }
      int       so_error = 0;
      socklen_t len      = sizeof(so_error);
      if (ready < 0 || ::getsockopt(fd.Get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
        last_error = std::strerror(so_error != 0 ? so_error : errno);
        continue;
      }
    }

    ::freeaddrinfo(addrs);
    out->Reset(fd.Release());
    return TransportResult{};
  }

  ::freeaddrinfo(addrs);
  return Failure(timed_out ? TransportStatus::Timeout : TransportStatus::ConnectFailed,
                 "connect " + endpoint.host + ":" + endpoint.port + ": " + last_error);
}

} // namespace

Endpoint ParseEndpoint(const std::string& host_port, const std::string& default_port) {
  Endpoint endpoint;
  if (!host_port.empty() && host_port.front() == '[') {
    const auto close = host_port.find(']');
    if (close == std::string::npos) {
      throw util::InvalidConfig("bad endpoint '" + host_port + "'");
    }
    endpoint.host = host_port.substr(1, close - 1);
    if (close + 1 < host_port.size()) {
      if (host_port[close + 1] != ':') {
        throw util::InvalidConfig("bad endpoint '" + host_port + "'");
      }
      endpoint.port = host_port.substr(close + 2);
    }
  } else {
    const auto colon = host_port.rfind(':');
    if (colon == std::string::npos) {
      endpoint.host = host_port;
    } else {
      endpoint.host = host_port.substr(0, colon);
      endpoint.port = host_port.substr(colon + 1);
    }
  }

  if (endpoint.port.empty()) {
    endpoint.port = default_port;
  }
  if (endpoint.host.empty()) {
    throw util::InvalidConfig("endpoint '" + host_port + "' has no host");
  }
  if (!std::all_of(endpoint.port.begin(), endpoint.port.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    throw util::InvalidConfig("endpoint '" + host_port + "' has a non-numeric port");
  }
  return endpoint;
}

SocketHttpTransport::SocketHttpTransport(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
}

TransportResult SocketHttpTransport::Send(const HttpRequest& request) {
  const auto deadline = SteadyClock::now() + timeout_;

  ScopedFd fd;
  auto     connected = Connect(endpoint_, deadline, &fd);
  if (!connected) return connected;

  const bool  is_v6       = endpoint_.host.find(':') != std::string::npos;
  const auto  host_header = (is_v6 ? "[" + endpoint_.host + "]" : endpoint_.host) + ":" + endpoint_.port;
  const auto  wire        = FormatRequest(request, host_header);
  size_t      sent        = 0;
  while (sent < wire.size()) {
    const int ready = WaitFd(fd.Get(), POLLOUT, deadline);
    if (ready == 0) return Failure(TransportStatus::Timeout, "send timed out");
    if (ready < 0) return Failure(TransportStatus::IOError, std::string("send: ") + std::strerror(errno));

    const auto n = ::send(fd.Get(), wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return Failure(TransportStatus::IOError, std::string("send: ") + std::strerror(errno));
    }
    sent += static_cast<size_t>(n);
  }

  std::string response;
  char        buf[4096];
  while (true) {
    const int ready = WaitFd(fd.Get(), POLLIN, deadline);
    if (ready == 0) return Failure(TransportStatus::Timeout, "response timed out");
    if (ready < 0) return Failure(TransportStatus::IOError, std::string("recv: ") + std::strerror(errno));

    const auto n = ::recv(fd.Get(), buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return Failure(TransportStatus::IOError, std::string("recv: ") + std::strerror(errno));
    }
    if (n == 0) break;
    response.append(buf, static_cast<size_t>(n));
    if (response.size() > kMaxResponseBytes) {
      return Failure(TransportStatus::ProtocolError, "response larger than 1 MiB");
    }
  }

  TransportResult result;
  if (!ParseResponse(response, &result)) {
    result.message += " (" + std::to_string(response.size()) + " bytes received)";
  }
  return result;
}

} // namespace collector::transport
