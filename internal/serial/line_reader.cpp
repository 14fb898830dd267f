#include "line_reader.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"

namespace collector::serial {

using collector::observability::IntField;

const char* ToString(ReadStatus status) {
  switch (status) {
    case ReadStatus::Line:
      return "line";
    case ReadStatus::Stopped:
      return "stopped";
    case ReadStatus::Timeout:
      return "timeout";
    case ReadStatus::Closed:
      return "closed";
    case ReadStatus::Error:
      return "error";
  }
  return "unknown";
}

LineReader::LineReader(LineReaderOptions options) : options_(options) {
  Reset();
}

void LineReader::Reset() {
  buffer_.clear();
  discarding_ = false;
  skip_next_  = options_.skip_first_line;
}

bool LineReader::TakeLine(std::string* line) {
  while (true) {
    const auto newline = buffer_.find('\n');

    if (discarding_) {
      if (newline == std::string::npos) {
        buffer_.clear();
        return false;
      }
      buffer_.erase(0, newline + 1);
      discarding_ = false;
      continue;
    }

    if (newline == std::string::npos) {
      if (buffer_.size() > options_.max_line_length) {
        ++overflows_;
        COLLECTOR_LOG_WARN("Serial line exceeds maximum length, dropping it",
                           {IntField("max_line_length", static_cast<int64_t>(options_.max_line_length))});
        buffer_.clear();
        discarding_ = true;
      }
      return false;
    }

    std::string candidate = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!candidate.empty() && candidate.back() == '\r') {
      candidate.pop_back();
    }

    if (skip_next_) {
      skip_next_ = false;
      COLLECTOR_LOG_DEBUG("Skipped first, possibly partial, serial line");
      continue;
    }
    if (candidate.size() > options_.max_line_length) {
      ++overflows_;
      COLLECTOR_LOG_WARN("Serial line exceeds maximum length, dropping it",
                         {IntField("length", static_cast<int64_t>(candidate.size())),
                          IntField("max_line_length", static_cast<int64_t>(options_.max_line_length))});
      continue;
    }

    *line = std::move(candidate);
    return true;
  }
}

ReadStatus LineReader::ReadLine(int fd, const util::StopSignal& stop, std::string* line, std::string* error) {
  auto last_data = std::chrono::steady_clock::now();
  char buf[512];

  while (true) {
    if (TakeLine(line)) {
      return ReadStatus::Line;
    }
    if (stop.StopRequested()) {
      return ReadStatus::Stopped;
    }

    pollfd pfd{};
    pfd.fd     = fd;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(kPollSlice.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      *error = std::string("poll: ") + std::strerror(errno);
      return ReadStatus::Error;
    }

    if (rc == 0) {
      if (options_.inactivity_timeout.count() > 0 &&
          std::chrono::steady_clock::now() - last_data >= options_.inactivity_timeout) {
        *error = "no data for " + std::to_string(options_.inactivity_timeout.count() / 1000) + "s";
        return ReadStatus::Timeout;
      }
      continue;
    }

    if (pfd.revents & (POLLERR | POLLNVAL)) {
      *error = "device error";
      return ReadStatus::Error;
    }

    const auto n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      *error = std::string("read: ") + std::strerror(errno);
      return ReadStatus::Error;
    }
    if (n == 0) {
      *error = "end of stream";
      return ReadStatus::Closed;
    }

    buffer_.append(buf, static_cast<size_t>(n));
    last_data = std::chrono::steady_clock::now();
  }
}

} // namespace collector::serial
