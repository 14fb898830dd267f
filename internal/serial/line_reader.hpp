#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/util/stop_signal.hpp"

namespace collector::serial {

enum class ReadStatus {
  Line,
  Stopped,

  // no byte for longer than the inactivity timeout
  Timeout,

  // end of stream: device unplugged, pty or pipe writer gone
  Closed,
  Error
};

const char* ToString(ReadStatus status);

struct LineReaderOptions {
  size_t max_line_length = 1024;

  // 0 = wait forever
  std::chrono::milliseconds inactivity_timeout{0};

  // The first line after opening is most likely cut in half.
  bool skip_first_line = true;
};

/*
  Splits a byte stream read from a non-blocking fd into lines.

  Waits with poll() in short slices so a stop request is noticed without
  a read timeout on the device itself. A line longer than max_line_length
  is dropped up to its terminating newline.
*/
class LineReader {
 public:
  static constexpr std::chrono::milliseconds kPollSlice{200};

  explicit LineReader(LineReaderOptions options);

  // Forget buffered bytes; call after (re)opening the fd.
  void Reset();

  ReadStatus ReadLine(int fd, const util::StopSignal& stop, std::string* line, std::string* error);

  uint64_t OverflowCount() const {
    return overflows_;
  }

 private:
  bool TakeLine(std::string* line);

  LineReaderOptions options_;
  std::string       buffer_;
  bool              discarding_ = false;
  bool              skip_next_  = false;
  uint64_t          overflows_  = 0;
};

} // namespace collector::serial
