#pragma once

#include <string>

#include "line_reader.hpp"
#include "internal/util/stop_signal.hpp"

namespace collector::serial {

/*
  Where the ingest loop gets its raw lines from.

  Open() may be called again after Close() to reconnect. ReadLine()
  blocks until a complete line, stop, or a failure of the underlying
  device.
*/
class LineSource {
 public:
  virtual ~LineSource() = default;

  virtual bool Open(std::string* error) = 0;
  virtual void Close()                  = 0;

  virtual ReadStatus ReadLine(const util::StopSignal& stop, std::string* line, std::string* error) = 0;

  // Human-readable name of the source for log messages.
  virtual std::string Describe() const = 0;
};

} // namespace collector::serial
