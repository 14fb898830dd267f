#include "serial_line_source.hpp"

#include <utility>

namespace collector::serial {

SerialLineSource::SerialLineSource(SerialOptions port_options, LineReaderOptions reader_options)
    : port_options_(std::move(port_options)), reader_(reader_options) {
}

bool SerialLineSource::Open(std::string* error) {
  port_.Close();
  if (!port_.Open(port_options_, error)) {
    return false;
  }
  reader_.Reset();
  return true;
}

void SerialLineSource::Close() {
  port_.Close();
}

ReadStatus SerialLineSource::ReadLine(const util::StopSignal& stop, std::string* line, std::string* error) {
  if (!port_.IsOpen()) {
    *error = "device not open";
    return ReadStatus::Error;
  }
  return reader_.ReadLine(port_.Fd(), stop, line, error);
}

std::string SerialLineSource::Describe() const {
  return port_options_.device + "@" + std::to_string(port_options_.baud_rate);
}

} // namespace collector::serial
