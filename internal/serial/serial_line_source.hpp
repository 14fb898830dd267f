#pragma once

#include "line_reader.hpp"
#include "line_source.hpp"
#include "serial_port.hpp"

namespace collector::serial {

class SerialLineSource final : public LineSource {
 public:
  SerialLineSource(SerialOptions port_options, LineReaderOptions reader_options);

  bool Open(std::string* error) override;
  void Close() override;

  ReadStatus ReadLine(const util::StopSignal& stop, std::string* line, std::string* error) override;

  std::string Describe() const override;

  uint64_t OverflowCount() const {
    return reader_.OverflowCount();
  }

 private:
  SerialOptions port_options_;
  SerialPort    port_;
  LineReader    reader_;
};

} // namespace collector::serial
