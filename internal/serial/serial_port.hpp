#pragma once

#include <termios.h>

#include <cstdint>
#include <string>

namespace collector::serial {

struct SerialOptions {
  std::string device;
  uint32_t    baud_rate = 9600;
};

// True for the baud rates termios can express on this platform.
bool IsSupportedBaudRate(uint32_t baud);

/*
  RAII owner of a serial device file descriptor.

  The port is opened non-blocking and put in raw mode (8N1, no flow
  control); readers wait on it with poll(). Paths that are not a tty
  (a FIFO during tests, a socat pty pair) are opened without termios
  configuration.
*/
class SerialPort {
 public:
  SerialPort() = default;
  ~SerialPort();

  SerialPort(const SerialPort&)            = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  bool Open(const SerialOptions& options, std::string* error);
  void Close();

  bool IsOpen() const {
    return fd_ >= 0;
  }

  int Fd() const {
    return fd_;
  }

  static bool BaudToSpeed(uint32_t baud, speed_t* out);

 private:
  bool Configure(uint32_t baud, std::string* error);

  int fd_ = -1;
};

} // namespace collector::serial
