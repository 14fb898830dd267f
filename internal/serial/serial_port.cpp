#include "serial_port.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace collector::serial {

bool IsSupportedBaudRate(uint32_t baud) {
  speed_t speed;
  return SerialPort::BaudToSpeed(baud, &speed);
}

SerialPort::~SerialPort() {
  Close();
}

bool SerialPort::Open(const SerialOptions& options, std::string* error) {
  Close();

  fd_ = ::open(options.device.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) {
    *error = options.device + ": " + std::strerror(errno);
    return false;
  }

  if (::isatty(fd_) && !Configure(options.baud_rate, error)) {
    *error = options.device + ": " + *error;
    Close();
    return false;
  }
  return true;
}

void SerialPort::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialPort::Configure(uint32_t baud, std::string* error) {
  struct termios tio;
  std::memset(&tio, 0, sizeof(tio));

  if (::tcgetattr(fd_, &tio) != 0) {
    *error = std::string("tcgetattr: ") + std::strerror(errno);
    return false;
  }

  // Raw mode, 8N1, no flow control
  tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY));
  tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
  tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
  tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
  tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD | CS8);
#ifdef CRTSCTS
  tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif

  // poll() does the waiting
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  speed_t speed;
  if (!BaudToSpeed(baud, &speed)) {
    *error = "unsupported baud rate " + std::to_string(baud);
    return false;
  }
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);

  if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
    *error = std::string("tcsetattr: ") + std::strerror(errno);
    return false;
  }

  ::tcflush(fd_, TCIFLUSH);
  return true;
}

bool SerialPort::BaudToSpeed(uint32_t baud, speed_t* out) {
  switch (baud) {
    case 1200U:
      *out = B1200;
      return true;
    case 2400U:
      *out = B2400;
      return true;
    case 4800U:
      *out = B4800;
      return true;
    case 9600U:
      *out = B9600;
      return true;
    case 19200U:
      *out = B19200;
      return true;
    case 38400U:
      *out = B38400;
      return true;
    case 57600U:
      *out = B57600;
      return true;
    case 115200U:
      *out = B115200;
      return true;
    case 230400U:
      *out = B230400;
      return true;
#ifdef B460800
    case 460800U:
      *out = B460800;
      return true;
#endif
#ifdef B921600
    case 921600U:
      *out = B921600;
      return true;
#endif
    default:
      return false;
  }
}

} // namespace collector::serial
