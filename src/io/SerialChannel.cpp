/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - termios setup, input flush, port discovery
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>
#include <stdexcept>

// Linux headers
#include <fcntl.h> // Contains file controls like O_RDWR

// labcomm headers
#include "io/SerialChannel.hpp"

using namespace labcomm::io;

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  const int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    logErrno("open");
    return false;
  }
  adopt(fd);

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    logErrno("tcgetattr");
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~(PARENB | CSTOPB);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= CREAD | CLOCAL;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    logErrno("tcsetattr");
    close();
    return false;
  }

  // stale bytes from a previous session would desync the framing
  tcflush(fd_, TCIOFLUSH);
  return true;
}

void SerialChannel::discardInput() {
  if (fd_ >= 0 && tcflush(fd_, TCIFLUSH) != 0)
    logErrno("tcflush");
  StreamChannel::discardInput();
}

speed_t labcomm::io::toSpeed(int baudrate) {
  switch (baudrate) {
  case 1200:
    return B1200;
  case 2400:
    return B2400;
  case 4800:
    return B4800;
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  default:
    throw std::invalid_argument("unsupported baud rate: " + std::to_string(baudrate));
  }
}

std::vector<std::string> labcomm::io::listSerialPorts() {
  namespace fs = std::filesystem;

  std::vector<std::string> ports;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/dev", ec)) {
    const auto name = entry.path().filename().string();
    if (name.starts_with("ttyUSB") || name.starts_with("ttyACM"))
      ports.push_back(entry.path().string());
  }
  std::sort(ports.begin(), ports.end());
  return ports;
}
