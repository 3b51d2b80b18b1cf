#include "rover_bridge/serial_port.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

namespace rover_bridge {

speed_t toSpeed(int baud) {
  switch (baud) {
    case 57600:  return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 921600: return B921600;
    default: throw std::runtime_error("Unsupported baud rate " + std::to_string(baud));
  }
}

SerialPort::SerialPort(const std::string& device, int baud)
: device_(device), speed_(toSpeed(baud)) {}

SerialPort::~SerialPort() {
  close();
}

bool SerialPort::open() {
  // Close existing if any open to ensure clean state
  close();

  fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) return false;

  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) { close(); return false; }
  cfmakeraw(&tty);

  cfsetispeed(&tty, speed_);
  cfsetospeed(&tty, speed_);

  tty.c_cflag |= (CLOCAL | CREAD); // ignore modem controls, enable reading
  tty.c_cflag &= ~CRTSCTS;         // no hardware flow control
  tty.c_cflag &= ~CSTOPB;          // 1 stop bit
  tty.c_cflag &= ~PARENB;          // no parity
  tty.c_cflag &= ~CSIZE;           // clear data bits setting
  tty.c_cflag |= CS8;              // 8 data bits

  tty.c_cc[VMIN]  = 0; // return immediately
  tty.c_cc[VTIME] = 0;

  // Apply settings; immediately close on failure
  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    close();
    return false;
  }
  tcflush(fd_, TCIOFLUSH);
  return true;
}

void SerialPort::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

size_t SerialPort::read(uint8_t* buf, size_t max) {
  if (fd_ < 0 || max == 0) return 0;
  const ssize_t n = ::read(fd_, buf, max);
  if (n > 0) return static_cast<size_t>(n);
  if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
    // Error: close; owner retries
    ++io_errors_;
    close();
  }
  return 0;
}

size_t SerialPort::write(const uint8_t* data, size_t n) {
  if (fd_ < 0 || n == 0) return 0;
  const ssize_t w = ::write(fd_, data, n);
  if (w >= 0) return static_cast<size_t>(w);
  if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
    ++io_errors_;
    close();
  }
  return 0;
}

}  // namespace rover_bridge
