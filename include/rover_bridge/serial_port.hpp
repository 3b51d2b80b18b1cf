#ifndef ROVER_BRIDGE_SERIAL_PORT_HPP_
#define ROVER_BRIDGE_SERIAL_PORT_HPP_
/**
 * @file serial_port.hpp
 * @brief Non-blocking raw 8N1 serial port on a Linux tty.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include <termios.h>

#include "rover_bridge/byte_stream.hpp"

namespace rover_bridge {

/**
 * @brief Convert integer baud rate to termios speed_t.
 * @throws std::runtime_error if unsupported baud rate.
 */
speed_t toSpeed(int baud);

/**
 * @brief Serial port ByteStream.
 *
 * Owns the file descriptor (RAII) and is non-copyable. An I/O error closes
 * the port; the owner decides when to call open() again.
 */
class SerialPort final : public ByteStream {
public:
  /**
   * @param device Device node (e.g. "/dev/ttyTHS1").
   * @param baud   One of 57600, 115200, 230400, 921600.
   * @throws std::runtime_error on an unsupported baud rate.
   */
  SerialPort(const std::string& device, int baud);
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  /** @brief Open and configure the port. @return false on failure (errno preserved). */
  bool open();
  void close();
  bool isOpen() const { return fd_ >= 0; }

  size_t read(uint8_t* buf, size_t max) override;
  size_t write(const uint8_t* data, size_t n) override;

  const std::string& device() const { return device_; }
  uint64_t ioErrors() const { return io_errors_; }

private:
  std::string device_;
  speed_t speed_;
  int fd_{-1};
  uint64_t io_errors_{0};
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_SERIAL_PORT_HPP_
