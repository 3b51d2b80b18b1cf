#pragma once
/**
 * @file byte_stream.hpp
 * @brief Non-blocking byte transport used by the control loop.
 */

#include <cstddef>
#include <cstdint>

namespace rover_bridge {

/**
 * @brief Point-to-point byte transport.
 *
 * Neither call may wait: read() returns 0 when nothing is available and
 * write() returns a short count when the transport would block.
 */
class ByteStream {
public:
  virtual ~ByteStream() = default;

  /** @brief Read up to @p max bytes; returns the number read. */
  virtual size_t read(uint8_t* buf, size_t max) = 0;

  /** @brief Write up to @p n bytes; returns the number written. */
  virtual size_t write(const uint8_t* data, size_t n) = 0;
};

}  // namespace rover_bridge
