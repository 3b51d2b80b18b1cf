#ifndef ROVER_BRIDGE_CRC16_HPP_
#define ROVER_BRIDGE_CRC16_HPP_
/**
 * @file crc16.hpp
 * @brief CRC16-CCITT-FALSE implementation (poly=0x1021, init=0xFFFF).
 */

#include <cstddef>
#include <cstdint>

namespace rover_bridge {

/**
 * @brief Continue a CRC16-CCITT-FALSE computation over more bytes.
 * @param crc Running CRC value (start with 0xFFFF).
 * @param data Pointer to bytes.
 * @param len Number of bytes.
 * @return Updated CRC16 value.
 */
inline uint16_t crc16_ccitt_update(uint16_t crc, const uint8_t* data, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    crc ^= static_cast<uint16_t>(data[i]) << 8;
    for (int b = 0; b < 8; ++b) {
      if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

/**
 * @brief Compute CRC16-CCITT-FALSE over a byte buffer.
 * @note No reflection, no final XOR. Must match the companion implementation!
 */
inline uint16_t crc16_ccitt_false(const uint8_t* data, size_t len) {
  return crc16_ccitt_update(0xFFFF, data, len);
}

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_CRC16_HPP_
