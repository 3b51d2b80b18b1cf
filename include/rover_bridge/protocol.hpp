#ifndef ROVER_BRIDGE_PROTOCOL_HPP_
#define ROVER_BRIDGE_PROTOCOL_HPP_
/**
 * @file protocol.hpp
 * @brief Binary command/telemetry protocol between the companion computer and the bridge.
 *
 * Every message travels inside a frame:
 *
 *   [SYNC lo][SYNC hi][LEN][PAYLOAD x LEN][CRC lo][CRC hi]
 *
 * - Sync word per direction for re-synchronization
 * - One-byte payload length (max kMaxPayload)
 * - CRC16-CCITT-FALSE over LEN + PAYLOAD
 *
 * Payloads start with a message tag and carry signed fixed-point values in
 * milli-units (mm, mm/s, mrad, mrad/s). All fields are little-endian.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace rover_bridge {

/** @brief Sync word on frames from the companion (LE on the wire: 0xFA 0xFE). */
static constexpr uint16_t kCommandSync = 0xFEFA;

/** @brief Sync word on frames to the companion (LE on the wire: 0x3B 0xF2). */
static constexpr uint16_t kTelemetrySync = 0xF23B;

/** @brief Largest payload a frame may carry. */
static constexpr size_t kMaxPayload = 64;

/** @brief Frame overhead: sync (2) + length (1) + crc (2). */
static constexpr size_t kFrameOverhead = 5;

/** @brief Fixed-point scale: one wire unit is 1/1000 of the SI unit. */
static constexpr double kFixedScale = 1000.0;

/** @brief Message tags (first payload byte). */
enum class MsgType : uint8_t {
  /** @brief Velocity command (companion -> bridge). */
  VELOCITY_CMD = 0x01,
  /** @brief Pose/velocity telemetry (bridge -> companion). */
  TELEMETRY = 0x81,
};

/** @brief Link state reported in every telemetry frame. */
enum class LinkState : uint8_t {
  ACTIVE = 0,    ///< Commands are applied.
  DEGRADED = 1,  ///< Watchdog expired; motors held at zero.
  FAULT = 2,     ///< Unrecoverable hardware fault; external reset required.
};

/**
 * @brief Velocity command payload.
 */
#pragma pack(push, 1)  // disable padding so that struct is tightly packed
struct CommandPayload {
  uint8_t  msg_type;        ///< MsgType::VELOCITY_CMD.
  uint32_t seq;             ///< Monotonic per link session.
  int32_t  linear_mm_s;     ///< Forward velocity, mm/s.
  int32_t  angular_mrad_s;  ///< Counter-clockwise yaw rate, mrad/s.
};

/**
 * @brief Telemetry payload.
 */
struct TelemetryPayload {
  uint8_t  msg_type;        ///< MsgType::TELEMETRY.
  uint32_t seq;             ///< Telemetry sequence number (increments each frame).
  uint32_t ack_seq;         ///< Last accepted command sequence number.
  int32_t  x_mm;
  int32_t  y_mm;
  int32_t  heading_mrad;    ///< In [-pi, pi).
  int32_t  linear_mm_s;
  int32_t  angular_mrad_s;
  uint8_t  link_state;      ///< LinkState value.
};
#pragma pack(pop)

static constexpr size_t kCommandPayloadSize = sizeof(CommandPayload);
static constexpr size_t kTelemetryPayloadSize = sizeof(TelemetryPayload);

static_assert(kCommandPayloadSize == 13, "CommandPayload size mismatch");
static_assert(kTelemetryPayloadSize == 30, "TelemetryPayload size mismatch");
static_assert(kTelemetryPayloadSize <= kMaxPayload, "TelemetryPayload exceeds frame limit");

/** @brief Convert a wire fixed-point value to SI units. */
inline double fromFixed(int32_t v) {
  return static_cast<double>(v) / kFixedScale;
}

/** @brief Convert SI units to wire fixed-point, rounding and saturating at int32. */
inline int32_t toFixed(double v) {
  if (std::isnan(v)) return 0;
  const double scaled = std::round(v * kFixedScale);
  if (scaled >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
    return std::numeric_limits<int32_t>::max();
  }
  if (scaled <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
    return std::numeric_limits<int32_t>::min();
  }
  return static_cast<int32_t>(scaled);
}

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_PROTOCOL_HPP_
