#ifndef ROVER_BRIDGE_TELEMETRY_HPP_
#define ROVER_BRIDGE_TELEMETRY_HPP_
/**
 * @file telemetry.hpp
 * @brief Packs the pose estimate and link state into a telemetry payload.
 */

#include <cstddef>
#include <cstdint>

#include "rover_bridge/odometry.hpp"
#include "rover_bridge/protocol.hpp"

namespace rover_bridge {

const char* toString(LinkState state);

/**
 * @brief Build a telemetry payload. Pure and total.
 *
 * @param pose    Snapshot of the current estimate.
 * @param state   Current link state.
 * @param seq     Telemetry sequence number.
 * @param ack_seq Last accepted command sequence (0 if none).
 */
TelemetryPayload encodeTelemetry(const PoseEstimate& pose, LinkState state,
                                 uint32_t seq, uint32_t ack_seq);

/**
 * @brief Unpack a telemetry payload (companion side, tests).
 * @return false on wrong length or tag.
 */
bool decodeTelemetry(const uint8_t* payload, size_t len, TelemetryPayload& out);

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_TELEMETRY_HPP_
