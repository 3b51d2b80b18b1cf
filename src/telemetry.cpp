#include "rover_bridge/telemetry.hpp"

#include <cstring>

namespace rover_bridge {

const char* toString(LinkState state) {
  switch (state) {
    case LinkState::ACTIVE:   return "ACTIVE";
    case LinkState::DEGRADED: return "DEGRADED";
    case LinkState::FAULT:    return "FAULT";
  }
  return "UNKNOWN";
}

TelemetryPayload encodeTelemetry(const PoseEstimate& pose, LinkState state,
                                 uint32_t seq, uint32_t ack_seq) {
  TelemetryPayload t{};
  t.msg_type = static_cast<uint8_t>(MsgType::TELEMETRY);
  t.seq = seq;
  t.ack_seq = ack_seq;
  t.x_mm = toFixed(pose.x_m);
  t.y_mm = toFixed(pose.y_m);
  t.heading_mrad = toFixed(pose.heading_rad);
  t.linear_mm_s = toFixed(pose.linear_mps);
  t.angular_mrad_s = toFixed(pose.angular_rps);
  t.link_state = static_cast<uint8_t>(state);
  return t;
}

bool decodeTelemetry(const uint8_t* payload, size_t len, TelemetryPayload& out) {
  if (payload == nullptr || len != kTelemetryPayloadSize) return false;
  std::memcpy(&out, payload, kTelemetryPayloadSize);
  return out.msg_type == static_cast<uint8_t>(MsgType::TELEMETRY);
}

}  // namespace rover_bridge
