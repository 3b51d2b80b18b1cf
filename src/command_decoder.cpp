#include "rover_bridge/command_decoder.hpp"

#include <algorithm>
#include <cstring>

#include "rover_bridge/protocol.hpp"

namespace rover_bridge {

namespace {

inline double clampd(double x, double lo, double hi) {
  return std::max(lo, std::min(hi, x));
}

}  // namespace

const char* toString(CommandStatus status) {
  switch (status) {
    case CommandStatus::ACCEPTED:  return "accepted";
    case CommandStatus::MALFORMED: return "malformed";
    case CommandStatus::STALE:     return "stale";
  }
  return "unknown";
}

CommandDecoder::CommandDecoder(double max_linear_mps, double max_angular_rps)
: max_linear_mps_(max_linear_mps), max_angular_rps_(max_angular_rps) {}

CommandStatus CommandDecoder::decode(const uint8_t* payload, size_t len, VelocityCommand& out) {
  if (payload == nullptr || len != kCommandPayloadSize) return CommandStatus::MALFORMED;

  CommandPayload p{};
  std::memcpy(&p, payload, kCommandPayloadSize);
  if (p.msg_type != static_cast<uint8_t>(MsgType::VELOCITY_CMD)) return CommandStatus::MALFORMED;

  if (have_seq_ && p.seq <= last_seq_) return CommandStatus::STALE;

  have_seq_ = true;
  last_seq_ = p.seq;

  out.seq = p.seq;
  out.linear_mps = clampd(fromFixed(p.linear_mm_s), -max_linear_mps_, max_linear_mps_);
  out.angular_rps = clampd(fromFixed(p.angular_mrad_s), -max_angular_rps_, max_angular_rps_);
  return CommandStatus::ACCEPTED;
}

}  // namespace rover_bridge
