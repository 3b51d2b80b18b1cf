#include "rover_bridge/control_loop.hpp"

#include <limits>

#include <rclcpp/logging.hpp>

#include "rover_bridge/telemetry.hpp"

namespace rover_bridge {

namespace {

const BridgeConfig& validated(const BridgeConfig& cfg) {
  cfg.validate();
  return cfg;
}

}  // namespace

ControlLoop::ControlLoop(const BridgeConfig& cfg, HardwareInterface& hw, ByteStream& rx, ByteStream& tx)
: logger_(rclcpp::get_logger("rover_bridge")),
  watchdog_ticks_(validated(cfg).watchdog_ticks),
  rx_(rx),
  tx_(tx),
  decoder_(kCommandSync),
  commands_(cfg.max_linear_mps, cfg.max_angular_rps),
  mixer_(cfg, hw),
  sampler_(cfg, hw),
  odom_(cfg) {
  tx_buf_.reserve(kTelemetryPayloadSize + kFrameOverhead);
}

void ControlLoop::begin() {
  mixer_.stop();
  sampler_.begin();
}

void ControlLoop::tick() {
  ++tick_;

  const bool accepted = pollCommand();
  updateLinkState(accepted);

  // A fault the driver latched since the last tick must not see one more drive write.
  checkSensorFault();

  if (state_ == LinkState::ACTIVE) {
    mixer_.apply(current_cmd_);
  } else {
    mixer_.stop();
  }

  const SensorSnapshot samples = sampler_.sample(tick_);
  odom_.integrate(samples);

  if (checkSensorFault()) {
    mixer_.stop();
  }

  stats_.sensor_read_failures = sampler_.readFailures();
  stats_.rx_overflow = decoder_.overflowBytes();

  publishTelemetry();
}

void ControlLoop::reset() {
  RCLCPP_INFO(logger_, "External reset (was %s)", toString(state_));
  state_ = LinkState::ACTIVE;
  health_ = LinkHealth{};
  health_.last_valid_frame_tick = tick_;
  current_cmd_ = VelocityCommand{};
  commands_.resetSession();
  decoder_.clear();
  odom_.reset();
  mixer_.stop();
  sampler_.begin();
}

bool ControlLoop::pollCommand() {
  uint8_t buf[kMaxReadPerTick];
  size_t total = 0;
  while (total < kMaxReadPerTick) {
    const size_t n = rx_.read(buf, kMaxReadPerTick - total);
    if (n == 0) break;
    decoder_.feed(buf, n);
    total += n;
  }
  stats_.bytes_read += total;

  // Errors always consume bytes, so this ends once the buffer is scanned.
  for (;;) {
    const FrameStatus st = decoder_.next(frame_);
    if (st == FrameStatus::NEED_MORE) return false;
    if (st == FrameStatus::OK) break;

    switch (st) {
      case FrameStatus::SYNC_NOT_FOUND:      stats_.sync_loss++; break;
      case FrameStatus::LENGTH_OUT_OF_RANGE: stats_.length_errors++; break;
      case FrameStatus::CHECKSUM_MISMATCH:   stats_.crc_fail++; break;
      default: break;
    }
    RCLCPP_DEBUG(logger_, "Inbound frame dropped: %s", toString(st));
  }

  // At most one frame per tick; anything after it waits for the next tick.
  stats_.frames_ok++;

  if (state_ == LinkState::FAULT) {
    stats_.ignored_in_fault++;
    return false;
  }

  VelocityCommand cmd;
  const CommandStatus cs = commands_.decode(frame_.payload.data(), frame_.payload.size(), cmd);
  switch (cs) {
    case CommandStatus::ACCEPTED:
      current_cmd_ = cmd;
      stats_.commands_accepted++;
      return true;
    case CommandStatus::MALFORMED:
      stats_.malformed++;
      break;
    case CommandStatus::STALE:
      stats_.stale++;
      break;
  }
  RCLCPP_DEBUG(logger_, "Command rejected: %s", toString(cs));
  return false;
}

void ControlLoop::updateLinkState(bool accepted) {
  if (state_ == LinkState::FAULT) return;

  if (accepted) {
    health_.consecutive_failures = 0;
    health_.last_valid_frame_tick = tick_;
    if (state_ == LinkState::DEGRADED) enterState(LinkState::ACTIVE);
    return;
  }

  if (health_.consecutive_failures < std::numeric_limits<uint32_t>::max()) {
    health_.consecutive_failures++;
  }

  if (state_ == LinkState::ACTIVE && health_.consecutive_failures > watchdog_ticks_) {
    enterState(LinkState::DEGRADED);
  }
}

bool ControlLoop::checkSensorFault() {
  if (state_ == LinkState::FAULT || !sampler_.sensorFault()) return false;
  enterState(LinkState::FAULT);
  return true;
}

void ControlLoop::enterState(LinkState next) {
  if (next == state_) return;

  switch (next) {
    case LinkState::DEGRADED:
      stats_.watchdog_trips++;
      RCLCPP_WARN(logger_,
        "Watchdog: no valid command for %u ticks (last at tick %lu), motors held at zero",
        health_.consecutive_failures, static_cast<unsigned long>(health_.last_valid_frame_tick));
      break;
    case LinkState::ACTIVE:
      RCLCPP_INFO(logger_, "Link restored at tick %lu (seq=%u)",
        static_cast<unsigned long>(tick_), current_cmd_.seq);
      break;
    case LinkState::FAULT:
      RCLCPP_ERROR(logger_,
        "Sensor fault at tick %lu (consecutive read failures=%u), motors disabled until reset",
        static_cast<unsigned long>(tick_), sampler_.consecutiveReadFailures());
      break;
  }
  state_ = next;
}

void ControlLoop::publishTelemetry() {
  const TelemetryPayload t = encodeTelemetry(odom_.pose(), state_, telemetry_seq_++, current_cmd_.seq);
  if (!encodeFrame(kTelemetrySync, reinterpret_cast<const uint8_t*>(&t), sizeof(t), tx_buf_)) {
    stats_.tx_dropped++;
    return;
  }

  const size_t n = tx_.write(tx_buf_.data(), tx_buf_.size());
  if (n < tx_buf_.size()) {
    // Partial frame on the wire; the companion resyncs on the next sync word.
    stats_.tx_dropped++;
  } else {
    stats_.telemetry_sent++;
  }
}

}  // namespace rover_bridge
