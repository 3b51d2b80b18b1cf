#pragma once
/**
 * @file control_loop.hpp
 * @brief Fixed-period command/telemetry loop with watchdog and fault handling.
 *
 * ## Overview
 * tick() is called once per period by an external scheduler and performs, in
 * order:
 * - Drain available inbound bytes (bounded) and decode at most one command frame
 * - Update the link state (watchdog, recovery)
 * - Latch FAULT if the driver layer already reports a fault
 * - Actuate: apply the current command while ACTIVE, zero outputs otherwise
 * - Sample sensors and integrate odometry
 * - Latch FAULT if this tick's sampling reports an unrecoverable fault
 * - Encode and transmit one telemetry frame (in every state)
 *
 * Nothing in tick() blocks or throws. All state is owned by this object and
 * only mutated from tick()/reset() on a single thread.
 */

#include <cstdint>
#include <vector>

#include <rclcpp/logger.hpp>

#include "rover_bridge/bridge_config.hpp"
#include "rover_bridge/byte_stream.hpp"
#include "rover_bridge/command_decoder.hpp"
#include "rover_bridge/drive_mixer.hpp"
#include "rover_bridge/frame_codec.hpp"
#include "rover_bridge/hardware_interface.hpp"
#include "rover_bridge/odometry.hpp"
#include "rover_bridge/protocol.hpp"
#include "rover_bridge/sensor_sampler.hpp"

namespace rover_bridge {

/** @brief Upper bound on bytes drained from the link per tick. */
static constexpr size_t kMaxReadPerTick = 256;

/** @brief Watchdog bookkeeping. Reset on every accepted command. */
struct LinkHealth {
  uint64_t last_valid_frame_tick{0};
  uint32_t consecutive_failures{0};  ///< Ticks since the last accepted command.
};

/** @brief Link counters since boot (never reset). */
struct LinkStats {
  uint64_t bytes_read{0};
  uint64_t rx_overflow{0};
  uint64_t frames_ok{0};
  uint64_t sync_loss{0};
  uint64_t length_errors{0};
  uint64_t crc_fail{0};
  uint64_t malformed{0};
  uint64_t stale{0};
  uint64_t commands_accepted{0};
  uint64_t ignored_in_fault{0};
  uint64_t telemetry_sent{0};
  uint64_t tx_dropped{0};
  uint64_t sensor_read_failures{0};
  uint64_t watchdog_trips{0};
};

class ControlLoop {
public:
  /**
   * @brief Build the loop around its collaborators.
   *
   * @param cfg Validated configuration.
   * @param hw  Motor/sensor driver layer.
   * @param rx  Inbound link.
   * @param tx  Outbound link (may be the same object as @p rx).
   *
   * @note All references must outlive the loop.
   * @throws std::invalid_argument if @p cfg does not validate.
   */
  ControlLoop(const BridgeConfig& cfg, HardwareInterface& hw, ByteStream& rx, ByteStream& tx);

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  /** @brief Stop motors and latch the encoder reference. Call once before the first tick. */
  void begin();

  /** @brief Run one control period. */
  void tick();

  /**
   * @brief External reset: leave FAULT, forget the link session and pose.
   *
   * If the driver layer still reports a fault, the next tick re-enters FAULT.
   */
  void reset();

  /** @brief Force outputs to zero without changing state (shutdown). */
  void stopMotors() { mixer_.stop(); }

  LinkState state() const { return state_; }
  const LinkHealth& health() const { return health_; }
  const LinkStats& stats() const { return stats_; }
  const PoseEstimate& pose() const { return odom_.pose(); }
  const VelocityCommand& currentCommand() const { return current_cmd_; }
  const SideOutputs& outputs() const { return mixer_.lastOutputs(); }
  uint64_t tickCount() const { return tick_; }

private:
  /** @return true if a new command was accepted this tick. */
  bool pollCommand();
  void updateLinkState(bool accepted);
  /** @return true if this call moved the loop into FAULT. */
  bool checkSensorFault();
  void publishTelemetry();
  void enterState(LinkState next);

  rclcpp::Logger logger_;
  uint32_t watchdog_ticks_;

  ByteStream& rx_;
  ByteStream& tx_;

  FrameDecoder decoder_;
  CommandDecoder commands_;
  DriveMixer mixer_;
  SensorSampler sampler_;
  OdometryEstimator odom_;

  LinkState state_{LinkState::ACTIVE};
  LinkHealth health_;
  LinkStats stats_;
  VelocityCommand current_cmd_;

  uint64_t tick_{0};
  uint32_t telemetry_seq_{0};

  Frame frame_;
  std::vector<uint8_t> tx_buf_;
};

}  // namespace rover_bridge
