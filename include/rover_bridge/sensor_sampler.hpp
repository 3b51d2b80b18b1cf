#pragma once
/**
 * @file sensor_sampler.hpp
 * @brief Per-tick encoder/heading sampling for the left and right wheel sides.
 *
 * Produces delta tick counts since the previous tick. A count that did not
 * change yields a zero delta. If either side's read fails, both sides report
 * zero and keep their previous count, so the movement appears on both sides
 * at the next good read.
 */

#include <cstdint>

#include "rover_bridge/bridge_config.hpp"
#include "rover_bridge/hardware_interface.hpp"

namespace rover_bridge {

/** @brief One side's encoder movement during one tick. Not retained. */
struct WheelSample {
  uint8_t channel{0};    ///< Encoder port id.
  int32_t tick_delta{0}; ///< Signed delta since the previous tick.
  uint64_t tick{0};      ///< Control loop tick the sample belongs to.
};

/** @brief Everything the estimator consumes for one tick. */
struct SensorSnapshot {
  WheelSample left;
  WheelSample right;
  bool heading_valid{false};  ///< Only set when the IMU is the heading source.
  double heading_rad{0.0};
};

class SensorSampler {
public:
  /** @note @p hw must outlive the sampler. */
  SensorSampler(const BridgeConfig& cfg, HardwareInterface& hw);

  /** @brief Latch current encoder counts as the reference for the next delta. */
  void begin();

  /** @brief Read all sensors for tick @p tick. */
  SensorSnapshot sample(uint64_t tick);

  /**
   * @brief True once the driver layer latched a fault or encoder reads failed
   * for more than sensor_fault_ticks consecutive ticks.
   */
  bool sensorFault() const;

  /** @brief Total left ticks since begin(). */
  int64_t leftTotal() const { return left_.total; }

  /** @brief Total right ticks since begin(). */
  int64_t rightTotal() const { return right_.total; }

  uint32_t consecutiveReadFailures() const { return consecutive_failures_; }
  uint64_t readFailures() const { return read_failures_; }

private:
  struct Channel {
    uint8_t port{0};
    int sign{1};
    int32_t prev{0};
    bool primed{false};
    int64_t total{0};
  };

  /** @brief Move @p ch to @p ticks and return the signed delta. */
  int32_t advance(Channel& ch, int32_t ticks);

  HardwareInterface& hw_;
  HeadingSource heading_source_;
  uint32_t sensor_fault_ticks_;

  Channel left_;
  Channel right_;

  bool have_heading_{false};
  double last_heading_{0.0};

  uint32_t consecutive_failures_{0};
  uint64_t read_failures_{0};
};

}  // namespace rover_bridge
