#ifndef ROVER_BRIDGE_SIMULATED_BASE_HPP_
#define ROVER_BRIDGE_SIMULATED_BASE_HPP_
/**
 * @file simulated_base.hpp
 * @brief Kinematic stand-in for the motor/encoder/IMU driver layer.
 *
 * Motors respond instantly: a side's wheel speed is its encoder port's output
 * as a fraction of output_max, times max_linear_mps. step() advances encoder
 * counts and the true heading. Counts, heading and failures can also be set
 * directly to script sensor behaviour.
 */

#include <cstdint>
#include <map>
#include <set>

#include "rover_bridge/bridge_config.hpp"
#include "rover_bridge/hardware_interface.hpp"

namespace rover_bridge {

class SimulatedBase : public HardwareInterface {
public:
  explicit SimulatedBase(const BridgeConfig& cfg);

  // === HardwareInterface ===
  void setChannelOutput(uint8_t channel, double output) override;
  bool readChannelTicks(uint8_t channel, int32_t& ticks) override;
  bool readHeading(double& heading_rad) override;
  bool faultLatched() const override { return fault_latched_; }

  /** @brief Advance the plant by @p dt_s seconds. */
  void step(double dt_s);

  // === Scripting ===
  void setTicks(uint8_t channel, int32_t ticks) { ticks_[channel] = ticks; }
  void setHeading(double heading_rad) { heading_rad_ = heading_rad; }
  void setHeadingAvailable(bool available) { heading_available_ = available; }
  void setReadFailure(bool fail) { read_failure_ = fail; }
  /** @brief Fail encoder reads on one port only. */
  void setChannelReadFailure(uint8_t channel, bool fail);
  void latchFault() { fault_latched_ = true; }
  void clearFault() { fault_latched_ = false; }

  /** @brief Last output written to a port (0 if never written). */
  double output(uint8_t channel) const;

  /** @brief Number of setChannelOutput() calls so far. */
  uint64_t writeCount() const { return writes_; }

  double heading() const { return heading_rad_; }

private:
  double wheelSpeed(uint8_t encoder_port) const;

  double max_linear_mps_;
  double output_max_;
  double ticks_per_meter_;
  double track_width_m_;
  uint8_t left_encoder_port_;
  uint8_t right_encoder_port_;
  int left_sign_;
  int right_sign_;

  std::map<uint8_t, double> outputs_;
  std::map<uint8_t, int32_t> ticks_;
  std::map<uint8_t, double> tick_remainder_;
  std::set<uint8_t> failed_channels_;

  double heading_rad_{0.0};
  bool heading_available_{true};
  bool read_failure_{false};
  bool fault_latched_{false};
  uint64_t writes_{0};
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_SIMULATED_BASE_HPP_
