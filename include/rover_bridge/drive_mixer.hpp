#ifndef ROVER_BRIDGE_DRIVE_MIXER_HPP_
#define ROVER_BRIDGE_DRIVE_MIXER_HPP_
/**
 * @file drive_mixer.hpp
 * @brief Maps velocity commands onto per-port motor outputs.
 */

#include <cstdint>
#include <vector>

#include "rover_bridge/bridge_config.hpp"
#include "rover_bridge/command_decoder.hpp"
#include "rover_bridge/hardware_interface.hpp"

namespace rover_bridge {

/** @brief Side outputs written on the last apply()/stop(). */
struct SideOutputs {
  double left{0.0};
  double right{0.0};
};

/**
 * @brief Differential-drive mixer for a skid-steer base.
 *
 * Every physical port of a side receives the same output. Outputs saturate
 * silently at +/- output_max.
 */
class DriveMixer {
public:
  /** @note @p hw must outlive the mixer. */
  DriveMixer(const BridgeConfig& cfg, HardwareInterface& hw);

  /** @brief Mix and write @p cmd to all mapped ports. */
  SideOutputs apply(const VelocityCommand& cmd);

  /** @brief Write zero to all mapped ports. */
  void stop();

  /** @brief Pure mixing step (no hardware access). */
  SideOutputs mix(double linear_mps, double angular_rps) const;

  const SideOutputs& lastOutputs() const { return last_; }

private:
  void write(const std::vector<uint8_t>& ports, double output);

  HardwareInterface& hw_;
  double half_track_m_;
  double max_linear_mps_;
  double output_max_;
  int left_sign_;
  int right_sign_;
  std::vector<uint8_t> left_ports_;
  std::vector<uint8_t> right_ports_;

  SideOutputs last_;
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_DRIVE_MIXER_HPP_
