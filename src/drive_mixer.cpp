#include "rover_bridge/drive_mixer.hpp"

#include <algorithm>

namespace rover_bridge {

static inline double clampd(double x, double lo, double hi) {
  return std::max(lo, std::min(hi, x));
}

DriveMixer::DriveMixer(const BridgeConfig& cfg, HardwareInterface& hw)
: hw_(hw),
  half_track_m_(cfg.track_width_m / 2.0),
  max_linear_mps_(cfg.max_linear_mps),
  output_max_(cfg.output_max),
  left_sign_(cfg.left_sign),
  right_sign_(cfg.right_sign),
  left_ports_(cfg.left_ports),
  right_ports_(cfg.right_ports) {}

SideOutputs DriveMixer::mix(double linear_mps, double angular_rps) const {
  // Differential drive mixing
  const double v_l = linear_mps - angular_rps * half_track_m_;
  const double v_r = linear_mps + angular_rps * half_track_m_;

  // Normalize to duty using max linear speed as scale
  double duty_l = (max_linear_mps_ > 1e-6) ? (v_l / max_linear_mps_) : 0.0;
  double duty_r = (max_linear_mps_ > 1e-6) ? (v_r / max_linear_mps_) : 0.0;

  duty_l = clampd(duty_l, -1.0, 1.0);
  duty_r = clampd(duty_r, -1.0, 1.0);

  SideOutputs out;
  out.left = duty_l * output_max_ * left_sign_;
  out.right = duty_r * output_max_ * right_sign_;
  return out;
}

SideOutputs DriveMixer::apply(const VelocityCommand& cmd) {
  last_ = mix(cmd.linear_mps, cmd.angular_rps);
  write(left_ports_, last_.left);
  write(right_ports_, last_.right);
  return last_;
}

void DriveMixer::stop() {
  last_ = SideOutputs{};
  write(left_ports_, 0.0);
  write(right_ports_, 0.0);
}

void DriveMixer::write(const std::vector<uint8_t>& ports, double output) {
  for (uint8_t port : ports) {
    hw_.setChannelOutput(port, output);
  }
}

}  // namespace rover_bridge
