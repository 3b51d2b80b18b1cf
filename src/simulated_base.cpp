#include "rover_bridge/simulated_base.hpp"

#include <cmath>
#include <initializer_list>
#include <utility>

#include "rover_bridge/odometry.hpp"

namespace rover_bridge {

SimulatedBase::SimulatedBase(const BridgeConfig& cfg)
: max_linear_mps_(cfg.max_linear_mps),
  output_max_(cfg.output_max),
  ticks_per_meter_(cfg.ticks_per_meter),
  track_width_m_(cfg.track_width_m),
  left_encoder_port_(cfg.left_encoder_port),
  right_encoder_port_(cfg.right_encoder_port),
  left_sign_(cfg.left_sign),
  right_sign_(cfg.right_sign) {}

void SimulatedBase::setChannelOutput(uint8_t channel, double output) {
  outputs_[channel] = output;
  ++writes_;
}

bool SimulatedBase::readChannelTicks(uint8_t channel, int32_t& ticks) {
  if (read_failure_ || failed_channels_.count(channel) > 0) return false;
  auto it = ticks_.find(channel);
  ticks = (it == ticks_.end()) ? 0 : it->second;
  return true;
}

bool SimulatedBase::readHeading(double& heading_rad) {
  if (!heading_available_) return false;
  heading_rad = heading_rad_;
  return true;
}

void SimulatedBase::setChannelReadFailure(uint8_t channel, bool fail) {
  if (fail) {
    failed_channels_.insert(channel);
  } else {
    failed_channels_.erase(channel);
  }
}

double SimulatedBase::output(uint8_t channel) const {
  auto it = outputs_.find(channel);
  return (it == outputs_.end()) ? 0.0 : it->second;
}

double SimulatedBase::wheelSpeed(uint8_t encoder_port) const {
  return output(encoder_port) / output_max_ * max_linear_mps_;
}

void SimulatedBase::step(double dt_s) {
  if (dt_s <= 0.0) return;

  const double v_l = wheelSpeed(left_encoder_port_);
  const double v_r = wheelSpeed(right_encoder_port_);

  // Raw counts follow the physical motor direction.
  for (const auto& side : {std::make_pair(left_encoder_port_, v_l), std::make_pair(right_encoder_port_, v_r)}) {
    double& rem = tick_remainder_[side.first];
    rem += side.second * dt_s * ticks_per_meter_;
    const double whole = std::trunc(rem);
    rem -= whole;
    ticks_[side.first] = static_cast<int32_t>(
      static_cast<uint32_t>(ticks_[side.first]) + static_cast<uint32_t>(static_cast<int32_t>(whole)));
  }

  // Heading follows the logical (sign-corrected) wheel speeds.
  const double w = (v_r * right_sign_ - v_l * left_sign_) / track_width_m_;
  heading_rad_ = normalizeAngle(heading_rad_ + w * dt_s);
}

}  // namespace rover_bridge
