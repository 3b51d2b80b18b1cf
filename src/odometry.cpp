#include "rover_bridge/odometry.hpp"

#include <cmath>

namespace rover_bridge {

double normalizeAngle(double angle) {
  static constexpr double kTwoPi = 2.0 * kPi;
  double a = std::fmod(angle + kPi, kTwoPi);
  if (a < 0.0) a += kTwoPi;
  if (a >= kTwoPi) a -= kTwoPi;
  return a - kPi;
}

OdometryEstimator::OdometryEstimator(const BridgeConfig& cfg)
: period_s_(cfg.period_s),
  track_width_m_(cfg.track_width_m),
  ticks_per_meter_(cfg.ticks_per_meter),
  heading_source_(cfg.heading_source) {}

void OdometryEstimator::reset() {
  pose_ = PoseEstimate{};
  have_imu_reference_ = false;
}

const PoseEstimate& OdometryEstimator::integrate(const SensorSnapshot& samples) {
  // Convert ticks -> distance per wheel
  const double dL = static_cast<double>(samples.left.tick_delta) / ticks_per_meter_;
  const double dR = static_cast<double>(samples.right.tick_delta) / ticks_per_meter_;

  const double dS = 0.5 * (dR + dL);

  double dTheta = 0.0;
  if (heading_source_ == HeadingSource::WHEELS) {
    dTheta = (dR - dL) / track_width_m_;
  } else if (samples.heading_valid) {
    if (have_imu_reference_) {
      dTheta = normalizeAngle(samples.heading_rad - pose_.heading_rad);
    } else {
      // Adopt the IMU frame on its first reading; no rotation is implied.
      pose_.heading_rad = normalizeAngle(samples.heading_rad);
      have_imu_reference_ = true;
    }
  }

  // Midpoint integration (better than Euler)
  const double yaw_mid = pose_.heading_rad + 0.5 * dTheta;
  pose_.x_m += dS * std::cos(yaw_mid);
  pose_.y_m += dS * std::sin(yaw_mid);
  pose_.heading_rad = normalizeAngle(pose_.heading_rad + dTheta);

  pose_.linear_mps = dS / period_s_;
  pose_.angular_rps = dTheta / period_s_;
  return pose_;
}

}  // namespace rover_bridge
