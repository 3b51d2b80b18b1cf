#ifndef ROVER_BRIDGE_ODOMETRY_HPP_
#define ROVER_BRIDGE_ODOMETRY_HPP_
/**
 * @file odometry.hpp
 * @brief Differential-drive dead reckoning from per-tick wheel samples.
 *
 * ## Overview
 * - Tick deltas are converted to distance with a calibrated ticks-per-meter
 * - Linear displacement is the mean of both wheels
 * - Heading change comes from exactly one source, chosen at construction:
 *   the wheel difference over track width, or an absolute IMU heading
 * - Pose is integrated at the heading midpoint
 * - Velocities are displacement over the fixed loop period
 */

#include "rover_bridge/bridge_config.hpp"
#include "rover_bridge/sensor_sampler.hpp"

namespace rover_bridge {

static constexpr double kPi = 3.14159265358979323846;

/** @brief Wrap an angle into [-pi, pi). */
double normalizeAngle(double angle);

/** @brief Running pose and velocity estimate. */
struct PoseEstimate {
  double x_m{0.0};
  double y_m{0.0};
  double heading_rad{0.0};  ///< Always in [-pi, pi).
  double linear_mps{0.0};
  double angular_rps{0.0};
};

class OdometryEstimator {
public:
  explicit OdometryEstimator(const BridgeConfig& cfg);

  /**
   * @brief Integrate one tick of samples into the estimate.
   * @return The updated estimate.
   */
  const PoseEstimate& integrate(const SensorSnapshot& samples);

  /** @brief Zero the pose and velocity. */
  void reset();

  const PoseEstimate& pose() const { return pose_; }
  HeadingSource headingSource() const { return heading_source_; }

private:
  double period_s_;
  double track_width_m_;
  double ticks_per_meter_;
  HeadingSource heading_source_;

  bool have_imu_reference_{false};
  PoseEstimate pose_;
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_ODOMETRY_HPP_
