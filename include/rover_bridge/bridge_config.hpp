#ifndef ROVER_BRIDGE_BRIDGE_CONFIG_HPP_
#define ROVER_BRIDGE_BRIDGE_CONFIG_HPP_
/**
 * @file bridge_config.hpp
 * @brief Startup configuration of the bridge core.
 *
 * Loaded once (from ROS parameters in the node) and never changed while the
 * loop runs.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace rover_bridge {

/** @brief Which sensor is authoritative for heading. */
enum class HeadingSource : uint8_t { WHEELS = 0, IMU = 1 };

/** @brief Parse "wheels" / "imu". @throws std::invalid_argument otherwise. */
HeadingSource parseHeadingSource(const std::string& s);

const char* toString(HeadingSource source);

struct BridgeConfig {
  // === Timing ===
  double period_s{0.020};          ///< Fixed tick period.
  uint32_t watchdog_ticks{25};     ///< Silent ticks tolerated before Degraded.
  uint32_t sensor_fault_ticks{50}; ///< Consecutive encoder read failures before Fault.

  // === Kinematics ===
  double track_width_m{0.30};
  double ticks_per_meter{1000.0};
  HeadingSource heading_source{HeadingSource::WHEELS};

  // === Command limits ===
  double max_linear_mps{1.0};
  double max_angular_rps{3.0};

  // === Actuator output ===
  double output_max{12.0};  ///< Output at full duty (motor volts).

  // === Port mapping ===
  std::vector<uint8_t> left_ports{3, 4, 7, 8};
  std::vector<uint8_t> right_ports{5, 6, 9, 10};
  uint8_t left_encoder_port{3};
  uint8_t right_encoder_port{5};
  int left_sign{1};   ///< +1 or -1, applied to outputs and encoder deltas.
  int right_sign{1};

  /**
   * @brief Check every field.
   * @throws std::invalid_argument describing the first bad field.
   */
  void validate() const;
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_BRIDGE_CONFIG_HPP_
