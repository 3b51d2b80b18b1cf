#include "rover_bridge/bridge_config.hpp"

#include <algorithm>
#include <stdexcept>

namespace rover_bridge {

namespace {

bool contains(const std::vector<uint8_t>& ports, uint8_t p) {
  return std::find(ports.begin(), ports.end(), p) != ports.end();
}

}  // namespace

HeadingSource parseHeadingSource(const std::string& s) {
  if (s == "wheels") return HeadingSource::WHEELS;
  if (s == "imu") return HeadingSource::IMU;
  throw std::invalid_argument("heading_source must be 'wheels' or 'imu', got '" + s + "'");
}

const char* toString(HeadingSource source) {
  return source == HeadingSource::IMU ? "imu" : "wheels";
}

void BridgeConfig::validate() const {
  if (!(period_s > 0.0) || period_s > 1.0) {
    throw std::invalid_argument("period must be in (0, 1] seconds");
  }
  if (watchdog_ticks == 0) throw std::invalid_argument("watchdog_ticks must be > 0");
  if (sensor_fault_ticks == 0) throw std::invalid_argument("sensor_fault_ticks must be > 0");
  if (!(track_width_m > 0.0)) throw std::invalid_argument("track_width_m must be > 0");
  if (!(ticks_per_meter > 0.0)) throw std::invalid_argument("ticks_per_meter must be > 0");
  if (!(max_linear_mps > 0.0)) throw std::invalid_argument("max_linear_mps must be > 0");
  if (!(max_angular_rps > 0.0)) throw std::invalid_argument("max_angular_rps must be > 0");
  if (!(output_max > 0.0)) throw std::invalid_argument("output_max must be > 0");

  if (left_ports.empty() || right_ports.empty()) {
    throw std::invalid_argument("left_ports and right_ports must not be empty");
  }
  for (uint8_t p : left_ports) {
    if (contains(right_ports, p)) {
      throw std::invalid_argument("port " + std::to_string(p) + " mapped to both sides");
    }
  }
  if (!contains(left_ports, left_encoder_port)) {
    throw std::invalid_argument("left_encoder_port must be one of left_ports");
  }
  if (!contains(right_ports, right_encoder_port)) {
    throw std::invalid_argument("right_encoder_port must be one of right_ports");
  }
  if (!(left_sign == 1 || left_sign == -1) || !(right_sign == 1 || right_sign == -1)) {
    throw std::invalid_argument("left_sign/right_sign must be +1 or -1");
  }
}

}  // namespace rover_bridge
