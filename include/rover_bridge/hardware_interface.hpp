#ifndef ROVER_BRIDGE_HARDWARE_INTERFACE_HPP_
#define ROVER_BRIDGE_HARDWARE_INTERFACE_HPP_
/**
 * @file hardware_interface.hpp
 * @brief Capability interface to the motor and sensor driver layer.
 *
 * Implemented by the platform's driver adapter (not part of this package) or
 * by SimulatedBase. Every call must be synchronous and non-blocking: if no
 * fresh sample exists, return the latest one.
 */

#include <cstdint>

namespace rover_bridge {

class HardwareInterface {
public:
  virtual ~HardwareInterface() = default;

  /**
   * @brief Command one physical motor port.
   * @param channel Physical port id.
   * @param output  Signed output in [-output_max, output_max] (volts by default).
   */
  virtual void setChannelOutput(uint8_t channel, double output) = 0;

  /**
   * @brief Read the cumulative encoder count of a port.
   * @return false if the read failed; @p ticks is left untouched.
   */
  virtual bool readChannelTicks(uint8_t channel, int32_t& ticks) = 0;

  /**
   * @brief Read the absolute heading from an IMU.
   * @return false if no heading is available.
   */
  virtual bool readHeading(double& heading_rad) = 0;

  /** @brief True once the driver layer has latched an unrecoverable fault. */
  virtual bool faultLatched() const = 0;
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_HARDWARE_INTERFACE_HPP_
