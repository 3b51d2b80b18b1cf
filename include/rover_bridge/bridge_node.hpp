#pragma once
/**
 * @file bridge_node.hpp
 * @brief ROS 2 node that hosts the rover bridge control loop.
 *
 * ## Overview
 * This node:
 * - Reads startup configuration from ROS parameters (validated once)
 * - Opens the companion serial link (separate RX/TX devices supported)
 * - Runs ControlLoop::tick() from a fixed-period wall timer
 * - Retries opening a lost serial port without blocking the loop
 * - Publishes diagnostic_msgs/DiagnosticArray with link state and counters
 * - Stops the motors on shutdown
 */

#include <rclcpp/rclcpp.hpp>
#include <diagnostic_msgs/msg/diagnostic_array.hpp>
#include <diagnostic_msgs/msg/diagnostic_status.hpp>
#include <diagnostic_msgs/msg/key_value.hpp>

#include <memory>
#include <string>

#include "rover_bridge/bridge_config.hpp"
#include "rover_bridge/control_loop.hpp"
#include "rover_bridge/serial_port.hpp"
#include "rover_bridge/simulated_base.hpp"

namespace rover_bridge {

class BridgeNode final : public rclcpp::Node {
public:
  explicit BridgeNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
  ~BridgeNode() override;

  BridgeNode(const BridgeNode&) = delete;
  BridgeNode& operator=(const BridgeNode&) = delete;

private:
  BridgeConfig loadConfig();
  void onTick();
  void reopenPorts();
  void publishDiagnostics();

  // === Parameters ===
  std::string rx_device_;
  std::string tx_device_;
  int baud_{115200};
  std::string hardware_;
  int period_ms_{20};
  int reopen_ticks_{50};

  BridgeConfig cfg_;

  // === Collaborators (declared before loop_, which refers to them) ===
  std::unique_ptr<SimulatedBase> sim_;
  std::unique_ptr<SerialPort> rx_port_;
  std::unique_ptr<SerialPort> tx_port_;  ///< Null when RX and TX share a device.
  std::unique_ptr<ControlLoop> loop_;

  // ROS interfaces
  rclcpp::Publisher<diagnostic_msgs::msg::DiagnosticArray>::SharedPtr diag_pub_;
  rclcpp::TimerBase::SharedPtr tick_timer_;
  rclcpp::TimerBase::SharedPtr diag_timer_;
};

}  // namespace rover_bridge
