#include "rover_bridge/bridge_node.hpp"

#include <chrono>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <vector>

#include "rover_bridge/telemetry.hpp"

namespace rover_bridge {

namespace {

std::vector<uint8_t> toPorts(const std::vector<int64_t>& values, const char* name) {
  std::vector<uint8_t> ports;
  for (int64_t v : values) {
    if (v < 0 || v > 255) {
      throw std::runtime_error(std::string(name) + " entries must be in [0, 255]");
    }
    ports.push_back(static_cast<uint8_t>(v));
  }
  return ports;
}

uint8_t toPort(int64_t v, const char* name) {
  if (v < 0 || v > 255) throw std::runtime_error(std::string(name) + " must be in [0, 255]");
  return static_cast<uint8_t>(v);
}

}  // namespace

BridgeNode::BridgeNode(const rclcpp::NodeOptions& options)
: rclcpp::Node("rover_bridge", options) {

  // === Serial Parameters ===
  rx_device_ = declare_parameter<std::string>("rx_port", "/dev/ttyTHS1");
  tx_device_ = declare_parameter<std::string>("tx_port", "");
  baud_      = declare_parameter<int>("baud", 115200);
  reopen_ticks_ = declare_parameter<int>("reopen_ticks", 50);

  // === Loop / Hardware Parameters ===
  hardware_  = declare_parameter<std::string>("hardware", "sim");
  period_ms_ = declare_parameter<int>("period_ms", 20);

  cfg_ = loadConfig();

  if (reopen_ticks_ <= 0) {
    throw std::runtime_error("reopen_ticks must be > 0");
  }
  if (hardware_ == "sim") {
    sim_ = std::make_unique<SimulatedBase>(cfg_);
  } else {
    throw std::runtime_error("Unsupported hardware '" + hardware_ + "' (available: sim)");
  }

  rx_port_ = std::make_unique<SerialPort>(rx_device_, baud_);
  if (!tx_device_.empty() && tx_device_ != rx_device_) {
    tx_port_ = std::make_unique<SerialPort>(tx_device_, baud_);
  }
  reopenPorts();

  ByteStream& tx = tx_port_ ? static_cast<ByteStream&>(*tx_port_) : static_cast<ByteStream&>(*rx_port_);
  loop_ = std::make_unique<ControlLoop>(cfg_, *sim_, *rx_port_, tx);
  loop_->begin();

  diag_pub_ = create_publisher<diagnostic_msgs::msg::DiagnosticArray>("/diagnostics", rclcpp::QoS(10));

  const double diag_period_s = declare_parameter<double>("diagnostics_period_s", 1.0);
  if (!(diag_period_s > 0.0)) {
    throw std::runtime_error("diagnostics_period_s must be > 0");
  }
  diag_timer_ = create_wall_timer(
    std::chrono::duration<double>(diag_period_s), std::bind(&BridgeNode::publishDiagnostics, this));

  tick_timer_ = create_wall_timer(
    std::chrono::milliseconds(period_ms_), std::bind(&BridgeNode::onTick, this));

  RCLCPP_INFO(get_logger(),
    "RoverBridge: rx=%s tx=%s baud=%d hw=%s period=%dms watchdog=%u ticks "
    "track=%.3f ticks_per_m=%.1f heading=%s max_v=%.2f max_w=%.2f",
    rx_device_.c_str(), tx_port_ ? tx_device_.c_str() : rx_device_.c_str(), baud_, hardware_.c_str(),
    period_ms_, cfg_.watchdog_ticks, cfg_.track_width_m, cfg_.ticks_per_meter,
    toString(cfg_.heading_source), cfg_.max_linear_mps, cfg_.max_angular_rps);
}

BridgeNode::~BridgeNode() {
  if (loop_) loop_->stopMotors();
}

BridgeConfig BridgeNode::loadConfig() {
  BridgeConfig cfg;

  if (period_ms_ <= 0 || period_ms_ > 1000) {
    throw std::runtime_error("period_ms must be in [1, 1000]");
  }
  cfg.period_s = static_cast<double>(period_ms_) * 1e-3;

  const int watchdog = declare_parameter<int>("watchdog_ticks", 25);
  const int fault_ticks = declare_parameter<int>("sensor_fault_ticks", 50);
  if (watchdog <= 0 || fault_ticks <= 0) {
    throw std::runtime_error("watchdog_ticks and sensor_fault_ticks must be > 0");
  }
  cfg.watchdog_ticks = static_cast<uint32_t>(watchdog);
  cfg.sensor_fault_ticks = static_cast<uint32_t>(fault_ticks);

  // === Kinematics ===
  cfg.track_width_m   = declare_parameter<double>("track_width_m", 0.30);
  cfg.ticks_per_meter = declare_parameter<double>("ticks_per_meter", 1000.0);
  cfg.heading_source  = parseHeadingSource(declare_parameter<std::string>("heading_source", "wheels"));

  // === Limits / Output ===
  cfg.max_linear_mps  = declare_parameter<double>("max_linear_mps", 1.0);
  cfg.max_angular_rps = declare_parameter<double>("max_angular_rps", 3.0);
  cfg.output_max      = declare_parameter<double>("output_max", 12.0);

  // === Port mapping ===
  cfg.left_ports  = toPorts(declare_parameter<std::vector<int64_t>>("left_ports",
                    std::vector<int64_t>{3, 4, 7, 8}), "left_ports");
  cfg.right_ports = toPorts(declare_parameter<std::vector<int64_t>>("right_ports",
                    std::vector<int64_t>{5, 6, 9, 10}), "right_ports");
  cfg.left_encoder_port  = toPort(declare_parameter<int64_t>("left_encoder_port", 3), "left_encoder_port");
  cfg.right_encoder_port = toPort(declare_parameter<int64_t>("right_encoder_port", 5), "right_encoder_port");
  cfg.left_sign  = declare_parameter<int>("left_sign", 1);
  cfg.right_sign = declare_parameter<int>("right_sign", 1);

  // Validate parameters now
  try {
    cfg.validate();
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid rover_bridge configuration: ") + e.what());
  }
  return cfg;
}

void BridgeNode::reopenPorts() {
  for (SerialPort* port : {rx_port_.get(), tx_port_.get()}) {
    if (port == nullptr || port->isOpen()) continue;
    if (!port->open()) {
      RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000,
        "Failed to open serial %s, will retry", port->device().c_str());
    } else {
      RCLCPP_INFO(get_logger(), "Opened serial %s", port->device().c_str());
    }
  }
}

void BridgeNode::onTick() {
  // Retry lost ports every reopen_ticks; open() on a tty does not block.
  if (loop_->tickCount() % static_cast<uint64_t>(reopen_ticks_) == 0) {
    reopenPorts();
  }

  sim_->step(cfg_.period_s);
  loop_->tick();

  RCLCPP_DEBUG_THROTTLE(get_logger(), *get_clock(), 1000,
    "state=%s cmd: v=%.3f w=%.3f out: L=%.2f R=%.2f",
    toString(loop_->state()), loop_->currentCommand().linear_mps, loop_->currentCommand().angular_rps,
    loop_->outputs().left, loop_->outputs().right);
}

void BridgeNode::publishDiagnostics() {
  diagnostic_msgs::msg::DiagnosticArray arr;
  arr.header.stamp = this->now();

  diagnostic_msgs::msg::DiagnosticStatus st;
  st.name = "rover_bridge";
  st.hardware_id = rx_device_;

  switch (loop_->state()) {
    case LinkState::ACTIVE:
      st.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
      st.message = "Commands applied";
      break;
    case LinkState::DEGRADED:
      st.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
      st.message = "Link lost, motors held at zero";
      break;
    case LinkState::FAULT:
      st.level = diagnostic_msgs::msg::DiagnosticStatus::ERROR;
      st.message = "Sensor fault, reset required";
      break;
  }

  auto kv = [&](const std::string& k, const std::string& v) {
    diagnostic_msgs::msg::KeyValue x;
    x.key = k;
    x.value = v;
    st.values.push_back(x);
  };

  const LinkStats& s = loop_->stats();
  const LinkHealth& h = loop_->health();
  const PoseEstimate& p = loop_->pose();

  kv("link_state", toString(loop_->state()));
  kv("tick", std::to_string(loop_->tickCount()));
  kv("serial_open", rx_port_->isOpen() ? "true" : "false");
  kv("serial_io_errors", std::to_string(rx_port_->ioErrors() + (tx_port_ ? tx_port_->ioErrors() : 0)));
  kv("consecutive_failures", std::to_string(h.consecutive_failures));
  kv("last_valid_frame_tick", std::to_string(h.last_valid_frame_tick));
  kv("last_seq", std::to_string(loop_->currentCommand().seq));
  kv("bytes_read", std::to_string(s.bytes_read));
  kv("rx_overflow", std::to_string(s.rx_overflow));
  kv("frames_ok", std::to_string(s.frames_ok));
  kv("sync_loss", std::to_string(s.sync_loss));
  kv("length_errors", std::to_string(s.length_errors));
  kv("crc_fail", std::to_string(s.crc_fail));
  kv("malformed", std::to_string(s.malformed));
  kv("stale", std::to_string(s.stale));
  kv("commands_accepted", std::to_string(s.commands_accepted));
  kv("ignored_in_fault", std::to_string(s.ignored_in_fault));
  kv("watchdog_trips", std::to_string(s.watchdog_trips));
  kv("telemetry_sent", std::to_string(s.telemetry_sent));
  kv("tx_dropped", std::to_string(s.tx_dropped));
  kv("sensor_read_failures", std::to_string(s.sensor_read_failures));
  kv("x_m", std::to_string(p.x_m));
  kv("y_m", std::to_string(p.y_m));
  kv("heading_rad", std::to_string(p.heading_rad));
  kv("linear_mps", std::to_string(p.linear_mps));
  kv("angular_rps", std::to_string(p.angular_rps));

  arr.status.push_back(st);
  diag_pub_->publish(arr);
}

}  // namespace rover_bridge
