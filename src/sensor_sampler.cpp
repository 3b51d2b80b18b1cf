#include "rover_bridge/sensor_sampler.hpp"

#include <initializer_list>

namespace rover_bridge {

SensorSampler::SensorSampler(const BridgeConfig& cfg, HardwareInterface& hw)
: hw_(hw),
  heading_source_(cfg.heading_source),
  sensor_fault_ticks_(cfg.sensor_fault_ticks) {
  left_.port = cfg.left_encoder_port;
  left_.sign = cfg.left_sign;
  right_.port = cfg.right_encoder_port;
  right_.sign = cfg.right_sign;
}

void SensorSampler::begin() {
  for (Channel* ch : {&left_, &right_}) {
    int32_t ticks = 0;
    ch->primed = hw_.readChannelTicks(ch->port, ticks);
    ch->prev = ticks;
    ch->total = 0;
  }
  have_heading_ = false;
  last_heading_ = 0.0;
  consecutive_failures_ = 0;
}

int32_t SensorSampler::advance(Channel& ch, int32_t ticks) {
  if (!ch.primed) {
    // First good read only establishes the reference.
    ch.prev = ticks;
    ch.primed = true;
    return 0;
  }

  // Unsigned subtraction keeps the delta correct across counter wrap.
  int32_t d = static_cast<int32_t>(static_cast<uint32_t>(ticks) - static_cast<uint32_t>(ch.prev));
  ch.prev = ticks;

  d *= ch.sign;
  ch.total += d;
  return d;
}

SensorSnapshot SensorSampler::sample(uint64_t tick) {
  SensorSnapshot s;
  s.left.channel = left_.port;
  s.left.tick = tick;
  s.right.channel = right_.port;
  s.right.tick = tick;

  // Both sides advance together or not at all.
  int32_t left_ticks = 0;
  int32_t right_ticks = 0;
  const bool left_ok = hw_.readChannelTicks(left_.port, left_ticks);
  const bool right_ok = hw_.readChannelTicks(right_.port, right_ticks);

  if (left_ok && right_ok) {
    s.left.tick_delta = advance(left_, left_ticks);
    s.right.tick_delta = advance(right_, right_ticks);
    consecutive_failures_ = 0;
  } else {
    ++consecutive_failures_;
    ++read_failures_;
  }

  if (heading_source_ == HeadingSource::IMU) {
    double h = 0.0;
    if (hw_.readHeading(h)) {
      last_heading_ = h;
      have_heading_ = true;
    }
    s.heading_valid = have_heading_;
    s.heading_rad = last_heading_;
  }

  return s;
}

bool SensorSampler::sensorFault() const {
  return hw_.faultLatched() || consecutive_failures_ > sensor_fault_ticks_;
}

}  // namespace rover_bridge
