#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "rover_bridge/control_loop.hpp"
#include "rover_bridge/simulated_base.hpp"
#include "test_helpers.hpp"

using rover_bridge::BridgeConfig;
using rover_bridge::ControlLoop;
using rover_bridge::LinkState;
using rover_bridge::SimulatedBase;
using rover_bridge::TelemetryPayload;
using rover_bridge::test::MemoryStream;
using rover_bridge::test::commandFrame;
using rover_bridge::test::telemetryFrames;

class ControlLoopTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg_.watchdog_ticks = 5;
  }

  void start() {
    sim_ = std::make_unique<SimulatedBase>(cfg_);
    loop_ = std::make_unique<ControlLoop>(cfg_, *sim_, link_, link_);
    loop_->begin();
  }

  void tickN(int n) {
    for (int i = 0; i < n; ++i) loop_->tick();
  }

  void expectAllOutputs(double expected) {
    for (uint8_t p : cfg_.left_ports) EXPECT_NEAR(sim_->output(p), expected, 1e-9) << "port " << int(p);
    for (uint8_t p : cfg_.right_ports) EXPECT_NEAR(sim_->output(p), expected, 1e-9) << "port " << int(p);
  }

  TelemetryPayload lastTelemetry() {
    const std::vector<TelemetryPayload> frames = telemetryFrames(link_.written());
    EXPECT_FALSE(frames.empty());
    return frames.empty() ? TelemetryPayload{} : frames.back();
  }

  BridgeConfig cfg_;
  MemoryStream link_;
  std::unique_ptr<SimulatedBase> sim_;
  std::unique_ptr<ControlLoop> loop_;
};

TEST_F(ControlLoopTest, AcceptedCommandDrivesMotorsAndIsAcknowledged) {
  start();
  link_.inject(commandFrame(1, 0.5, 0.0));
  loop_->tick();

  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  EXPECT_EQ(loop_->currentCommand().seq, 1u);
  expectAllOutputs(6.0);

  const TelemetryPayload t = lastTelemetry();
  EXPECT_EQ(t.link_state, static_cast<uint8_t>(LinkState::ACTIVE));
  EXPECT_EQ(t.ack_seq, 1u);
  EXPECT_EQ(t.seq, 0u);
  EXPECT_EQ(loop_->stats().commands_accepted, 1u);
  EXPECT_EQ(loop_->health().last_valid_frame_tick, 1u);
}

TEST_F(ControlLoopTest, WatchdogTripsOneTickAfterThreshold) {
  start();
  link_.inject(commandFrame(1, 0.5, 0.0));
  loop_->tick();

  tickN(5);
  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  EXPECT_EQ(loop_->health().consecutive_failures, 5u);
  expectAllOutputs(6.0);

  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::DEGRADED);
  expectAllOutputs(0.0);
  EXPECT_EQ(lastTelemetry().link_state, static_cast<uint8_t>(LinkState::DEGRADED));
  EXPECT_EQ(loop_->stats().watchdog_trips, 1u);

  // Held at zero for as long as the link stays silent.
  tickN(20);
  EXPECT_EQ(loop_->state(), LinkState::DEGRADED);
  expectAllOutputs(0.0);
  EXPECT_EQ(loop_->stats().watchdog_trips, 1u);
}

TEST_F(ControlLoopTest, ReplayAfterWatchdogTripStaysDegraded) {
  start();
  const std::vector<uint8_t> f = commandFrame(40, 0.5, 0.0);
  link_.inject(f);
  loop_->tick();
  tickN(6);
  ASSERT_EQ(loop_->state(), LinkState::DEGRADED);

  // Backlog re-delivered after the outage: already applied, so stale.
  link_.inject(f);
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::DEGRADED);
  EXPECT_EQ(loop_->stats().stale, 1u);
  EXPECT_EQ(loop_->stats().commands_accepted, 1u);
  expectAllOutputs(0.0);

  link_.inject(commandFrame(7, 0.9, 0.0));
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::DEGRADED);
  EXPECT_EQ(loop_->stats().stale, 2u);
  expectAllOutputs(0.0);

  link_.inject(commandFrame(41, 0.3, 0.0));
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  EXPECT_EQ(loop_->currentCommand().seq, 41u);
  expectAllOutputs(3.6);
  EXPECT_EQ(lastTelemetry().ack_seq, 41u);
  EXPECT_EQ(loop_->health().consecutive_failures, 0u);
}

TEST_F(ControlLoopTest, ExternalResetStartsNewSession) {
  start();
  link_.inject(commandFrame(40, 0.5, 0.0));
  loop_->tick();
  tickN(6);
  ASSERT_EQ(loop_->state(), LinkState::DEGRADED);

  loop_->reset();
  link_.inject(commandFrame(1, 0.25, 0.0));
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  EXPECT_EQ(loop_->currentCommand().seq, 1u);
  expectAllOutputs(3.0);
}

TEST_F(ControlLoopTest, ReplayedFrameIsAppliedOnce) {
  start();
  const std::vector<uint8_t> f = commandFrame(3, 0.2, 0.0);
  link_.inject(f);
  link_.inject(f);
  tickN(2);

  EXPECT_EQ(loop_->stats().commands_accepted, 1u);
  EXPECT_EQ(loop_->stats().stale, 1u);
  EXPECT_EQ(loop_->currentCommand().seq, 3u);
  EXPECT_EQ(loop_->health().consecutive_failures, 1u);
}

TEST_F(ControlLoopTest, CorruptedFrameIsNeverApplied) {
  start();
  std::vector<uint8_t> bad = commandFrame(1, 0.9, 0.0);
  bad[8] ^= 0x40;
  link_.inject(bad);
  loop_->tick();

  EXPECT_GE(loop_->stats().crc_fail, 1u);
  EXPECT_EQ(loop_->stats().commands_accepted, 0u);
  expectAllOutputs(0.0);

  link_.inject(commandFrame(2, 0.25, 0.0));
  loop_->tick();
  EXPECT_EQ(loop_->currentCommand().seq, 2u);
  expectAllOutputs(3.0);
}

TEST_F(ControlLoopTest, HandlesAtMostOneFramePerTick) {
  start();
  link_.inject(commandFrame(1, 0.1, 0.0));
  link_.inject(commandFrame(2, 0.2, 0.0));

  loop_->tick();
  EXPECT_EQ(loop_->currentCommand().seq, 1u);
  loop_->tick();
  EXPECT_EQ(loop_->currentCommand().seq, 2u);
  EXPECT_EQ(loop_->stats().frames_ok, 2u);
}

TEST_F(ControlLoopTest, EmitsTelemetryEveryTick) {
  start();
  tickN(3);

  const std::vector<TelemetryPayload> frames = telemetryFrames(link_.written());
  ASSERT_EQ(frames.size(), 3u);
  for (uint32_t i = 0; i < 3; ++i) {
    EXPECT_EQ(frames[i].seq, i);
    EXPECT_EQ(frames[i].ack_seq, 0u);
  }
  EXPECT_EQ(loop_->stats().telemetry_sent, 3u);
}

TEST_F(ControlLoopTest, LatchedFaultStopsMotorsUntilReset) {
  start();
  link_.inject(commandFrame(1, 0.5, 0.0));
  loop_->tick();
  expectAllOutputs(6.0);

  sim_->latchFault();
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::FAULT);
  expectAllOutputs(0.0);
  EXPECT_EQ(lastTelemetry().link_state, static_cast<uint8_t>(LinkState::FAULT));

  // Valid commands are counted but ignored.
  link_.inject(commandFrame(2, 0.5, 0.0));
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::FAULT);
  EXPECT_EQ(loop_->stats().ignored_in_fault, 1u);
  expectAllOutputs(0.0);

  // The watchdog does not move the loop out of FAULT either.
  tickN(10);
  EXPECT_EQ(loop_->state(), LinkState::FAULT);

  // Reset while the driver still reports the fault: back to FAULT on the next tick.
  loop_->reset();
  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::FAULT);

  sim_->clearFault();
  loop_->reset();
  link_.inject(commandFrame(1, 0.25, 0.0));
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  EXPECT_EQ(loop_->currentCommand().seq, 1u);
  expectAllOutputs(3.0);
}

TEST_F(ControlLoopTest, LatchedDriverFaultGetsNoDriveWrite) {
  start();
  link_.inject(commandFrame(1, 0.5, 0.0));
  loop_->tick();
  expectAllOutputs(6.0);

  sim_->latchFault();
  const uint64_t writes_before = sim_->writeCount();
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::FAULT);
  expectAllOutputs(0.0);
  // Exactly one zeroing pass over the mapped ports, no drive pass before it.
  EXPECT_EQ(sim_->writeCount() - writes_before, cfg_.left_ports.size() + cfg_.right_ports.size());
}

TEST_F(ControlLoopTest, RepeatedEncoderFailuresLatchFault) {
  cfg_.sensor_fault_ticks = 3;
  start();
  sim_->setReadFailure(true);

  tickN(3);
  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  loop_->tick();
  EXPECT_EQ(loop_->state(), LinkState::FAULT);
  EXPECT_EQ(loop_->stats().sensor_read_failures, 4u);
}

TEST_F(ControlLoopTest, OdometryTracksSimulatedMotion) {
  start();
  // Plant steps before each tick, as the node does; the first step sees zero output.
  for (uint32_t seq = 1; seq <= 51; ++seq) {
    link_.inject(commandFrame(seq, 0.5, 0.0));
    sim_->step(cfg_.period_s);
    loop_->tick();
  }

  EXPECT_EQ(loop_->state(), LinkState::ACTIVE);
  EXPECT_NEAR(loop_->pose().x_m, 0.5, 0.002);
  EXPECT_NEAR(loop_->pose().y_m, 0.0, 1e-9);
  EXPECT_NEAR(loop_->pose().heading_rad, 0.0, 1e-9);
  EXPECT_NEAR(loop_->pose().linear_mps, 0.5, 0.06);

  const TelemetryPayload t = lastTelemetry();
  EXPECT_NEAR(t.x_mm, 500, 2);
  EXPECT_EQ(t.ack_seq, 51u);
}

TEST_F(ControlLoopTest, OneSidedEncoderFailureDoesNotTurn) {
  start();
  for (uint32_t seq = 1; seq <= 20; ++seq) {
    link_.inject(commandFrame(seq, 0.5, 0.0));
    sim_->step(cfg_.period_s);
    sim_->setChannelReadFailure(cfg_.right_encoder_port, seq == 5);
    loop_->tick();
    ASSERT_NEAR(loop_->pose().heading_rad, 0.0, 1e-12) << "tick " << seq;
  }

  EXPECT_NEAR(loop_->pose().y_m, 0.0, 1e-12);
  EXPECT_NEAR(loop_->pose().x_m, 0.19, 0.002);
  EXPECT_EQ(loop_->stats().sensor_read_failures, 1u);
}

TEST_F(ControlLoopTest, ImuHeadingFollowsSimulatedBase) {
  cfg_.heading_source = rover_bridge::HeadingSource::IMU;
  start();
  for (uint32_t seq = 1; seq <= 20; ++seq) {
    link_.inject(commandFrame(seq, 0.0, 1.0));
    sim_->step(cfg_.period_s);
    loop_->tick();
  }

  // 19 moving steps at 1 rad/s.
  EXPECT_NEAR(sim_->heading(), 0.38, 1e-9);
  EXPECT_NEAR(loop_->pose().heading_rad, sim_->heading(), 1e-9);
}

TEST_F(ControlLoopTest, ShortWriteCountsAsDroppedTelemetry) {
  start();
  link_.setWriteLimit(10);
  loop_->tick();
  EXPECT_EQ(loop_->stats().tx_dropped, 1u);
  EXPECT_EQ(loop_->stats().telemetry_sent, 0u);
}

TEST_F(ControlLoopTest, ResynchronizesAfterGarbage) {
  start();
  link_.inject(std::vector<uint8_t>(100, 0x55));
  link_.inject(commandFrame(1, 0.5, 0.0));
  loop_->tick();

  EXPECT_EQ(loop_->stats().commands_accepted, 1u);
  EXPECT_GE(loop_->stats().sync_loss, 1u);
  expectAllOutputs(6.0);
}

TEST_F(ControlLoopTest, DrainsBoundedBytesPerTick) {
  start();
  link_.inject(std::vector<uint8_t>(600, 0x00));
  loop_->tick();

  EXPECT_EQ(loop_->stats().bytes_read, rover_bridge::kMaxReadPerTick);
  EXPECT_EQ(link_.pendingInbound(), 600u - rover_bridge::kMaxReadPerTick);
}

TEST(ControlLoopConfig, RejectsInvalidConfiguration) {
  BridgeConfig cfg;
  cfg.watchdog_ticks = 0;
  SimulatedBase sim(BridgeConfig{});
  MemoryStream link;
  EXPECT_THROW({ ControlLoop loop(cfg, sim, link, link); }, std::invalid_argument);
}
