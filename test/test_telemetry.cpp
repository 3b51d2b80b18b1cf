#include <gtest/gtest.h>

#include <cstring>
#include <limits>
#include <vector>

#include "rover_bridge/telemetry.hpp"
#include "test_helpers.hpp"

using rover_bridge::LinkState;
using rover_bridge::PoseEstimate;
using rover_bridge::TelemetryPayload;
using rover_bridge::encodeTelemetry;
using rover_bridge::kTelemetryPayloadSize;

namespace {

std::vector<uint8_t> bytesOf(const TelemetryPayload& t) {
  std::vector<uint8_t> out(kTelemetryPayloadSize);
  std::memcpy(out.data(), &t, kTelemetryPayloadSize);
  return out;
}

}  // namespace

TEST(Telemetry, QuantizesToMilliUnits) {
  PoseEstimate pose;
  pose.x_m = 1.23456;
  pose.y_m = -0.0016;
  pose.heading_rad = 0.0004;
  pose.linear_mps = 0.5;
  pose.angular_rps = -2.9999;

  const TelemetryPayload t = encodeTelemetry(pose, LinkState::DEGRADED, 12, 7);
  EXPECT_EQ(t.msg_type, static_cast<uint8_t>(rover_bridge::MsgType::TELEMETRY));
  EXPECT_EQ(t.seq, 12u);
  EXPECT_EQ(t.ack_seq, 7u);
  EXPECT_EQ(t.x_mm, 1235);
  EXPECT_EQ(t.y_mm, -2);
  EXPECT_EQ(t.heading_mrad, 0);
  EXPECT_EQ(t.linear_mm_s, 500);
  EXPECT_EQ(t.angular_mrad_s, -3000);
  EXPECT_EQ(t.link_state, static_cast<uint8_t>(LinkState::DEGRADED));
}

TEST(Telemetry, SaturatesOutOfRangeValues) {
  PoseEstimate pose;
  pose.x_m = 1e7;
  pose.y_m = -1e7;
  pose.linear_mps = std::numeric_limits<double>::quiet_NaN();

  const TelemetryPayload t = encodeTelemetry(pose, LinkState::ACTIVE, 0, 0);
  EXPECT_EQ(t.x_mm, std::numeric_limits<int32_t>::max());
  EXPECT_EQ(t.y_mm, std::numeric_limits<int32_t>::min());
  EXPECT_EQ(t.linear_mm_s, 0);
}

TEST(Telemetry, FieldsAreLittleEndianAndPacked) {
  PoseEstimate pose;
  pose.x_m = -0.001;
  const TelemetryPayload t = encodeTelemetry(pose, LinkState::FAULT, 0x01020304u, 0xA0B0C0D0u);
  const std::vector<uint8_t> b = bytesOf(t);

  EXPECT_EQ(b[0], 0x81);
  EXPECT_EQ(b[1], 0x04);
  EXPECT_EQ(b[4], 0x01);
  EXPECT_EQ(b[5], 0xD0);
  EXPECT_EQ(b[8], 0xA0);
  // x_mm = -1
  for (size_t i = 9; i < 13; ++i) EXPECT_EQ(b[i], 0xFF) << "byte " << i;
  EXPECT_EQ(b[29], static_cast<uint8_t>(LinkState::FAULT));
}

TEST(Telemetry, SurvivesFramingOnTelemetrySync) {
  PoseEstimate pose;
  pose.x_m = 3.5;
  pose.heading_rad = -1.0;
  const TelemetryPayload t = encodeTelemetry(pose, LinkState::ACTIVE, 99, 41);

  const std::vector<uint8_t> wire = rover_bridge::test::frame(rover_bridge::kTelemetrySync, bytesOf(t));
  EXPECT_EQ(wire[0], 0x3B);
  EXPECT_EQ(wire[1], 0xF2);

  const std::vector<TelemetryPayload> got = rover_bridge::test::telemetryFrames(wire);
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].seq, 99u);
  EXPECT_EQ(got[0].ack_seq, 41u);
  EXPECT_EQ(got[0].x_mm, 3500);
  EXPECT_EQ(got[0].heading_mrad, -1000);
}

TEST(Telemetry, DecodeRejectsWrongLengthOrTag) {
  const TelemetryPayload t = encodeTelemetry(PoseEstimate{}, LinkState::ACTIVE, 1, 1);
  std::vector<uint8_t> b = bytesOf(t);
  TelemetryPayload out{};

  EXPECT_TRUE(rover_bridge::decodeTelemetry(b.data(), b.size(), out));
  EXPECT_FALSE(rover_bridge::decodeTelemetry(b.data(), b.size() - 1, out));

  b[0] = static_cast<uint8_t>(rover_bridge::MsgType::VELOCITY_CMD);
  EXPECT_FALSE(rover_bridge::decodeTelemetry(b.data(), b.size(), out));
}

TEST(Telemetry, LinkStateNames) {
  EXPECT_STREQ(rover_bridge::toString(LinkState::ACTIVE), "ACTIVE");
  EXPECT_STREQ(rover_bridge::toString(LinkState::DEGRADED), "DEGRADED");
  EXPECT_STREQ(rover_bridge::toString(LinkState::FAULT), "FAULT");
}
