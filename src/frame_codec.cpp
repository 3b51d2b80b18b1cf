#include "rover_bridge/frame_codec.hpp"

#include <rclcpp/logger.hpp>
#include <rclcpp/logging.hpp>

#include "rover_bridge/crc16.hpp"

namespace rover_bridge {

namespace {

static constexpr size_t kLenOffset = 2;
static constexpr size_t kPayloadOffset = 3;

inline uint8_t lo(uint16_t v) { return static_cast<uint8_t>(v & 0xFF); }
inline uint8_t hi(uint16_t v) { return static_cast<uint8_t>(v >> 8); }

}  // namespace

const char* toString(FrameStatus status) {
  switch (status) {
    case FrameStatus::OK:                    return "ok";
    case FrameStatus::NEED_MORE:             return "need_more";
    case FrameStatus::SYNC_NOT_FOUND:        return "sync_not_found";
    case FrameStatus::LENGTH_OUT_OF_RANGE:   return "length_out_of_range";
    case FrameStatus::CHECKSUM_MISMATCH:     return "checksum_mismatch";
  }
  return "unknown";
}

bool encodeFrame(uint16_t sync, const uint8_t* payload, size_t len, std::vector<uint8_t>& out) {
  if (len > kMaxPayload) {
    RCLCPP_ERROR_ONCE(rclcpp::get_logger("rover_bridge"),
      "Refusing to encode %zu byte payload (max %zu)", len, kMaxPayload);
    return false;
  }

  out.clear();
  out.reserve(len + kFrameOverhead);
  out.push_back(lo(sync));
  out.push_back(hi(sync));
  out.push_back(static_cast<uint8_t>(len));
  if (len > 0) out.insert(out.end(), payload, payload + len);

  // CRC covers length + payload
  const uint16_t crc = crc16_ccitt_false(out.data() + kLenOffset, len + 1);
  out.push_back(lo(crc));
  out.push_back(hi(crc));
  return true;
}

FrameStatus decodeFrame(uint16_t sync, const uint8_t* data, size_t len,
                        Frame& out, size_t& consumed) {
  consumed = 0;
  if (len == 0) return FrameStatus::NEED_MORE;

  // Find sync
  size_t i = 0;
  bool found = false;
  for (; i + 1 < len; ++i) {
    if (data[i] == lo(sync) && data[i + 1] == hi(sync)) { found = true; break; }
  }

  if (!found) {
    // Keep a trailing first sync byte; its partner may still be in flight.
    consumed = (data[len - 1] == lo(sync)) ? len - 1 : len;
    return consumed > 0 ? FrameStatus::SYNC_NOT_FOUND : FrameStatus::NEED_MORE;
  }
  if (i > 0) {
    consumed = i;
    return FrameStatus::SYNC_NOT_FOUND;
  }

  if (len <= kLenOffset) return FrameStatus::NEED_MORE;

  const size_t payload_len = data[kLenOffset];
  if (payload_len > kMaxPayload) {
    consumed = 1;
    return FrameStatus::LENGTH_OUT_OF_RANGE;
  }

  const size_t frame_len = payload_len + kFrameOverhead;
  if (len < frame_len) return FrameStatus::NEED_MORE;

  const uint16_t expected = crc16_ccitt_false(data + kLenOffset, payload_len + 1);
  const uint16_t received = static_cast<uint16_t>(
    data[kPayloadOffset + payload_len] |
    (static_cast<uint16_t>(data[kPayloadOffset + payload_len + 1]) << 8));
  if (expected != received) {
    // Drop one byte and rescan; a real frame may start inside this one.
    consumed = 1;
    return FrameStatus::CHECKSUM_MISMATCH;
  }

  out.sync = sync;
  out.payload.assign(data + kPayloadOffset, data + kPayloadOffset + payload_len);
  consumed = frame_len;
  return FrameStatus::OK;
}

FrameDecoder::FrameDecoder(uint16_t sync, size_t capacity)
: sync_(sync), capacity_(capacity < kMaxPayload + kFrameOverhead ? kMaxPayload + kFrameOverhead : capacity) {
  buf_.reserve(capacity_);
}

void FrameDecoder::feed(const uint8_t* data, size_t n) {
  if (n == 0) return;
  buf_.insert(buf_.end(), data, data + n);
  if (buf_.size() > capacity_) {
    const size_t excess = buf_.size() - capacity_;
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<long>(excess));
    overflow_bytes_ += excess;
  }
}

FrameStatus FrameDecoder::next(Frame& out) {
  size_t consumed = 0;
  const FrameStatus status = decodeFrame(sync_, buf_.data(), buf_.size(), out, consumed);
  if (consumed > 0) {
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<long>(consumed));
  }
  return status;
}

}  // namespace rover_bridge
