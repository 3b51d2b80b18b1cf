#ifndef ROVER_BRIDGE_FRAME_CODEC_HPP_
#define ROVER_BRIDGE_FRAME_CODEC_HPP_
/**
 * @file frame_codec.hpp
 * @brief Length-delimited, CRC-checked framing over an unreliable byte stream.
 *
 * The codec knows nothing about payload semantics. Decoding is resumable: the
 * caller keeps unconsumed bytes and retries once more data has arrived. Every
 * error status consumes at least one byte, so a corrupted stream can never
 * lock the decoder up.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rover_bridge/protocol.hpp"

namespace rover_bridge {

/** @brief Outcome of one decode attempt. */
enum class FrameStatus : uint8_t {
  OK = 0,               ///< A complete, valid frame was produced.
  NEED_MORE,            ///< Not enough bytes buffered yet; nothing consumed.
  SYNC_NOT_FOUND,       ///< Bytes before the next possible sync word were discarded.
  LENGTH_OUT_OF_RANGE,  ///< Length field exceeds kMaxPayload; frame discarded.
  CHECKSUM_MISMATCH,    ///< CRC did not match; frame discarded, payload not applied.
};

/** @brief Human-readable status name for logs/diagnostics. */
const char* toString(FrameStatus status);

/** @brief A decoded frame. Exists only while a single message is handled. */
struct Frame {
  uint16_t sync{0};
  std::vector<uint8_t> payload;
};

/**
 * @brief Encode a payload into a complete frame.
 *
 * @param sync    Sync word for the direction of travel.
 * @param payload Payload bytes.
 * @param len     Payload length; must be <= kMaxPayload.
 * @param[out] out Replaced with the frame bytes on success.
 * @return false if @p len exceeds kMaxPayload (logged once, @p out untouched).
 */
bool encodeFrame(uint16_t sync, const uint8_t* payload, size_t len, std::vector<uint8_t>& out);

/**
 * @brief Try to decode one frame from the front of a buffer.
 *
 * @param sync     Expected sync word.
 * @param data     Buffered bytes.
 * @param len      Number of buffered bytes.
 * @param[out] out Filled when OK is returned.
 * @param[out] consumed Number of bytes the caller must drop from the front.
 *                      Zero only for NEED_MORE.
 */
FrameStatus decodeFrame(uint16_t sync, const uint8_t* data, size_t len,
                        Frame& out, size_t& consumed);

/**
 * @brief Incremental frame decoder with a bounded receive buffer.
 *
 * Feed raw bytes as they arrive, then call next() until it reports OK or
 * NEED_MORE. If the buffer would exceed its capacity, the oldest bytes are
 * dropped.
 */
class FrameDecoder {
public:
  static constexpr size_t kDefaultCapacity = 512;

  explicit FrameDecoder(uint16_t sync, size_t capacity = kDefaultCapacity);

  /** @brief Append received bytes. */
  void feed(const uint8_t* data, size_t n);

  /** @brief Decode the next event from the buffer. */
  FrameStatus next(Frame& out);

  /** @brief Drop all buffered bytes. */
  void clear() { buf_.clear(); }

  size_t buffered() const { return buf_.size(); }
  size_t capacity() const { return capacity_; }

  /** @brief Total bytes dropped because the buffer was full. */
  uint64_t overflowBytes() const { return overflow_bytes_; }

private:
  uint16_t sync_;
  size_t capacity_;
  std::vector<uint8_t> buf_;
  uint64_t overflow_bytes_{0};
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_FRAME_CODEC_HPP_
