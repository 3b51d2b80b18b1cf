#ifndef ROVER_BRIDGE_COMMAND_DECODER_HPP_
#define ROVER_BRIDGE_COMMAND_DECODER_HPP_
/**
 * @file command_decoder.hpp
 * @brief Turns a command frame payload into a typed, range-limited velocity command.
 */

#include <cstddef>
#include <cstdint>

namespace rover_bridge {

/**
 * @brief Most recently accepted velocity command.
 *
 * Coordinate conventions:
 *  - +linear  -> forward
 *  - +angular -> counter-clockwise rotation
 */
struct VelocityCommand {
  double linear_mps{0.0};
  double angular_rps{0.0};
  uint32_t seq{0};
};

/** @brief Outcome of decoding one command payload. */
enum class CommandStatus : uint8_t {
  ACCEPTED = 0,  ///< New command; supersedes the current one.
  MALFORMED,     ///< Wrong length or message tag.
  STALE,         ///< Sequence number not newer than the last accepted one.
};

const char* toString(CommandStatus status);

/**
 * @brief Stateful command decoder.
 *
 * Tracks the last accepted sequence number of the current link session so
 * that replayed or reordered frames are ignored. Velocities outside the
 * configured limits are clamped, never rejected.
 */
class CommandDecoder {
public:
  /**
   * @param max_linear_mps  Symmetric clamp for linear velocity.
   * @param max_angular_rps Symmetric clamp for angular velocity.
   */
  CommandDecoder(double max_linear_mps, double max_angular_rps);

  /**
   * @brief Decode a payload.
   * @param[out] out Written only when ACCEPTED is returned.
   */
  CommandStatus decode(const uint8_t* payload, size_t len, VelocityCommand& out);

  /** @brief Start a new link session; the next well-formed command is accepted. */
  void resetSession() { have_seq_ = false; }

  bool haveSequence() const { return have_seq_; }
  uint32_t lastSequence() const { return last_seq_; }

private:
  double max_linear_mps_;
  double max_angular_rps_;

  uint32_t last_seq_{0};
  bool have_seq_{false};
};

}  // namespace rover_bridge

#endif  // ROVER_BRIDGE_COMMAND_DECODER_HPP_
