// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_ENVELOPE_HPP
#define PEERWIRE_NETWORK_ENVELOPE_HPP

#include "network/protocol.hpp"
#include "network/serialize.hpp"
#include "network/wire_error.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace peerwire {
namespace message {

using Checksum = std::array<uint8_t, protocol::CHECKSUM_SIZE>;
using CommandField = std::array<uint8_t, protocol::COMMAND_SIZE>;

/**
 * One decoded wire frame.
 *
 *   magic(4) | command(12, zero padded) | length(4) | checksum(4) | payload
 *
 * After a successful decode: checksum == compute_checksum(payload) and the
 * wire length equals payload.size().
 */
struct Envelope {
  uint32_t magic{0};
  std::string command;
  Checksum checksum{};
  std::vector<uint8_t> payload;
};

// First 4 bytes of SHA256(SHA256(payload))
Checksum compute_checksum(const uint8_t *data, size_t size);
Checksum compute_checksum(const std::vector<uint8_t> &payload);

/**
 * Command-name codec
 *
 * encode_command: InvalidCommand if name is empty, longer than 12 bytes or
 * contains a byte outside printable ASCII; otherwise left-justified and
 * zero-filled.
 *
 * decode_command: InvalidCommand if the field is all zero, or if any byte
 * before the last non-zero byte is not printable ASCII (embedded NULs
 * included); otherwise the bytes up to and including the last non-zero one.
 */
network::WireError encode_command(const std::string &name, CommandField &out);
network::WireError decode_command(const CommandField &field, std::string &out);

// Build a header for payload (fills length and checksum)
network::WireError create_header(uint32_t magic, const std::string &command,
                                 const std::vector<uint8_t> &payload,
                                 protocol::MessageHeader &out);

// 24 raw header bytes
std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header);

// Structural parse of 24 header bytes; no field validation
bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header);

/**
 * Validate a parsed header against the configured network: magic
 * (ProtocolMismatch), command (InvalidCommand) and declared length
 * (PayloadTooLarge). On success `command` holds the decoded name.
 */
network::WireError validate_header(const protocol::MessageHeader &header,
                                   uint32_t expected_magic,
                                   std::string &command);

/**
 * Envelope encoder: header followed by the payload verbatim.
 * Fails with InvalidCommand or PayloadTooLarge; `out` is untouched then.
 */
network::WireError encode_envelope(uint32_t magic, const std::string &command,
                                   const std::vector<uint8_t> &payload,
                                   std::vector<uint8_t> &out);

/**
 * Envelope decoder over a deserializer positioned at a frame boundary.
 *
 * Order: magic (ProtocolMismatch, nothing past the magic is consumed),
 * command (InvalidCommand), length (PayloadTooLarge, checked before any
 * allocation), checksum field, payload (Underflow), checksum verification
 * (ChecksumMismatch). On success exactly one frame has been consumed.
 */
network::WireError decode_envelope(MessageDeserializer &in,
                                   uint32_t expected_magic, Envelope &out);

// Convenience wrapper; `consumed` receives the bytes read (frame size on
// success)
network::WireError decode_envelope(const uint8_t *data, size_t size,
                                   uint32_t expected_magic, Envelope &out,
                                   size_t *consumed = nullptr);

/**
 * FrameBuffer - incremental frame extraction for async receive paths
 *
 * Bytes arriving from a transport callback are appended; next() hands out
 * complete frames in order. A partial frame is never consumed. The magic is
 * checked as soon as 4 bytes are present and the header as soon as 24 are,
 * so a bad peer is detected without waiting for its declared payload.
 * Errors are sticky: once next() fails the buffer keeps returning that
 * error and the connection should be dropped.
 */
class FrameBuffer {
public:
  explicit FrameBuffer(uint32_t expected_magic);

  void append(const uint8_t *data, size_t size);
  void append(const std::vector<uint8_t> &data);

  // On None, `complete` tells whether `out` now holds a frame
  network::WireError next(Envelope &out, bool &complete);

  size_t buffered() const { return buffer_.size() - offset_; }
  network::WireError error() const { return error_; }

private:
  void compact();

  uint32_t magic_;
  std::vector<uint8_t> buffer_;
  size_t offset_{0};
  network::WireError error_{network::WireError::None};
};

} // namespace message
} // namespace peerwire

#endif // PEERWIRE_NETWORK_ENVELOPE_HPP
