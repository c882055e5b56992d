// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_WIRE_ERROR_HPP
#define PEERWIRE_NETWORK_WIRE_ERROR_HPP

#include <cstdint>

namespace peerwire {
namespace network {

/**
 * Outcome of an encode/decode step.
 *
 * Every value other than None is fatal for the frame being processed; a
 * peer that produces one is misbehaving and its connection should be
 * dropped. An unrecognised command is not an error (it decodes to an
 * UnknownMessage).
 */
enum class WireError : uint8_t {
  None = 0,
  ProtocolMismatch, // magic does not match the configured network
  ChecksumMismatch, // payload does not hash to the header checksum
  InvalidCommand,   // command field empty, too long or not printable ASCII
  Underflow,        // input ended before a declared length was satisfied
  PayloadTooLarge,  // declared payload length above the protocol limit
  LimitExceeded,    // a declared element count above its protocol limit
  Malformed,        // structurally invalid field value
  StreamClosed,     // blocking source reached end-of-stream between frames
};

// Stable lowercase name, used in logs and tool output
const char *WireErrorString(WireError err);

} // namespace network
} // namespace peerwire

#endif // PEERWIRE_NETWORK_WIRE_ERROR_HPP
