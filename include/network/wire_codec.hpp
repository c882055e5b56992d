// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_WIRE_CODEC_HPP
#define PEERWIRE_NETWORK_WIRE_CODEC_HPP

#include "network/byte_source.hpp"
#include "network/envelope.hpp"
#include "network/message.hpp"
#include "network/message_registry.hpp"
#include "network/network_params.hpp"
#include "network/wire_error.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace peerwire {
namespace network {

// A decoded frame and the typed message built from it
struct DecodedMessage {
  message::Envelope envelope;
  message::MessagePtr message;

  // False when the command had no decoder and `message` is an
  // UnknownMessage
  bool known{false};
};

/**
 * WireCodec - the encode/decode surface a transport talks to
 *
 * Binds a network magic to a registry. Stateless apart from those two, so
 * one instance can serve every connection of a node. The registry is
 * borrowed and must outlive the codec.
 */
class WireCodec {
public:
  explicit WireCodec(uint32_t magic, const MessageRegistry &registry =
                                         MessageRegistry::Default());
  explicit WireCodec(const NetworkParams &params,
                     const MessageRegistry &registry =
                         MessageRegistry::Default());

  uint32_t magic() const { return magic_; }
  const MessageRegistry &registry() const { return registry_; }

  // Typed message -> full frame bytes
  WireError Encode(const message::Message &msg,
                   std::vector<uint8_t> &out) const;

  /**
   * Decode the frame at the start of [data, data + size).
   * `consumed` is the number of bytes read; a caller holding several
   * frames back to back advances by it after each success.
   */
  WireError Decode(const uint8_t *data, size_t size, DecodedMessage &out,
                   size_t &consumed) const;
  WireError Decode(const std::vector<uint8_t> &bytes,
                   DecodedMessage &out) const;

  // Blocking read of one frame from a stream, then dispatch
  WireError Read(ByteSource &source, DecodedMessage &out) const;

  // Typed dispatch of an already framed envelope (e.g. from FrameBuffer)
  WireError Dispatch(message::Envelope envelope, DecodedMessage &out) const;

private:
  uint32_t magic_;
  const MessageRegistry &registry_;
};

} // namespace network
} // namespace peerwire

#endif // PEERWIRE_NETWORK_WIRE_CODEC_HPP
