// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/wire_codec.hpp"
#include "util/logging.hpp"

namespace peerwire {
namespace network {

WireCodec::WireCodec(uint32_t magic, const MessageRegistry &registry)
    : magic_(magic), registry_(registry) {}

WireCodec::WireCodec(const NetworkParams &params,
                     const MessageRegistry &registry)
    : magic_(params.GetNetworkMagic()), registry_(registry) {}

WireError WireCodec::Encode(const message::Message &msg,
                            std::vector<uint8_t> &out) const {
  const std::string command = msg.command();
  const auto payload = msg.serialize();

  WireError err = message::encode_envelope(magic_, command, payload, out);
  if (err == WireError::None) {
    LOG_NET_TRACE("encoded {} (payload {} bytes, frame {} bytes)", command,
                  payload.size(), out.size());
  }
  return err;
}

WireError WireCodec::Decode(const uint8_t *data, size_t size,
                            DecodedMessage &out, size_t &consumed) const {
  message::Envelope envelope;
  WireError err =
      message::decode_envelope(data, size, magic_, envelope, &consumed);
  if (err != WireError::None) {
    return err;
  }
  return Dispatch(std::move(envelope), out);
}

WireError WireCodec::Decode(const std::vector<uint8_t> &bytes,
                            DecodedMessage &out) const {
  size_t consumed = 0;
  return Decode(bytes.data(), bytes.size(), out, consumed);
}

WireError WireCodec::Read(ByteSource &source, DecodedMessage &out) const {
  message::Envelope envelope;
  WireError err = read_envelope(source, magic_, envelope);
  if (err != WireError::None) {
    return err;
  }
  return Dispatch(std::move(envelope), out);
}

WireError WireCodec::Dispatch(message::Envelope envelope,
                              DecodedMessage &out) const {
  message::MessagePtr msg;
  WireError err = registry_.Decode(envelope, msg);
  if (err != WireError::None) {
    return err;
  }

  LOG_NET_TRACE("received {} (payload {} bytes)", envelope.command,
                envelope.payload.size());

  out.known = registry_.HasCommand(envelope.command);
  out.message = std::move(msg);
  out.envelope = std::move(envelope);
  return WireError::None;
}

} // namespace network
} // namespace peerwire
