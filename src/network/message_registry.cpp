// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/message_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerwire {
namespace network {

using namespace message;

MessageRegistry::MessageRegistry(Entries entries)
    : decoders_(std::move(entries)) {
  for (const auto &[command, decoder] : decoders_) {
    CommandField field;
    if (encode_command(command, field) != WireError::None) {
      throw std::invalid_argument("invalid command name in registry: '" +
                                  command + "'");
    }
    if (!decoder) {
      throw std::invalid_argument("empty decoder registered for '" + command +
                                  "'");
    }
  }
}

WireError MessageRegistry::Decode(const Envelope &envelope,
                                  MessagePtr &out) const {
  auto it = decoders_.find(envelope.command);
  if (it == decoders_.end()) {
    LOG_NET_DEBUG("unknown message type: {} ({} bytes), passing through",
                  envelope.command, envelope.payload.size());
    out = std::make_unique<UnknownMessage>(envelope.command, envelope.payload);
    return WireError::None;
  }

  MessagePtr msg;
  WireError err = it->second(envelope.payload, msg);
  if (err != WireError::None) {
    LOG_NET_DEBUG("failed to deserialize message: {} ({} bytes): {}",
                  envelope.command, envelope.payload.size(),
                  WireErrorString(err));
    return err;
  }
  if (!msg) {
    LOG_NET_ERROR("decoder for {} reported success without a message",
                  envelope.command);
    return WireError::Malformed;
  }

  out = std::move(msg);
  return WireError::None;
}

bool MessageRegistry::HasCommand(const std::string &command) const {
  return decoders_.count(command) > 0;
}

std::vector<std::string> MessageRegistry::GetRegisteredCommands() const {
  std::vector<std::string> result;
  result.reserve(decoders_.size());
  for (const auto &[cmd, _] : decoders_) {
    result.push_back(cmd);
  }
  std::sort(result.begin(), result.end());
  return result;
}

MessageRegistry::Entries MessageRegistry::DefaultEntries() {
  namespace cmd = protocol::commands;

  Entries entries;
  entries[cmd::VERSION] = MakeDecoder<VersionMessage>();
  entries[cmd::VERACK] = MakeDecoder<VerackMessage>();
  entries[cmd::ADDR] = MakeDecoder<AddrMessage>();
  entries[cmd::GETADDR] = MakeDecoder<GetAddrMessage>();
  entries[cmd::INV] = MakeDecoder<InvMessage>();
  entries[cmd::GETDATA] = MakeDecoder<GetDataMessage>();
  entries[cmd::NOTFOUND] = MakeDecoder<NotFoundMessage>();
  entries[cmd::GETBLOCKS] = MakeDecoder<GetBlocksMessage>();
  entries[cmd::GETHEADERS] = MakeDecoder<GetHeadersMessage>();
  entries[cmd::HEADERS] = MakeDecoder<HeadersMessage>();
  entries[cmd::SENDHEADERS] = MakeDecoder<SendHeadersMessage>();
  entries[cmd::BLOCK] = MakeDecoder<BlockMessage>();
  entries[cmd::MERKLEBLOCK] = MakeDecoder<MerkleBlockMessage>();
  entries[cmd::TX] = MakeDecoder<TxMessage>();
  entries[cmd::FILTERLOAD] = MakeDecoder<FilterLoadMessage>();
  entries[cmd::PING] = MakeDecoder<PingMessage>();
  entries[cmd::PONG] = MakeDecoder<PongMessage>();
  return entries;
}

const MessageRegistry &MessageRegistry::Default() {
  static const MessageRegistry registry(DefaultEntries());
  return registry;
}

} // namespace network
} // namespace peerwire
