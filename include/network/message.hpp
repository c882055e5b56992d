// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_MESSAGE_HPP
#define PEERWIRE_NETWORK_MESSAGE_HPP

#include "network/network_params.hpp"
#include "network/protocol.hpp"
#include "network/serialize.hpp"
#include "network/wire_error.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace peerwire {
namespace message {

/**
 * Message - payload codec for one command
 *
 * Each command implements serialize() and deserialize_payload(). The public
 * deserialize() wraps the payload in a MessageDeserializer and reports the
 * first failure; trailing bytes after the last field are ignored so newer
 * peers may append fields.
 *
 * Payload decoders build their fields in locals and assign only once every
 * read has succeeded, so a failed decode leaves the message as it was.
 */
class Message {
public:
  virtual ~Message() = default;

  virtual std::string command() const = 0;
  virtual std::vector<uint8_t> serialize() const = 0;

  network::WireError deserialize(const uint8_t *data, size_t size);
  network::WireError deserialize(const std::vector<uint8_t> &payload) {
    return deserialize(payload.data(), payload.size());
  }

  virtual std::string ToString() const;

protected:
  virtual void deserialize_payload(MessageDeserializer &d) = 0;
};

using MessagePtr = std::unique_ptr<Message>;

// ============================================================================
// Handshake
// ============================================================================

class VersionMessage : public Message {
public:
  int32_t version{0};
  uint64_t services{0};
  int64_t timestamp{0};
  protocol::NetworkAddress addr_recv;
  protocol::NetworkAddress addr_from;
  uint64_t nonce{0};
  std::string user_agent;
  int32_t start_height{0};
  bool relay{true};

  std::string command() const override { return protocol::commands::VERSION; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

// Empty-payload messages
class EmptyMessage : public Message {
public:
  std::vector<uint8_t> serialize() const override { return {}; }

protected:
  void deserialize_payload(MessageDeserializer &) override {}
};

class VerackMessage : public EmptyMessage {
public:
  std::string command() const override { return protocol::commands::VERACK; }
};

class GetAddrMessage : public EmptyMessage {
public:
  std::string command() const override { return protocol::commands::GETADDR; }
};

class SendHeadersMessage : public EmptyMessage {
public:
  std::string command() const override {
    return protocol::commands::SENDHEADERS;
  }
};

// ============================================================================
// Keep-alive
// ============================================================================

class PingMessage : public Message {
public:
  uint64_t nonce{0};

  PingMessage() = default;
  explicit PingMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PING; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

class PongMessage : public Message {
public:
  uint64_t nonce{0};

  PongMessage() = default;
  explicit PongMessage(uint64_t n) : nonce(n) {}

  std::string command() const override { return protocol::commands::PONG; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

// ============================================================================
// Peer discovery
// ============================================================================

class AddrMessage : public Message {
public:
  std::vector<protocol::TimestampedAddress> addresses;

  std::string command() const override { return protocol::commands::ADDR; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

// ============================================================================
// Inventory (inv / getdata / notfound share one layout)
// ============================================================================

class InventoryListMessage : public Message {
public:
  std::vector<protocol::InventoryVector> inventory;

  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

class InvMessage : public InventoryListMessage {
public:
  std::string command() const override { return protocol::commands::INV; }
};

class GetDataMessage : public InventoryListMessage {
public:
  std::string command() const override { return protocol::commands::GETDATA; }
};

class NotFoundMessage : public InventoryListMessage {
public:
  std::string command() const override {
    return protocol::commands::NOTFOUND;
  }
};

// ============================================================================
// Block locator requests (getheaders / getblocks)
// ============================================================================

/**
 * Locator request payload
 *
 *   version         4 bytes
 *   count           varint
 *   locator_hashes  32 bytes * count, order significant, duplicates allowed
 *   hash_stop       32 bytes, all zero = "as many as you will send"
 *
 * Decoding checks count against the remaining bytes (Underflow) and then
 * against MAX_LOCATOR_SZ (LimitExceeded) before reserving anything.
 */
class BlockLocatorMessage : public Message {
public:
  uint32_t version{0};
  std::vector<protocol::Hash256> locator_hashes;
  protocol::Hash256 hash_stop{};

  BlockLocatorMessage() = default;
  BlockLocatorMessage(uint32_t ver, std::vector<protocol::Hash256> locator,
                      const protocol::Hash256 &stop)
      : version(ver), locator_hashes(std::move(locator)), hash_stop(stop) {}

  // Outbound request: the network's protocol version and zero hash_stop
  BlockLocatorMessage(std::vector<protocol::Hash256> locator,
                      const network::NetworkParams &params)
      : version(params.GetProtocolVersion()),
        locator_hashes(std::move(locator)), hash_stop(params.GetZeroHash()) {}

  bool is_unbounded() const;

  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

class GetHeadersMessage : public BlockLocatorMessage {
public:
  using BlockLocatorMessage::BlockLocatorMessage;
  std::string command() const override {
    return protocol::commands::GETHEADERS;
  }
};

class GetBlocksMessage : public BlockLocatorMessage {
public:
  using BlockLocatorMessage::BlockLocatorMessage;
  std::string command() const override {
    return protocol::commands::GETBLOCKS;
  }
};

// ============================================================================
// Chain data
// ============================================================================

// Up to MAX_HEADERS_SIZE headers, each followed by a (zero) tx count
class HeadersMessage : public Message {
public:
  std::vector<CBlockHeader> headers;

  std::string command() const override { return protocol::commands::HEADERS; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

class BlockMessage : public Message {
public:
  CBlock block;

  std::string command() const override { return protocol::commands::BLOCK; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

class TxMessage : public Message {
public:
  CTransaction tx;

  std::string command() const override { return protocol::commands::TX; }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

// BIP37 filtered block: header plus a partial merkle tree
class MerkleBlockMessage : public Message {
public:
  CBlockHeader header;
  uint32_t total_transactions{0};
  std::vector<protocol::Hash256> hashes;
  std::vector<uint8_t> flags;

  std::string command() const override {
    return protocol::commands::MERKLEBLOCK;
  }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

// BIP37 bloom filter
class FilterLoadMessage : public Message {
public:
  std::vector<uint8_t> filter;
  uint32_t hash_funcs{0};
  uint32_t tweak{0};
  uint8_t flags{0};

  std::string command() const override {
    return protocol::commands::FILTERLOAD;
  }
  std::vector<uint8_t> serialize() const override;
  std::string ToString() const override;

protected:
  void deserialize_payload(MessageDeserializer &d) override;
};

// ============================================================================
// Opaque fallback
// ============================================================================

/**
 * UnknownMessage - any command without a registered decoder
 *
 * Keeps the command string and the payload bytes verbatim, so unrecognised
 * traffic is surfaced to the caller instead of being dropped. Decoding an
 * unknown payload never fails.
 */
class UnknownMessage : public Message {
public:
  UnknownMessage() = default;
  UnknownMessage(std::string cmd, std::vector<uint8_t> payload)
      : command_(std::move(cmd)), payload_(std::move(payload)) {}

  std::string command() const override { return command_; }
  std::vector<uint8_t> serialize() const override { return payload_; }
  std::string ToString() const override;

  const std::vector<uint8_t> &payload() const { return payload_; }

protected:
  void deserialize_payload(MessageDeserializer &d) override;

private:
  std::string command_;
  std::vector<uint8_t> payload_;
};

} // namespace message
} // namespace peerwire

#endif // PEERWIRE_NETWORK_MESSAGE_HPP
