// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_PROTOCOL_HPP
#define PEERWIRE_PROTOCOL_HPP

#include "version.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace peerwire {
namespace protocol {

// Protocol version spoken by default (sendheaders/feefilter era)
constexpr uint32_t PROTOCOL_VERSION = 70015;

// Network magic values, as read little-endian from the first 4 wire bytes.
// MAINNET therefore appears on the wire as F9 BE B4 D9.
namespace magic {
constexpr uint32_t MAINNET = 0xD9B4BEF9;
constexpr uint32_t TESTNET = 0x0709110B;
constexpr uint32_t REGTEST = 0xDAB5BFFA;
} // namespace magic

namespace ports {
constexpr uint16_t MAINNET = 8333;
constexpr uint16_t TESTNET = 18333;
constexpr uint16_t REGTEST = 18444;
} // namespace ports

// Service flags - what services a node provides
enum ServiceFlags : uint64_t {
  NODE_NONE = 0,
  NODE_NETWORK = (1 << 0),
};

// Message types - 12 bytes, null-padded on the wire
namespace commands {
// Handshake
constexpr const char *VERSION = "version";
constexpr const char *VERACK = "verack";

// Peer discovery
constexpr const char *ADDR = "addr";
constexpr const char *GETADDR = "getaddr";

// Inventory announcements and requests
constexpr const char *INV = "inv";
constexpr const char *GETDATA = "getdata";
constexpr const char *NOTFOUND = "notfound";

// Chain download
constexpr const char *GETBLOCKS = "getblocks";
constexpr const char *GETHEADERS = "getheaders";
constexpr const char *HEADERS = "headers";
constexpr const char *SENDHEADERS = "sendheaders";
constexpr const char *BLOCK = "block";
constexpr const char *MERKLEBLOCK = "merkleblock";
constexpr const char *TX = "tx";

// Bloom filtering (BIP37)
constexpr const char *FILTERLOAD = "filterload";

// Keep-alive
constexpr const char *PING = "ping";
constexpr const char *PONG = "pong";
} // namespace commands

// Inventory types for INV/GETDATA/NOTFOUND messages
enum class InventoryType : uint32_t {
  ERROR = 0,
  MSG_TX = 1,
  MSG_BLOCK = 2,
  MSG_FILTERED_BLOCK = 3,
};

// Message header constants
constexpr size_t MAGIC_SIZE = 4;
constexpr size_t COMMAND_SIZE = 12;
constexpr size_t LENGTH_SIZE = 4;
constexpr size_t CHECKSUM_SIZE = 4;
constexpr size_t MESSAGE_HEADER_SIZE =
    MAGIC_SIZE + COMMAND_SIZE + LENGTH_SIZE + CHECKSUM_SIZE; // 24

constexpr size_t HASH_SIZE = 32;
constexpr size_t BLOCK_HEADER_SIZE = 80;

// ============================================================================
// SECURITY LIMITS (from Bitcoin Core)
// ============================================================================

// Serialization limits (Bitcoin Core src/serialize.h)
constexpr uint64_t MAX_SIZE =
    0x02000000; // 32 MB - Maximum serialized object size / count

// Network message limits (Bitcoin Core src/net.h)
constexpr size_t MAX_PROTOCOL_MESSAGE_LENGTH =
    4 * 1000 * 1000; // 4 MB - Single message limit

// Protocol-specific limits
constexpr unsigned int MAX_LOCATOR_SZ =
    101; // GETHEADERS/GETBLOCKS locator limit
constexpr uint32_t MAX_INV_SIZE = 50000;    // Inventory items
constexpr uint32_t MAX_HEADERS_SIZE = 2000; // Headers per response
constexpr uint32_t MAX_ADDR_SIZE = 1000;    // Addresses per ADDR message

// BIP37 bloom filter limits
constexpr size_t MAX_BLOOM_FILTER_SIZE = 36000; // bytes
constexpr uint32_t MAX_HASH_FUNCS = 50;

constexpr size_t MAX_SUBVERSION_LENGTH = 256;

// User agent string (from version.hpp)
inline std::string GetUserAgent() { return peerwire::GetUserAgent(); }

using Hash256 = std::array<uint8_t, HASH_SIZE>;

// Message header structure (24 bytes):
// magic (4 bytes), command (12 bytes null-padded), length (4 bytes), checksum
// (4 bytes). Field values are raw; see network/envelope.hpp for validation.
struct MessageHeader {
  uint32_t magic;
  std::array<uint8_t, COMMAND_SIZE> command;
  uint32_t length;
  std::array<uint8_t, CHECKSUM_SIZE> checksum;

  MessageHeader();
};

// Network address structure (26 bytes without timestamp, 30 with)
struct NetworkAddress {
  uint64_t services;
  std::array<uint8_t, 16> ip; // IPv6 format (IPv4 mapped)
  uint16_t port;

  NetworkAddress();
  NetworkAddress(uint64_t svcs, const std::array<uint8_t, 16> &addr,
                 uint16_t p);

  // Helper to create from IPv4
  static NetworkAddress from_ipv4(uint64_t services, uint32_t ipv4,
                                  uint16_t port);

  // Helper to get IPv4 (returns 0 if not IPv4-mapped)
  uint32_t get_ipv4() const;

  // Check if this is IPv4-mapped
  bool is_ipv4() const;

  std::string ToString() const;

  bool operator==(const NetworkAddress &other) const {
    return services == other.services && ip == other.ip && port == other.port;
  }
};

// Timestamped network address (30 bytes)
struct TimestampedAddress {
  uint32_t timestamp;
  NetworkAddress address;

  TimestampedAddress();
  TimestampedAddress(uint32_t ts, const NetworkAddress &addr);

  bool operator==(const TimestampedAddress &other) const {
    return timestamp == other.timestamp && address == other.address;
  }
};

// Inventory vector - identifies a transaction or block
struct InventoryVector {
  InventoryType type;
  Hash256 hash;

  InventoryVector();
  InventoryVector(InventoryType t, const Hash256 &h);

  bool operator==(const InventoryVector &other) const {
    return type == other.type && hash == other.hash;
  }
};

} // namespace protocol
} // namespace peerwire

#endif // PEERWIRE_PROTOCOL_HPP
