// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/message.hpp"
#include "util/strencodings.hpp"
#include <algorithm>
#include <sstream>

namespace peerwire {
namespace message {

namespace {

constexpr size_t TIMESTAMPED_ADDRESS_SIZE = 4 + 8 + 16 + 2;
constexpr size_t INVENTORY_VECTOR_SIZE = 4 + protocol::HASH_SIZE;
// Header plus at least a one-byte tx count
constexpr size_t MIN_HEADERS_ENTRY_SIZE = protocol::BLOCK_HEADER_SIZE + 1;
// Version, empty vin, empty vout, lock time
constexpr size_t MIN_TRANSACTION_SIZE = 4 + 1 + 1 + 4;

// Show at most this many hashes in ToString() output
constexpr size_t TO_STRING_HASH_LIMIT = 10;

} // namespace

network::WireError Message::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  deserialize_payload(d);
  return d.error();
}

std::string Message::ToString() const { return command() + "()"; }

// ============================================================================
// VersionMessage
// ============================================================================

std::vector<uint8_t> VersionMessage::serialize() const {
  MessageSerializer s;
  s.write_int32(version);
  s.write_uint64(services);
  s.write_int64(timestamp);
  s.write_network_address(addr_recv);
  s.write_network_address(addr_from);
  s.write_uint64(nonce);
  s.write_string(user_agent);
  s.write_int32(start_height);
  s.write_bool(relay);
  return s.release();
}

void VersionMessage::deserialize_payload(MessageDeserializer &d) {
  const int32_t ver = d.read_int32();
  const uint64_t svcs = d.read_uint64();
  const int64_t ts = d.read_int64();
  const auto recv = d.read_network_address();
  const auto from = d.read_network_address();
  const uint64_t n = d.read_uint64();
  std::string agent = d.read_string(protocol::MAX_SUBVERSION_LENGTH);
  const int32_t height = d.read_int32();
  // BIP37 relay flag is optional; absent means relay
  const bool fRelay = d.bytes_remaining() > 0 ? d.read_bool() : true;
  if (d.has_error()) {
    return;
  }

  version = ver;
  services = svcs;
  timestamp = ts;
  addr_recv = recv;
  addr_from = from;
  nonce = n;
  user_agent = std::move(agent);
  start_height = height;
  relay = fRelay;
}

std::string VersionMessage::ToString() const {
  std::stringstream s;
  s << "version(version=" << version << ", services=" << services
    << ", user_agent=" << user_agent << ", start_height=" << start_height
    << ", from=" << addr_from.ToString() << ", relay=" << relay << ")";
  return s.str();
}

// ============================================================================
// PingMessage / PongMessage
// ============================================================================

std::vector<uint8_t> PingMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

void PingMessage::deserialize_payload(MessageDeserializer &d) {
  const uint64_t n = d.read_uint64();
  if (!d.has_error()) {
    nonce = n;
  }
}

std::string PingMessage::ToString() const {
  return "ping(nonce=" + std::to_string(nonce) + ")";
}

std::vector<uint8_t> PongMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

void PongMessage::deserialize_payload(MessageDeserializer &d) {
  const uint64_t n = d.read_uint64();
  if (!d.has_error()) {
    nonce = n;
  }
}

std::string PongMessage::ToString() const {
  return "pong(nonce=" + std::to_string(nonce) + ")";
}

// ============================================================================
// AddrMessage
// ============================================================================

std::vector<uint8_t> AddrMessage::serialize() const {
  MessageSerializer s;
  s.write_varint(addresses.size());
  for (const auto &addr : addresses) {
    s.write_timestamped_address(addr);
  }
  return s.release();
}

void AddrMessage::deserialize_payload(MessageDeserializer &d) {
  const uint64_t count = d.read_varint(false);
  if (!d.check_count(count, TIMESTAMPED_ADDRESS_SIZE,
                     protocol::MAX_ADDR_SIZE)) {
    return;
  }

  std::vector<protocol::TimestampedAddress> addrs;
  addrs.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    addrs.push_back(d.read_timestamped_address());
  }
  if (d.has_error()) {
    return;
  }
  addresses = std::move(addrs);
}

std::string AddrMessage::ToString() const {
  std::stringstream s;
  s << "addr(" << addresses.size() << ": [";
  for (size_t i = 0; i < addresses.size() && i < TO_STRING_HASH_LIMIT; ++i) {
    if (i != 0)
      s << ", ";
    s << addresses[i].address.ToString();
  }
  s << "])";
  return s.str();
}

// ============================================================================
// InventoryListMessage
// ============================================================================

std::vector<uint8_t> InventoryListMessage::serialize() const {
  MessageSerializer s;
  s.write_varint(inventory.size());
  for (const auto &inv : inventory) {
    s.write_inventory(inv);
  }
  return s.release();
}

void InventoryListMessage::deserialize_payload(MessageDeserializer &d) {
  const uint64_t count = d.read_varint(false);
  if (!d.check_count(count, INVENTORY_VECTOR_SIZE, protocol::MAX_INV_SIZE)) {
    return;
  }

  std::vector<protocol::InventoryVector> items;
  items.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    items.push_back(d.read_inventory());
  }
  if (d.has_error()) {
    return;
  }
  inventory = std::move(items);
}

std::string InventoryListMessage::ToString() const {
  std::stringstream s;
  s << command() << "(" << inventory.size() << ": [";
  for (size_t i = 0; i < inventory.size() && i < TO_STRING_HASH_LIMIT; ++i) {
    if (i != 0)
      s << ", ";
    s << static_cast<uint32_t>(inventory[i].type) << ":"
      << util::HashToHex(inventory[i].hash);
  }
  s << "])";
  return s.str();
}

// ============================================================================
// BlockLocatorMessage
// ============================================================================

bool BlockLocatorMessage::is_unbounded() const {
  return std::all_of(hash_stop.begin(), hash_stop.end(),
                     [](uint8_t b) { return b == 0; });
}

std::vector<uint8_t> BlockLocatorMessage::serialize() const {
  MessageSerializer s;
  s.write_uint32(version);
  s.write_varint(locator_hashes.size());
  for (const auto &hash : locator_hashes) {
    s.write_hash(hash);
  }
  s.write_hash(hash_stop);
  return s.release();
}

void BlockLocatorMessage::deserialize_payload(MessageDeserializer &d) {
  const uint32_t ver = d.read_uint32();
  const uint64_t count = d.read_varint(false);
  if (!d.check_count(count, protocol::HASH_SIZE, protocol::MAX_LOCATOR_SZ)) {
    return;
  }

  std::vector<protocol::Hash256> hashes;
  hashes.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    hashes.push_back(d.read_hash());
  }
  const protocol::Hash256 stop = d.read_hash();
  if (d.has_error()) {
    return;
  }

  version = ver;
  locator_hashes = std::move(hashes);
  hash_stop = stop;
}

std::string BlockLocatorMessage::ToString() const {
  std::stringstream s;
  s << command() << "(version=" << version << ", " << locator_hashes.size()
    << ": [";
  for (size_t i = 0;
       i < locator_hashes.size() && i < TO_STRING_HASH_LIMIT; ++i) {
    if (i != 0)
      s << ", ";
    s << util::HashToHex(locator_hashes[i]);
  }
  s << "], hash_stop=" << util::HashToHex(hash_stop) << ")";
  return s.str();
}

// ============================================================================
// HeadersMessage
// ============================================================================

std::vector<uint8_t> HeadersMessage::serialize() const {
  MessageSerializer s;
  s.write_varint(headers.size());
  for (const auto &header : headers) {
    s.write_block_header(header);
    s.write_varint(0); // tx count, always zero in headers
  }
  return s.release();
}

void HeadersMessage::deserialize_payload(MessageDeserializer &d) {
  const uint64_t count = d.read_varint(false);
  if (!d.check_count(count, MIN_HEADERS_ENTRY_SIZE,
                     protocol::MAX_HEADERS_SIZE)) {
    return;
  }

  std::vector<CBlockHeader> result;
  result.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    result.push_back(d.read_block_header());
    d.read_varint(); // tx count, ignored
  }
  if (d.has_error()) {
    return;
  }
  headers = std::move(result);
}

std::string HeadersMessage::ToString() const {
  std::stringstream s;
  s << "headers(" << headers.size();
  if (!headers.empty()) {
    s << ", first=" << util::HashToHex(headers.front().GetHash())
      << ", last=" << util::HashToHex(headers.back().GetHash());
  }
  s << ")";
  return s.str();
}

// ============================================================================
// BlockMessage / TxMessage
// ============================================================================

std::vector<uint8_t> BlockMessage::serialize() const {
  MessageSerializer s;
  s.write_block_header(block);
  s.write_varint(block.vtx.size());
  for (const auto &tx : block.vtx) {
    s.write_transaction(tx);
  }
  return s.release();
}

void BlockMessage::deserialize_payload(MessageDeserializer &d) {
  CBlock result(d.read_block_header());
  const uint64_t count = d.read_varint(false);
  if (!d.check_count(count, MIN_TRANSACTION_SIZE, protocol::MAX_SIZE)) {
    return;
  }

  result.vtx.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    result.vtx.push_back(d.read_transaction());
  }
  if (d.has_error()) {
    return;
  }
  block = std::move(result);
}

std::string BlockMessage::ToString() const {
  std::stringstream s;
  s << "block(hash=" << util::HashToHex(block.GetHash())
    << ", tx=" << block.vtx.size() << ")";
  return s.str();
}

std::vector<uint8_t> TxMessage::serialize() const {
  MessageSerializer s;
  s.write_transaction(tx);
  return s.release();
}

void TxMessage::deserialize_payload(MessageDeserializer &d) {
  CTransaction result = d.read_transaction();
  if (d.has_error()) {
    return;
  }
  tx = std::move(result);
}

std::string TxMessage::ToString() const { return "tx(" + tx.ToString() + ")"; }

// ============================================================================
// MerkleBlockMessage
// ============================================================================

std::vector<uint8_t> MerkleBlockMessage::serialize() const {
  MessageSerializer s;
  s.write_block_header(header);
  s.write_uint32(total_transactions);
  s.write_varint(hashes.size());
  for (const auto &hash : hashes) {
    s.write_hash(hash);
  }
  s.write_var_bytes(flags);
  return s.release();
}

void MerkleBlockMessage::deserialize_payload(MessageDeserializer &d) {
  const CBlockHeader hdr = d.read_block_header();
  const uint32_t total = d.read_uint32();
  const uint64_t count = d.read_varint(false);
  if (!d.check_count(count, protocol::HASH_SIZE, protocol::MAX_SIZE)) {
    return;
  }

  std::vector<protocol::Hash256> result;
  result.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    result.push_back(d.read_hash());
  }
  std::vector<uint8_t> bits = d.read_var_bytes();
  if (d.has_error()) {
    return;
  }

  header = hdr;
  total_transactions = total;
  hashes = std::move(result);
  flags = std::move(bits);
}

std::string MerkleBlockMessage::ToString() const {
  std::stringstream s;
  s << "merkleblock(hash=" << util::HashToHex(header.GetHash())
    << ", total=" << total_transactions << ", hashes=" << hashes.size()
    << ", flag_bytes=" << flags.size() << ")";
  return s.str();
}

// ============================================================================
// FilterLoadMessage
// ============================================================================

std::vector<uint8_t> FilterLoadMessage::serialize() const {
  MessageSerializer s;
  s.write_var_bytes(filter);
  s.write_uint32(hash_funcs);
  s.write_uint32(tweak);
  s.write_uint8(flags);
  return s.release();
}

void FilterLoadMessage::deserialize_payload(MessageDeserializer &d) {
  std::vector<uint8_t> data = d.read_var_bytes(protocol::MAX_BLOOM_FILTER_SIZE);
  const uint32_t funcs = d.read_uint32();
  const uint32_t n_tweak = d.read_uint32();
  const uint8_t n_flags = d.read_uint8();
  if (d.has_error()) {
    return;
  }
  if (funcs > protocol::MAX_HASH_FUNCS) {
    d.set_error(network::WireError::LimitExceeded);
    return;
  }

  filter = std::move(data);
  hash_funcs = funcs;
  tweak = n_tweak;
  flags = n_flags;
}

std::string FilterLoadMessage::ToString() const {
  std::stringstream s;
  s << "filterload(bytes=" << filter.size() << ", hash_funcs=" << hash_funcs
    << ", tweak=" << tweak << ", flags=" << static_cast<int>(flags) << ")";
  return s.str();
}

// ============================================================================
// UnknownMessage
// ============================================================================

void UnknownMessage::deserialize_payload(MessageDeserializer &d) {
  payload_ = d.read_bytes(d.bytes_remaining());
}

std::string UnknownMessage::ToString() const {
  std::stringstream s;
  s << "unknown(command=" << command_ << ", bytes=" << payload_.size()
    << ")";
  return s.str();
}

} // namespace message
} // namespace peerwire
