// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/serialize.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace peerwire {
namespace message {

namespace {
// Smallest possible serialized transaction input/output
constexpr size_t MIN_TXIN_SIZE = 32 + 4 + 1 + 4;
constexpr size_t MIN_TXOUT_SIZE = 8 + 1;
constexpr size_t NETWORK_ADDRESS_SIZE = 8 + 16 + 2;
} // namespace

// ============================================================================
// VarInt
// ============================================================================

size_t VarInt::size() const {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

size_t VarInt::encode(uint8_t *buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  }
  if (value <= 0xffff) {
    buffer[0] = 0xfd;
    endian::WriteLE16(buffer + 1, static_cast<uint16_t>(value));
    return 3;
  }
  if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    endian::WriteLE32(buffer + 1, static_cast<uint32_t>(value));
    return 5;
  }
  buffer[0] = 0xff;
  endian::WriteLE64(buffer + 1, value);
  return 9;
}

size_t VarInt::decode(const uint8_t *data, size_t available) {
  if (data == nullptr || available < 1) {
    return 0;
  }

  const uint8_t prefix = data[0];
  if (prefix < 0xfd) {
    value = prefix;
    return 1;
  }

  const size_t width = prefix == 0xfd ? 2 : (prefix == 0xfe ? 4 : 8);
  if (available < 1 + width) {
    return 0;
  }

  switch (width) {
  case 2:
    value = endian::ReadLE16(data + 1);
    break;
  case 4:
    value = endian::ReadLE32(data + 1);
    break;
  default:
    value = endian::ReadLE64(data + 1);
    break;
  }
  return 1 + width;
}

// ============================================================================
// MessageSerializer
// ============================================================================

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_uint16(uint16_t value) {
  uint8_t tmp[2];
  endian::WriteLE16(tmp, value);
  buffer_.insert(buffer_.end(), tmp, tmp + 2);
}

void MessageSerializer::write_uint32(uint32_t value) {
  uint8_t tmp[4];
  endian::WriteLE32(tmp, value);
  buffer_.insert(buffer_.end(), tmp, tmp + 4);
}

void MessageSerializer::write_int32(int32_t value) {
  write_uint32(static_cast<uint32_t>(value));
}

void MessageSerializer::write_uint64(uint64_t value) {
  uint8_t tmp[8];
  endian::WriteLE64(tmp, value);
  buffer_.insert(buffer_.end(), tmp, tmp + 8);
}

void MessageSerializer::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void MessageSerializer::write_bool(bool value) {
  write_uint8(value ? 1 : 0);
}

void MessageSerializer::write_varint(uint64_t value) {
  uint8_t tmp[VarInt::MAX_ENCODED_SIZE];
  size_t n = VarInt(value).encode(tmp);
  buffer_.insert(buffer_.end(), tmp, tmp + n);
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t size) {
  if (size == 0) {
    return;
  }
  buffer_.insert(buffer_.end(), data, data + size);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t> &data) {
  write_bytes(data.data(), data.size());
}

void MessageSerializer::write_var_bytes(const std::vector<uint8_t> &data) {
  write_varint(data.size());
  write_bytes(data);
}

void MessageSerializer::write_string(const std::string &str) {
  write_varint(str.size());
  write_bytes(reinterpret_cast<const uint8_t *>(str.data()), str.size());
}

void MessageSerializer::write_hash(const protocol::Hash256 &hash) {
  write_bytes(hash.data(), hash.size());
}

void MessageSerializer::write_network_address(
    const protocol::NetworkAddress &addr) {
  write_uint64(addr.services);
  write_bytes(addr.ip.data(), addr.ip.size());
  uint8_t port[2];
  endian::WriteBE16(port, addr.port);
  write_bytes(port, 2);
}

void MessageSerializer::write_timestamped_address(
    const protocol::TimestampedAddress &addr) {
  write_uint32(addr.timestamp);
  write_network_address(addr.address);
}

void MessageSerializer::write_inventory(const protocol::InventoryVector &inv) {
  write_uint32(static_cast<uint32_t>(inv.type));
  write_hash(inv.hash);
}

void MessageSerializer::write_block_header(const CBlockHeader &header) {
  const auto bytes = header.SerializeFixed();
  write_bytes(bytes.data(), bytes.size());
}

void MessageSerializer::write_transaction(const CTransaction &tx) {
  write_int32(tx.nVersion);

  write_varint(tx.vin.size());
  for (const auto &in : tx.vin) {
    write_hash(in.prevout.hash);
    write_uint32(in.prevout.n);
    write_var_bytes(in.scriptSig);
    write_uint32(in.nSequence);
  }

  write_varint(tx.vout.size());
  for (const auto &out : tx.vout) {
    write_int64(out.nValue);
    write_var_bytes(out.scriptPubKey);
  }

  write_uint32(tx.nLockTime);
}

// ============================================================================
// MessageDeserializer
// ============================================================================

MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(data != nullptr ? size : 0) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &buffer)
    : data_(buffer.data()), size_(buffer.size()) {}

void MessageDeserializer::set_error(network::WireError err) {
  if (error_ == network::WireError::None) {
    error_ = err;
  }
}

bool MessageDeserializer::require(size_t size) {
  if (has_error()) {
    return false;
  }
  if (size_ - pos_ < size) {
    set_error(network::WireError::Underflow);
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!require(1))
    return 0;
  return data_[pos_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!require(2))
    return 0;
  uint16_t v = endian::ReadLE16(data_ + pos_);
  pos_ += 2;
  return v;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!require(4))
    return 0;
  uint32_t v = endian::ReadLE32(data_ + pos_);
  pos_ += 4;
  return v;
}

int32_t MessageDeserializer::read_int32() {
  return static_cast<int32_t>(read_uint32());
}

uint64_t MessageDeserializer::read_uint64() {
  if (!require(8))
    return 0;
  uint64_t v = endian::ReadLE64(data_ + pos_);
  pos_ += 8;
  return v;
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

bool MessageDeserializer::read_bool() { return read_uint8() != 0; }

uint64_t MessageDeserializer::read_varint(bool range_check) {
  if (has_error()) {
    return 0;
  }

  VarInt vi;
  size_t consumed = vi.decode(data_ + pos_, size_ - pos_);
  if (consumed == 0) {
    set_error(network::WireError::Underflow);
    return 0;
  }

  if (range_check && vi.value > protocol::MAX_SIZE) {
    set_error(network::WireError::LimitExceeded);
    return 0;
  }

  pos_ += consumed;
  return vi.value;
}

bool MessageDeserializer::read_bytes(uint8_t *out, size_t size) {
  if (!require(size))
    return false;
  if (size != 0) {
    std::copy(data_ + pos_, data_ + pos_ + size, out);
  }
  pos_ += size;
  return true;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t size) {
  if (!require(size))
    return {};
  std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + size);
  pos_ += size;
  return out;
}

std::vector<uint8_t> MessageDeserializer::read_var_bytes(size_t max_size) {
  uint64_t len = read_varint();
  if (has_error()) {
    return {};
  }
  if (!check_count(len, 1, max_size)) {
    return {};
  }
  return read_bytes(static_cast<size_t>(len));
}

std::string MessageDeserializer::read_string(size_t max_size) {
  auto bytes = read_var_bytes(max_size);
  return std::string(bytes.begin(), bytes.end());
}

protocol::Hash256 MessageDeserializer::read_hash() {
  protocol::Hash256 hash{};
  read_bytes(hash.data(), hash.size());
  return hash;
}

protocol::NetworkAddress MessageDeserializer::read_network_address() {
  protocol::NetworkAddress addr;
  if (!require(NETWORK_ADDRESS_SIZE)) {
    return addr;
  }
  addr.services = read_uint64();
  read_bytes(addr.ip.data(), addr.ip.size());
  addr.port = endian::ReadBE16(data_ + pos_);
  pos_ += 2;
  return addr;
}

protocol::TimestampedAddress MessageDeserializer::read_timestamped_address() {
  protocol::TimestampedAddress addr;
  addr.timestamp = read_uint32();
  addr.address = read_network_address();
  return addr;
}

protocol::InventoryVector MessageDeserializer::read_inventory() {
  protocol::InventoryVector inv;
  inv.type = static_cast<protocol::InventoryType>(read_uint32());
  inv.hash = read_hash();
  return inv;
}

CBlockHeader MessageDeserializer::read_block_header() {
  CBlockHeader header;
  if (!require(CBlockHeader::HEADER_SIZE)) {
    return header;
  }
  header.Deserialize(data_ + pos_, CBlockHeader::HEADER_SIZE);
  pos_ += CBlockHeader::HEADER_SIZE;
  return header;
}

CTransaction MessageDeserializer::read_transaction() {
  CTransaction tx;
  tx.nVersion = read_int32();

  uint64_t vin_count = read_varint(false);
  if (!check_count(vin_count, MIN_TXIN_SIZE, protocol::MAX_SIZE)) {
    return CTransaction{};
  }
  tx.vin.reserve(static_cast<size_t>(vin_count));
  for (uint64_t i = 0; i < vin_count && !has_error(); ++i) {
    CTxIn in;
    in.prevout.hash = read_hash();
    in.prevout.n = read_uint32();
    in.scriptSig = read_var_bytes();
    in.nSequence = read_uint32();
    tx.vin.push_back(std::move(in));
  }

  uint64_t vout_count = read_varint(false);
  if (!check_count(vout_count, MIN_TXOUT_SIZE, protocol::MAX_SIZE)) {
    return CTransaction{};
  }
  tx.vout.reserve(static_cast<size_t>(vout_count));
  for (uint64_t i = 0; i < vout_count && !has_error(); ++i) {
    CTxOut out;
    out.nValue = read_int64();
    out.scriptPubKey = read_var_bytes();
    tx.vout.push_back(std::move(out));
  }

  tx.nLockTime = read_uint32();
  if (has_error()) {
    return CTransaction{};
  }
  return tx;
}

bool MessageDeserializer::check_count(uint64_t count, size_t min_element_size,
                                      uint64_t limit) {
  if (has_error()) {
    return false;
  }
  if (min_element_size != 0 && count > (size_ - pos_) / min_element_size) {
    set_error(network::WireError::Underflow);
    return false;
  }
  if (count > limit) {
    set_error(network::WireError::LimitExceeded);
    return false;
  }
  return true;
}

} // namespace message
} // namespace peerwire
