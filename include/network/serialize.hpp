// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_SERIALIZE_HPP
#define PEERWIRE_NETWORK_SERIALIZE_HPP

#include "network/protocol.hpp"
#include "network/wire_error.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace peerwire {

class CBlockHeader;
struct CTransaction;

namespace message {

/**
 * VarInt - Bitcoin compact size integer
 *
 *   value <= 0xFC        -> 1 byte
 *   value <= 0xFFFF      -> 0xFD + 2 bytes LE
 *   value <= 0xFFFFFFFF  -> 0xFE + 4 bytes LE
 *   otherwise            -> 0xFF + 8 bytes LE
 *
 * decode() accepts non-minimal encodings (e.g. 5 as 0xFE 05 00 00 00);
 * callers that need canonical form compare consumed against size().
 */
struct VarInt {
  static constexpr size_t MAX_ENCODED_SIZE = 9;

  uint64_t value;

  VarInt() : value(0) {}
  explicit VarInt(uint64_t v) : value(v) {}

  // Number of bytes encode() will write for this value
  size_t size() const;

  // Writes size() bytes to buffer (needs MAX_ENCODED_SIZE capacity)
  size_t encode(uint8_t *buffer) const;

  // Returns bytes consumed, or 0 if `available` is too short for the width
  // the prefix byte selects (value is left untouched in that case)
  size_t decode(const uint8_t *data, size_t available);
};

/**
 * MessageSerializer - append-only little-endian writer for payloads
 */
class MessageSerializer {
public:
  MessageSerializer() = default;

  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_int32(int32_t value);
  void write_uint64(uint64_t value);
  void write_int64(int64_t value);
  void write_bool(bool value);
  void write_varint(uint64_t value);
  void write_bytes(const uint8_t *data, size_t size);
  void write_bytes(const std::vector<uint8_t> &data);

  // varint length prefix followed by the bytes
  void write_var_bytes(const std::vector<uint8_t> &data);
  void write_string(const std::string &str);

  void write_hash(const protocol::Hash256 &hash);
  void write_network_address(const protocol::NetworkAddress &addr);
  void write_timestamped_address(const protocol::TimestampedAddress &addr);
  void write_inventory(const protocol::InventoryVector &inv);
  void write_block_header(const CBlockHeader &header);
  void write_transaction(const CTransaction &tx);

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * MessageDeserializer - bounds-checked sequential reader over a payload
 *
 * The first failure is sticky: it is recorded in error(), every later read
 * returns a zero value and consumes nothing. Callers check has_error() once
 * after a group of reads instead of after every field.
 *
 * The buffer is borrowed and must outlive the deserializer.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &buffer);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  int32_t read_int32();
  uint64_t read_uint64();
  int64_t read_int64();
  bool read_bool();

  // With range_check, values above protocol::MAX_SIZE fail with
  // LimitExceeded (counts and lengths are never that large). Element
  // counts are read without it and bounded by check_count instead.
  uint64_t read_varint(bool range_check = true);

  bool read_bytes(uint8_t *out, size_t size);
  std::vector<uint8_t> read_bytes(size_t size);

  // varint length prefix followed by the bytes; length above max_size
  // fails with LimitExceeded
  std::vector<uint8_t> read_var_bytes(size_t max_size = protocol::MAX_SIZE);
  std::string read_string(size_t max_size = protocol::MAX_SIZE);

  protocol::Hash256 read_hash();
  protocol::NetworkAddress read_network_address();
  protocol::TimestampedAddress read_timestamped_address();
  protocol::InventoryVector read_inventory();
  CBlockHeader read_block_header();
  CTransaction read_transaction();

  /**
   * Validate a declared element count before allocating for it.
   * Fails with Underflow if the remaining bytes cannot hold `count`
   * elements of at least `min_element_size` bytes each, then with
   * LimitExceeded if count is above `limit`.
   */
  bool check_count(uint64_t count, size_t min_element_size, uint64_t limit);

  bool has_error() const { return error_ != network::WireError::None; }
  network::WireError error() const { return error_; }
  void set_error(network::WireError err);

  size_t bytes_remaining() const { return has_error() ? 0 : size_ - pos_; }
  size_t position() const { return pos_; }

private:
  bool require(size_t size);

  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
  network::WireError error_{network::WireError::None};
};

} // namespace message
} // namespace peerwire

#endif // PEERWIRE_NETWORK_SERIALIZE_HPP
