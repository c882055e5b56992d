// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/envelope.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace peerwire {
namespace message {

using network::WireError;

namespace {

bool IsPrintableAscii(uint8_t c) { return c >= 0x20 && c <= 0x7e; }

} // namespace

Checksum compute_checksum(const uint8_t *data, size_t size) {
  const auto hash = crypto::Sha256d(data, size);
  Checksum checksum;
  std::copy(hash.begin(), hash.begin() + protocol::CHECKSUM_SIZE,
            checksum.begin());
  return checksum;
}

Checksum compute_checksum(const std::vector<uint8_t> &payload) {
  return compute_checksum(payload.data(), payload.size());
}

WireError encode_command(const std::string &name, CommandField &out) {
  if (name.empty() || name.size() > protocol::COMMAND_SIZE) {
    return WireError::InvalidCommand;
  }
  for (char c : name) {
    if (!IsPrintableAscii(static_cast<uint8_t>(c))) {
      return WireError::InvalidCommand;
    }
  }

  out.fill(0);
  std::copy(name.begin(), name.end(), out.begin());
  return WireError::None;
}

WireError decode_command(const CommandField &field, std::string &out) {
  // Scan from the end for the last non-zero byte
  size_t end = field.size();
  while (end > 0 && field[end - 1] == 0) {
    --end;
  }
  if (end == 0) {
    return WireError::InvalidCommand;
  }

  for (size_t i = 0; i < end; ++i) {
    if (!IsPrintableAscii(field[i])) {
      return WireError::InvalidCommand;
    }
  }

  out.assign(field.begin(), field.begin() + end);
  return WireError::None;
}

WireError create_header(uint32_t magic, const std::string &command,
                        const std::vector<uint8_t> &payload,
                        protocol::MessageHeader &out) {
  if (payload.size() > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    return WireError::PayloadTooLarge;
  }

  protocol::MessageHeader header;
  WireError err = encode_command(command, header.command);
  if (err != WireError::None) {
    return err;
  }
  header.magic = magic;
  header.length = static_cast<uint32_t>(payload.size());
  header.checksum = compute_checksum(payload);

  out = header;
  return WireError::None;
}

std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header) {
  std::vector<uint8_t> out(protocol::MESSAGE_HEADER_SIZE);
  uint8_t *p = out.data();

  endian::WriteLE32(p, header.magic);
  p += protocol::MAGIC_SIZE;
  std::copy(header.command.begin(), header.command.end(), p);
  p += protocol::COMMAND_SIZE;
  endian::WriteLE32(p, header.length);
  p += protocol::LENGTH_SIZE;
  std::copy(header.checksum.begin(), header.checksum.end(), p);

  return out;
}

bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header) {
  if (data == nullptr || size < protocol::MESSAGE_HEADER_SIZE) {
    return false;
  }

  header.magic = endian::ReadLE32(data);
  data += protocol::MAGIC_SIZE;
  std::copy(data, data + protocol::COMMAND_SIZE, header.command.begin());
  data += protocol::COMMAND_SIZE;
  header.length = endian::ReadLE32(data);
  data += protocol::LENGTH_SIZE;
  std::copy(data, data + protocol::CHECKSUM_SIZE, header.checksum.begin());

  return true;
}

WireError validate_header(const protocol::MessageHeader &header,
                          uint32_t expected_magic, std::string &command) {
  if (header.magic != expected_magic) {
    LOG_NET_DEBUG("invalid network magic 0x{:08x} (expected 0x{:08x})",
                  header.magic, expected_magic);
    return WireError::ProtocolMismatch;
  }

  WireError err = decode_command(header.command, command);
  if (err != WireError::None) {
    LOG_NET_DEBUG("invalid command field in message header");
    return err;
  }

  if (header.length > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    LOG_NET_DEBUG("message too large: {} bytes (max: {}) command={}",
                  header.length, protocol::MAX_PROTOCOL_MESSAGE_LENGTH,
                  command);
    return WireError::PayloadTooLarge;
  }

  return WireError::None;
}

WireError encode_envelope(uint32_t magic, const std::string &command,
                          const std::vector<uint8_t> &payload,
                          std::vector<uint8_t> &out) {
  protocol::MessageHeader header;
  WireError err = create_header(magic, command, payload, header);
  if (err != WireError::None) {
    LOG_NET_DEBUG("cannot frame '{}' ({} byte payload): {}", command,
                  payload.size(), network::WireErrorString(err));
    return err;
  }

  std::vector<uint8_t> frame = serialize_header(header);
  frame.reserve(frame.size() + payload.size());
  frame.insert(frame.end(), payload.begin(), payload.end());

  out = std::move(frame);
  return WireError::None;
}

WireError decode_envelope(MessageDeserializer &in, uint32_t expected_magic,
                          Envelope &out) {
  const uint32_t magic = in.read_uint32();
  if (in.has_error()) {
    return in.error();
  }
  if (magic != expected_magic) {
    LOG_NET_DEBUG("invalid network magic 0x{:08x} (expected 0x{:08x})",
                  magic, expected_magic);
    in.set_error(WireError::ProtocolMismatch);
    return in.error();
  }

  CommandField field{};
  if (!in.read_bytes(field.data(), field.size())) {
    return in.error();
  }
  std::string command;
  WireError err = decode_command(field, command);
  if (err != WireError::None) {
    LOG_NET_DEBUG("invalid command field in message header");
    in.set_error(err);
    return err;
  }

  const uint32_t length = in.read_uint32();
  if (in.has_error()) {
    return in.error();
  }
  if (length > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    LOG_NET_DEBUG("message too large: {} bytes (max: {}) command={}", length,
                  protocol::MAX_PROTOCOL_MESSAGE_LENGTH, command);
    in.set_error(WireError::PayloadTooLarge);
    return in.error();
  }

  Checksum expected{};
  in.read_bytes(expected.data(), expected.size());
  std::vector<uint8_t> payload = in.read_bytes(length);
  if (in.has_error()) {
    LOG_NET_DEBUG("truncated frame for {}: declared {} payload bytes", command,
                  length);
    return in.error();
  }

  if (compute_checksum(payload) != expected) {
    LOG_NET_DEBUG("checksum mismatch for {} ({} bytes)", command, length);
    in.set_error(WireError::ChecksumMismatch);
    return in.error();
  }

  out.magic = magic;
  out.command = std::move(command);
  out.checksum = expected;
  out.payload = std::move(payload);
  return WireError::None;
}

WireError decode_envelope(const uint8_t *data, size_t size,
                          uint32_t expected_magic, Envelope &out,
                          size_t *consumed) {
  MessageDeserializer in(data, size);
  WireError err = decode_envelope(in, expected_magic, out);
  if (consumed != nullptr) {
    *consumed = in.position();
  }
  return err;
}

// ============================================================================
// FrameBuffer
// ============================================================================

FrameBuffer::FrameBuffer(uint32_t expected_magic) : magic_(expected_magic) {}

void FrameBuffer::append(const uint8_t *data, size_t size) {
  if (data == nullptr || size == 0) {
    return;
  }
  buffer_.insert(buffer_.end(), data, data + size);
}

void FrameBuffer::append(const std::vector<uint8_t> &data) {
  append(data.data(), data.size());
}

WireError FrameBuffer::next(Envelope &out, bool &complete) {
  complete = false;
  if (error_ != WireError::None) {
    return error_;
  }

  const size_t available = buffered();
  const uint8_t *read_ptr = buffer_.data() + offset_;

  // Reject a foreign network as soon as its magic is visible
  if (available >= protocol::MAGIC_SIZE &&
      endian::ReadLE32(read_ptr) != magic_) {
    LOG_NET_DEBUG("invalid network magic 0x{:08x} (expected 0x{:08x})",
                  endian::ReadLE32(read_ptr), magic_);
    error_ = WireError::ProtocolMismatch;
    return error_;
  }

  if (available < protocol::MESSAGE_HEADER_SIZE) {
    return WireError::None;
  }

  protocol::MessageHeader header;
  deserialize_header(read_ptr, protocol::MESSAGE_HEADER_SIZE, header);

  std::string command;
  WireError err = validate_header(header, magic_, command);
  if (err != WireError::None) {
    error_ = err;
    return error_;
  }

  const size_t total_message_size =
      protocol::MESSAGE_HEADER_SIZE + static_cast<size_t>(header.length);
  if (available < total_message_size) {
    return WireError::None;
  }

  const uint8_t *payload_ptr = read_ptr + protocol::MESSAGE_HEADER_SIZE;
  std::vector<uint8_t> payload(payload_ptr, payload_ptr + header.length);

  if (compute_checksum(payload) != header.checksum) {
    LOG_NET_DEBUG("checksum mismatch for {} ({} bytes)", command,
                  header.length);
    error_ = WireError::ChecksumMismatch;
    return error_;
  }

  out.magic = header.magic;
  out.command = std::move(command);
  out.checksum = header.checksum;
  out.payload = std::move(payload);

  offset_ += total_message_size;
  compact();
  complete = true;
  return WireError::None;
}

void FrameBuffer::compact() {
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  } else if (offset_ > buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(),
                  buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
  }
}

} // namespace message
} // namespace peerwire
