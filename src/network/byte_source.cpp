// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/byte_source.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace peerwire {
namespace network {

size_t BufferByteSource::read_exact(uint8_t *out, size_t size) {
  const size_t n = std::min(size, size_ - pos_);
  if (n != 0) {
    std::copy(data_ + pos_, data_ + pos_ + n, out);
  }
  pos_ += n;
  return n;
}

size_t IstreamByteSource::read_exact(uint8_t *out, size_t size) {
  if (size == 0) {
    return 0;
  }
  stream_.read(reinterpret_cast<char *>(out),
               static_cast<std::streamsize>(size));
  return static_cast<size_t>(stream_.gcount());
}

WireError read_envelope(ByteSource &source, uint32_t expected_magic,
                        message::Envelope &out) {
  uint8_t header_bytes[protocol::MESSAGE_HEADER_SIZE];

  const size_t got = source.read_exact(header_bytes, protocol::MAGIC_SIZE);
  if (got == 0) {
    return WireError::StreamClosed;
  }
  if (got < protocol::MAGIC_SIZE) {
    LOG_NET_DEBUG("stream ended inside frame magic ({} bytes)", got);
    return WireError::Underflow;
  }

  const uint32_t magic = endian::ReadLE32(header_bytes);
  if (magic != expected_magic) {
    LOG_NET_DEBUG("invalid network magic 0x{:08x} (expected 0x{:08x})", magic,
                  expected_magic);
    return WireError::ProtocolMismatch;
  }

  const size_t rest = protocol::MESSAGE_HEADER_SIZE - protocol::MAGIC_SIZE;
  if (source.read_exact(header_bytes + protocol::MAGIC_SIZE, rest) != rest) {
    LOG_NET_DEBUG("stream ended inside message header");
    return WireError::Underflow;
  }

  protocol::MessageHeader header;
  message::deserialize_header(header_bytes, sizeof(header_bytes), header);

  std::string command;
  WireError err = message::validate_header(header, expected_magic, command);
  if (err != WireError::None) {
    return err;
  }

  std::vector<uint8_t> payload(header.length);
  if (header.length != 0 &&
      source.read_exact(payload.data(), payload.size()) != payload.size()) {
    LOG_NET_DEBUG("stream ended inside {} payload (declared {} bytes)",
                  command, header.length);
    return WireError::Underflow;
  }

  if (message::compute_checksum(payload) != header.checksum) {
    LOG_NET_DEBUG("checksum mismatch for {} ({} bytes)", command,
                  header.length);
    return WireError::ChecksumMismatch;
  }

  out.magic = header.magic;
  out.command = std::move(command);
  out.checksum = header.checksum;
  out.payload = std::move(payload);
  return WireError::None;
}

} // namespace network
} // namespace peerwire
