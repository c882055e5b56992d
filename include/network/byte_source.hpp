// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_BYTE_SOURCE_HPP
#define PEERWIRE_NETWORK_BYTE_SOURCE_HPP

#include "network/envelope.hpp"
#include "network/wire_error.hpp"
#include "util/logging.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace peerwire {
namespace network {

/**
 * ByteSource - blocking, ordered byte input
 *
 * The message layer only ever asks for an exact number of bytes. How long a
 * read may block, and how it is cancelled, is up to the implementation
 * (closing a socket makes a pending AsioByteSource read return short).
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * Read exactly `size` bytes into `out`, blocking as needed.
   * @return bytes actually read; less than `size` means the source ended
   *         or failed
   */
  virtual size_t read_exact(uint8_t *out, size_t size) = 0;
};

// In-memory source over a borrowed buffer
class BufferByteSource : public ByteSource {
public:
  BufferByteSource(const uint8_t *data, size_t size)
      : data_(data), size_(data != nullptr ? size : 0) {}
  explicit BufferByteSource(const std::vector<uint8_t> &buffer)
      : data_(buffer.data()), size_(buffer.size()) {}

  size_t read_exact(uint8_t *out, size_t size) override;

  size_t position() const { return pos_; }
  size_t remaining() const { return size_ - pos_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
};

// std::istream adapter (files, stdin, string streams)
class IstreamByteSource : public ByteSource {
public:
  explicit IstreamByteSource(std::istream &stream) : stream_(stream) {}

  size_t read_exact(uint8_t *out, size_t size) override;

private:
  std::istream &stream_;
};

/**
 * Boost.Asio adapter for any SyncReadStream (tcp::socket, local sockets,
 * serial ports). Uses boost::asio::read, which loops until the buffer is
 * full or the stream reports an error.
 */
template <typename SyncReadStream> class AsioByteSource : public ByteSource {
public:
  explicit AsioByteSource(SyncReadStream &stream) : stream_(stream) {}

  size_t read_exact(uint8_t *out, size_t size) override {
    if (size == 0) {
      return 0;
    }
    boost::system::error_code ec;
    size_t n = boost::asio::read(stream_, boost::asio::buffer(out, size), ec);
    if (ec && ec != boost::asio::error::eof) {
      LOG_NET_DEBUG("stream read failed after {} of {} bytes: {}", n, size,
                    ec.message());
    }
    last_error_ = ec;
    return n;
  }

  const boost::system::error_code &last_error() const { return last_error_; }

private:
  SyncReadStream &stream_;
  boost::system::error_code last_error_;
};

/**
 * Read exactly one frame from a blocking source.
 *
 * The magic is checked after its 4 bytes arrive, before anything else is
 * read (ProtocolMismatch). The rest of the header is then validated before
 * the payload is allocated. A source that ends cleanly before the first
 * byte of a frame yields StreamClosed; ending anywhere inside a frame yields
 * Underflow.
 */
WireError read_envelope(ByteSource &source, uint32_t expected_magic,
                        message::Envelope &out);

} // namespace network
} // namespace peerwire

#endif // PEERWIRE_NETWORK_BYTE_SOURCE_HPP
