// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_CRYPTO_SHA256_HPP
#define PEERWIRE_CRYPTO_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace peerwire {
namespace crypto {

constexpr size_t SHA256_OUTPUT_SIZE = 32;

using Sha256Digest = std::array<uint8_t, SHA256_OUTPUT_SIZE>;

/**
 * Single SHA-256 over a byte range (OpenSSL EVP one-shot digest).
 *
 * Throws std::runtime_error only if the OpenSSL provider itself fails,
 * which never depends on the input bytes.
 */
Sha256Digest Sha256(const uint8_t *data, size_t size);

/**
 * SHA256(SHA256(data)) - the double hash used for message checksums and
 * block header hashes. Output is in digest (big-endian) byte order.
 */
Sha256Digest Sha256d(const uint8_t *data, size_t size);

inline Sha256Digest Sha256d(const std::vector<uint8_t> &data) {
  return Sha256d(data.data(), data.size());
}

} // namespace crypto
} // namespace peerwire

#endif // PEERWIRE_CRYPTO_SHA256_HPP
