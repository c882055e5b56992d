// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include "util/logging.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace peerwire {
namespace crypto {

Sha256Digest Sha256(const uint8_t *data, size_t size) {
  Sha256Digest out{};
  unsigned int out_len = 0;

  // EVP_Digest rejects a null pointer even for zero-length input
  static const uint8_t empty = 0;
  const uint8_t *input = data != nullptr ? data : &empty;

  if (EVP_Digest(input, size, out.data(), &out_len, EVP_sha256(), nullptr) !=
          1 ||
      out_len != SHA256_OUTPUT_SIZE) {
    LOG_CRYPTO_ERROR("EVP_Digest(sha256) failed for {} byte input", size);
    throw std::runtime_error("sha256 digest failed");
  }
  return out;
}

Sha256Digest Sha256d(const uint8_t *data, size_t size) {
  // Separate digests; the intermediate never leaves this function
  const Sha256Digest first = Sha256(data, size);
  return Sha256(first.data(), first.size());
}

} // namespace crypto
} // namespace peerwire
