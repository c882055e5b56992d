// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_UTIL_STRENCODINGS_HPP
#define PEERWIRE_UTIL_STRENCODINGS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerwire {
namespace util {

// Lowercase hex of a byte range, in memory order
std::string HexStr(const uint8_t *data, size_t size);
std::string HexStr(const std::vector<uint8_t> &data);

// Hex of a 32-byte hash in display order (byte-reversed, like block explorers)
std::string HashToHex(const std::array<uint8_t, 32> &hash);

// Parse hex (even length, optional 0x prefix). Returns nullopt on bad input.
std::optional<std::vector<uint8_t>> ParseHex(const std::string &str);

// Parse a hex number (optional 0x prefix, no sign). Values that do not fit
// in 32 bits are rejected rather than truncated.
std::optional<uint32_t> ParseUInt32Hex(const std::string &str);

// Parse a display-order hash hex string (64 digits) back into storage order
std::optional<std::array<uint8_t, 32>> ParseHashHex(const std::string &str);

} // namespace util
} // namespace peerwire

#endif // PEERWIRE_UTIL_STRENCODINGS_HPP
