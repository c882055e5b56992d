// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/strencodings.hpp"
#include <algorithm>

namespace peerwire {
namespace util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string HexStr(const uint8_t *data, size_t size) {
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kHexDigits[data[i] >> 4]);
    out.push_back(kHexDigits[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  return HexStr(data.data(), data.size());
}

std::string HashToHex(const std::array<uint8_t, 32> &hash) {
  std::array<uint8_t, 32> reversed;
  std::reverse_copy(hash.begin(), hash.end(), reversed.begin());
  return HexStr(reversed.data(), reversed.size());
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string &str) {
  size_t start = 0;
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    start = 2;
  }
  if ((str.size() - start) % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve((str.size() - start) / 2);
  for (size_t i = start; i < str.size(); i += 2) {
    int hi = HexDigitValue(str[i]);
    int lo = HexDigitValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::optional<uint32_t> ParseUInt32Hex(const std::string &str) {
  size_t start = 0;
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    start = 2;
  }
  if (start == str.size()) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (size_t i = start; i < str.size(); ++i) {
    int digit = HexDigitValue(str[i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<uint64_t>(digit);
    if (value > 0xFFFFFFFFULL) {
      return std::nullopt;
    }
  }
  return static_cast<uint32_t>(value);
}

std::optional<std::array<uint8_t, 32>> ParseHashHex(const std::string &str) {
  auto bytes = ParseHex(str);
  if (!bytes || bytes->size() != 32) {
    return std::nullopt;
  }
  std::array<uint8_t, 32> hash;
  std::reverse_copy(bytes->begin(), bytes->end(), hash.begin());
  return hash;
}

} // namespace util
} // namespace peerwire
