// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/block.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include "util/strencodings.hpp"
#include <algorithm>
#include <sstream>

namespace peerwire {

namespace {
static constexpr size_t kHeaderSize = 4 /*nVersion*/ + 32 /*hashPrevBlock*/ +
                                      32 /*hashMerkleRoot*/ + 4 /*nTime*/ +
                                      4 /*nBits*/ + 4 /*nNonce*/;
static_assert(kHeaderSize == CBlockHeader::HEADER_SIZE,
              "HEADER_SIZE mismatch");
} // namespace

protocol::Hash256 CBlockHeader::GetHash() const {
  const auto s = SerializeFixed();

  // The digest is kept in storage order: byte 0 of the digest is byte 0 of
  // the hash, which is what peers put on the wire in locators and inv items
  return crypto::Sha256d(s.data(), s.size());
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const noexcept {
  HeaderBytes data{};

  endian::WriteLE32(data.data() + OFF_VERSION,
                    static_cast<uint32_t>(nVersion));
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(),
            data.begin() + OFF_PREV);
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(),
            data.begin() + OFF_MERKLE);
  endian::WriteLE32(data.data() + OFF_TIME, nTime);
  endian::WriteLE32(data.data() + OFF_BITS, nBits);
  endian::WriteLE32(data.data() + OFF_NONCE, nNonce);

  return data;
}

std::vector<uint8_t> CBlockHeader::Serialize() const {
  auto arr = SerializeFixed();
  return std::vector<uint8_t>(arr.begin(), arr.end());
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) noexcept {
  if (data == nullptr || size != HEADER_SIZE) {
    return false;
  }

  nVersion = static_cast<int32_t>(endian::ReadLE32(data + OFF_VERSION));
  std::copy(data + OFF_PREV, data + OFF_PREV + protocol::HASH_SIZE,
            hashPrevBlock.begin());
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + protocol::HASH_SIZE,
            hashMerkleRoot.begin());
  nTime = endian::ReadLE32(data + OFF_TIME);
  nBits = endian::ReadLE32(data + OFF_BITS);
  nNonce = endian::ReadLE32(data + OFF_NONCE);

  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(hash=" << util::HashToHex(GetHash())
    << ", ver=" << nVersion
    << ", hashPrevBlock=" << util::HashToHex(hashPrevBlock)
    << ", hashMerkleRoot=" << util::HashToHex(hashMerkleRoot)
    << ", nTime=" << nTime << ", nBits=0x" << std::hex << nBits << std::dec
    << ", nNonce=" << nNonce << ")";
  return s.str();
}

} // namespace peerwire
