// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PEERWIRE_PRIMITIVES_BLOCK_HPP
#define PEERWIRE_PRIMITIVES_BLOCK_HPP

#include "network/protocol.hpp"
#include "primitives/transaction.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace peerwire {

/**
 * Block header - 80 bytes on the wire
 *
 * Layout (all integers little-endian):
 *   nVersion        4
 *   hashPrevBlock  32
 *   hashMerkleRoot 32
 *   nTime           4
 *   nBits           4
 *   nNonce          4
 */
class CBlockHeader {
public:
  static constexpr size_t HEADER_SIZE = protocol::BLOCK_HEADER_SIZE;
  using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

  int32_t nVersion;
  protocol::Hash256 hashPrevBlock;
  protocol::Hash256 hashMerkleRoot;
  uint32_t nTime;
  uint32_t nBits;
  uint32_t nNonce;

  CBlockHeader() { SetNull(); }

  void SetNull() noexcept {
    nVersion = 0;
    hashPrevBlock.fill(0);
    hashMerkleRoot.fill(0);
    nTime = 0;
    nBits = 0;
    nNonce = 0;
  }

  bool IsNull() const noexcept { return nBits == 0; }

  // sha256d of the 80 serialized bytes, in storage (little-endian) order
  protocol::Hash256 GetHash() const;

  HeaderBytes SerializeFixed() const noexcept;
  std::vector<uint8_t> Serialize() const;

  // Rejects any size other than HEADER_SIZE
  bool Deserialize(const uint8_t *data, size_t size) noexcept;

  std::string ToString() const;

  bool operator==(const CBlockHeader &other) const {
    return SerializeFixed() == other.SerializeFixed();
  }

private:
  static constexpr size_t OFF_VERSION = 0;
  static constexpr size_t OFF_PREV = 4;
  static constexpr size_t OFF_MERKLE = 36;
  static constexpr size_t OFF_TIME = 68;
  static constexpr size_t OFF_BITS = 72;
  static constexpr size_t OFF_NONCE = 76;
};

// Full block: header plus its transactions
class CBlock : public CBlockHeader {
public:
  std::vector<CTransaction> vtx;

  CBlock() = default;
  explicit CBlock(const CBlockHeader &header) : CBlockHeader(header) {}

  CBlockHeader GetBlockHeader() const { return *this; }
};

} // namespace peerwire

#endif // PEERWIRE_PRIMITIVES_BLOCK_HPP
