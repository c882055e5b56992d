// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PEERWIRE_PRIMITIVES_TRANSACTION_HPP
#define PEERWIRE_PRIMITIVES_TRANSACTION_HPP

#include "network/protocol.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace peerwire {

// Reference to one output of a previous transaction
struct COutPoint {
  protocol::Hash256 hash;
  uint32_t n;

  COutPoint() : n(0xffffffff) { hash.fill(0); }
  COutPoint(const protocol::Hash256 &h, uint32_t index) : hash(h), n(index) {}

  bool operator==(const COutPoint &other) const {
    return hash == other.hash && n == other.n;
  }
};

struct CTxIn {
  COutPoint prevout;
  std::vector<uint8_t> scriptSig;
  uint32_t nSequence{0xffffffff};

  bool operator==(const CTxIn &other) const {
    return prevout == other.prevout && scriptSig == other.scriptSig &&
           nSequence == other.nSequence;
  }
};

struct CTxOut {
  int64_t nValue{-1};
  std::vector<uint8_t> scriptPubKey;

  bool operator==(const CTxOut &other) const {
    return nValue == other.nValue && scriptPubKey == other.scriptPubKey;
  }
};

/**
 * Transaction in the legacy (non-witness) serialization:
 *   nVersion (4) | vin (varint count + inputs) | vout (varint count +
 *   outputs) | nLockTime (4)
 */
struct CTransaction {
  int32_t nVersion{1};
  std::vector<CTxIn> vin;
  std::vector<CTxOut> vout;
  uint32_t nLockTime{0};

  // sha256d of the serialized transaction (txid), storage order
  protocol::Hash256 GetHash() const;

  std::string ToString() const;

  bool operator==(const CTransaction &other) const {
    return nVersion == other.nVersion && vin == other.vin &&
           vout == other.vout && nLockTime == other.nLockTime;
  }
};

} // namespace peerwire

#endif // PEERWIRE_PRIMITIVES_TRANSACTION_HPP
