// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.hpp"
#include "crypto/sha256.hpp"
#include "network/serialize.hpp"
#include "util/strencodings.hpp"
#include <sstream>

namespace peerwire {

protocol::Hash256 CTransaction::GetHash() const {
  message::MessageSerializer s;
  s.write_transaction(*this);
  return crypto::Sha256d(s.data());
}

std::string CTransaction::ToString() const {
  std::stringstream s;
  s << "CTransaction(hash=" << util::HashToHex(GetHash()).substr(0, 10)
    << ", ver=" << nVersion << ", vin.size=" << vin.size()
    << ", vout.size=" << vout.size() << ", nLockTime=" << nLockTime << ")";
  return s.str();
}

} // namespace peerwire
