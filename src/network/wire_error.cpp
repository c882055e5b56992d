// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/wire_error.hpp"

namespace peerwire {
namespace network {

const char *WireErrorString(WireError err) {
  switch (err) {
  case WireError::None:
    return "none";
  case WireError::ProtocolMismatch:
    return "protocol-mismatch";
  case WireError::ChecksumMismatch:
    return "checksum-mismatch";
  case WireError::InvalidCommand:
    return "invalid-command";
  case WireError::Underflow:
    return "underflow";
  case WireError::PayloadTooLarge:
    return "payload-too-large";
  case WireError::LimitExceeded:
    return "limit-exceeded";
  case WireError::Malformed:
    return "malformed";
  case WireError::StreamClosed:
    return "stream-closed";
  }
  return "unknown";
}

} // namespace network
} // namespace peerwire
