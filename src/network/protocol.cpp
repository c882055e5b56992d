// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/protocol.hpp"
#include <sstream>

namespace peerwire {
namespace protocol {

// MessageHeader implementation
MessageHeader::MessageHeader() : magic(0), length(0) {
  command.fill(0);
  checksum.fill(0);
}

// NetworkAddress implementation
NetworkAddress::NetworkAddress() : services(0), port(0) { ip.fill(0); }

NetworkAddress::NetworkAddress(uint64_t svcs,
                               const std::array<uint8_t, 16> &addr, uint16_t p)
    : services(svcs), ip(addr), port(p) {}

NetworkAddress NetworkAddress::from_ipv4(uint64_t services, uint32_t ipv4,
                                         uint16_t port) {
  NetworkAddress addr;
  addr.services = services;
  addr.port = port;

  // IPv4-mapped IPv6 address format: ::ffff:x.x.x.x
  addr.ip.fill(0);
  addr.ip[10] = 0xff;
  addr.ip[11] = 0xff;

  // Store IPv4 in big-endian (network byte order)
  addr.ip[12] = (ipv4 >> 24) & 0xff;
  addr.ip[13] = (ipv4 >> 16) & 0xff;
  addr.ip[14] = (ipv4 >> 8) & 0xff;
  addr.ip[15] = ipv4 & 0xff;

  return addr;
}

uint32_t NetworkAddress::get_ipv4() const {
  if (!is_ipv4()) {
    return 0;
  }

  return (static_cast<uint32_t>(ip[12]) << 24) |
         (static_cast<uint32_t>(ip[13]) << 16) |
         (static_cast<uint32_t>(ip[14]) << 8) | static_cast<uint32_t>(ip[15]);
}

bool NetworkAddress::is_ipv4() const {
  // Check for IPv4-mapped IPv6 prefix: ::ffff:x.x.x.x
  for (size_t i = 0; i < 10; ++i) {
    if (ip[i] != 0) {
      return false;
    }
  }
  return ip[10] == 0xff && ip[11] == 0xff;
}

std::string NetworkAddress::ToString() const {
  std::ostringstream s;
  if (is_ipv4()) {
    s << static_cast<int>(ip[12]) << "." << static_cast<int>(ip[13]) << "."
      << static_cast<int>(ip[14]) << "." << static_cast<int>(ip[15]) << ":"
      << port;
    return s.str();
  }

  s << "[" << std::hex;
  for (size_t i = 0; i < ip.size(); i += 2) {
    if (i != 0) {
      s << ":";
    }
    s << ((static_cast<unsigned>(ip[i]) << 8) | ip[i + 1]);
  }
  s << std::dec << "]:" << port;
  return s.str();
}

// TimestampedAddress implementation
TimestampedAddress::TimestampedAddress() : timestamp(0) {}

TimestampedAddress::TimestampedAddress(uint32_t ts, const NetworkAddress &addr)
    : timestamp(ts), address(addr) {}

// InventoryVector implementation
InventoryVector::InventoryVector() : type(InventoryType::ERROR) {
  hash.fill(0);
}

InventoryVector::InventoryVector(InventoryType t, const Hash256 &h)
    : type(t), hash(h) {}

} // namespace protocol
} // namespace peerwire
