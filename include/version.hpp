// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_VERSION_HPP
#define PEERWIRE_VERSION_HPP

#include <string>

namespace peerwire {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The PeerWire developers";

// User agent advertised in VERSION messages
// Format: /PeerWire:1.0.0/
inline std::string GetUserAgent() {
  return "/PeerWire:" + GetVersionString() + "/";
}

// Full version info for display
inline std::string GetFullVersionString() {
  return "PeerWire version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace peerwire

#endif // PEERWIRE_VERSION_HPP
