// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_NETWORK_PARAMS_HPP
#define PEERWIRE_NETWORK_NETWORK_PARAMS_HPP

#include "network/protocol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace peerwire {
namespace network {

/**
 * Network type enumeration
 */
enum class NetworkType {
  MAIN,    // Production mainnet
  TESTNET, // Public test network
  REGTEST  // Regression test (local testing)
};

/**
 * NetworkParams - per-network wire parameters
 *
 * Everything the message layer needs to know about which network it is
 * speaking: the frame magic, the protocol version advertised in outbound
 * messages, and the zero-hash constant used as the "no limit" hash_stop.
 */
class NetworkParams {
public:
  NetworkParams() = default;
  virtual ~NetworkParams() = default;

  uint32_t GetNetworkMagic() const { return nMagic; }
  uint16_t GetDefaultPort() const { return nDefaultPort; }
  uint32_t GetProtocolVersion() const { return nProtocolVersion; }
  const protocol::Hash256 &GetZeroHash() const { return zeroHash; }
  NetworkType GetNetworkType() const { return networkType; }
  std::string GetNetworkTypeString() const;

  // Factory methods
  static std::unique_ptr<NetworkParams> CreateMainNet();
  static std::unique_ptr<NetworkParams> CreateTestNet();
  static std::unique_ptr<NetworkParams> CreateRegTest();
  static std::unique_ptr<NetworkParams> Create(NetworkType type);

  // "main", "test" or "regtest"
  static std::optional<NetworkType> ParseNetworkType(const std::string &name);

protected:
  uint32_t nMagic{0};
  uint16_t nDefaultPort{};
  uint32_t nProtocolVersion{protocol::PROTOCOL_VERSION};
  protocol::Hash256 zeroHash{};
  NetworkType networkType{NetworkType::MAIN};
};

/**
 * MainNet parameters
 */
class CMainParams : public NetworkParams {
public:
  CMainParams();
};

/**
 * TestNet parameters
 */
class CTestNetParams : public NetworkParams {
public:
  CTestNetParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public NetworkParams {
public:
  CRegTestParams();
};

/**
 * Global network params singleton
 *
 * Select() is meant to run once during startup, before any decoding
 * starts; Get() is read-only afterwards. Get() throws std::logic_error if
 * nothing was selected.
 */
class GlobalNetworkParams {
public:
  static void Select(NetworkType type);
  static const NetworkParams &Get();
  static bool IsInitialized();

private:
  static std::unique_ptr<NetworkParams> instance;
};

} // namespace network
} // namespace peerwire

#endif // PEERWIRE_NETWORK_NETWORK_PARAMS_HPP
