// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/network_params.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace peerwire {
namespace network {

// Static instance
std::unique_ptr<NetworkParams> GlobalNetworkParams::instance = nullptr;

std::string NetworkParams::GetNetworkTypeString() const {
  switch (networkType) {
  case NetworkType::MAIN:
    return "main";
  case NetworkType::TESTNET:
    return "test";
  case NetworkType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::unique_ptr<NetworkParams> NetworkParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::Create(NetworkType type) {
  switch (type) {
  case NetworkType::MAIN:
    return CreateMainNet();
  case NetworkType::TESTNET:
    return CreateTestNet();
  case NetworkType::REGTEST:
    return CreateRegTest();
  }
  throw std::invalid_argument("unknown network type");
}

std::optional<NetworkType>
NetworkParams::ParseNetworkType(const std::string &name) {
  if (name == "main" || name == "mainnet") {
    return NetworkType::MAIN;
  }
  if (name == "test" || name == "testnet") {
    return NetworkType::TESTNET;
  }
  if (name == "regtest") {
    return NetworkType::REGTEST;
  }
  return std::nullopt;
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  networkType = NetworkType::MAIN;
  nMagic = protocol::magic::MAINNET;
  nDefaultPort = protocol::ports::MAINNET;
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  networkType = NetworkType::TESTNET;
  nMagic = protocol::magic::TESTNET;
  nDefaultPort = protocol::ports::TESTNET;
}

// ============================================================================
// RegTest Parameters
// ============================================================================

CRegTestParams::CRegTestParams() {
  networkType = NetworkType::REGTEST;
  nMagic = protocol::magic::REGTEST;
  nDefaultPort = protocol::ports::REGTEST;
}

// ============================================================================
// Global singleton
// ============================================================================

void GlobalNetworkParams::Select(NetworkType type) {
  instance = NetworkParams::Create(type);
  LOG_INFO("Selected network: {} (magic 0x{:08x})",
           instance->GetNetworkTypeString(), instance->GetNetworkMagic());
}

const NetworkParams &GlobalNetworkParams::Get() {
  if (!instance) {
    throw std::logic_error(
        "GlobalNetworkParams::Get() called before Select()");
  }
  return *instance;
}

bool GlobalNetworkParams::IsInitialized() { return instance != nullptr; }

} // namespace network
} // namespace peerwire
