// Copyright (c) 2024 Coinbase Chain
// Test suite for network parameters

#include <catch2/catch_test_macros.hpp>
#include "network/network_params.hpp"
#include <stdexcept>

using namespace peerwire::network;
namespace protocol = peerwire::protocol;

TEST_CASE("NetworkParams creation", "[network_params]") {
    SECTION("Create MainNet") {
        auto params = NetworkParams::CreateMainNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetNetworkType() == NetworkType::MAIN);
        REQUIRE(params->GetNetworkTypeString() == "main");
        REQUIRE(params->GetDefaultPort() == 8333);
        REQUIRE(params->GetNetworkMagic() == 0xD9B4BEF9);
        REQUIRE(params->GetProtocolVersion() == 70015);
    }

    SECTION("Create TestNet") {
        auto params = NetworkParams::CreateTestNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetNetworkType() == NetworkType::TESTNET);
        REQUIRE(params->GetNetworkTypeString() == "test");
        REQUIRE(params->GetDefaultPort() == 18333);
        REQUIRE(params->GetNetworkMagic() == 0x0709110B);
    }

    SECTION("Create RegTest") {
        auto params = NetworkParams::CreateRegTest();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetNetworkType() == NetworkType::REGTEST);
        REQUIRE(params->GetNetworkTypeString() == "regtest");
        REQUIRE(params->GetDefaultPort() == 18444);
        REQUIRE(params->GetNetworkMagic() == 0xDAB5BFFA);
    }

    SECTION("Create by type") {
        REQUIRE(NetworkParams::Create(NetworkType::TESTNET)->GetNetworkMagic() ==
                protocol::magic::TESTNET);
    }

    SECTION("Zero hash is all zero") {
        auto params = NetworkParams::CreateMainNet();
        for (uint8_t b : params->GetZeroHash()) {
            REQUIRE(b == 0);
        }
    }
}

TEST_CASE("NetworkParams magic values are distinct", "[network_params]") {
    auto main = NetworkParams::CreateMainNet();
    auto test = NetworkParams::CreateTestNet();
    auto reg = NetworkParams::CreateRegTest();

    REQUIRE(main->GetNetworkMagic() != test->GetNetworkMagic());
    REQUIRE(main->GetNetworkMagic() != reg->GetNetworkMagic());
    REQUIRE(test->GetNetworkMagic() != reg->GetNetworkMagic());
}

TEST_CASE("NetworkParams name parsing", "[network_params]") {
    REQUIRE(NetworkParams::ParseNetworkType("main") == NetworkType::MAIN);
    REQUIRE(NetworkParams::ParseNetworkType("mainnet") == NetworkType::MAIN);
    REQUIRE(NetworkParams::ParseNetworkType("test") == NetworkType::TESTNET);
    REQUIRE(NetworkParams::ParseNetworkType("testnet") == NetworkType::TESTNET);
    REQUIRE(NetworkParams::ParseNetworkType("regtest") == NetworkType::REGTEST);
    REQUIRE_FALSE(NetworkParams::ParseNetworkType("signet").has_value());
    REQUIRE_FALSE(NetworkParams::ParseNetworkType("").has_value());
}

TEST_CASE("GlobalNetworkParams singleton", "[network_params]") {
    SECTION("Select and get params") {
        GlobalNetworkParams::Select(NetworkType::MAIN);
        REQUIRE(GlobalNetworkParams::IsInitialized());

        const auto& params = GlobalNetworkParams::Get();
        REQUIRE(params.GetNetworkType() == NetworkType::MAIN);

        // Switch to regtest
        GlobalNetworkParams::Select(NetworkType::REGTEST);
        const auto& params2 = GlobalNetworkParams::Get();
        REQUIRE(params2.GetNetworkType() == NetworkType::REGTEST);
        REQUIRE(params2.GetNetworkMagic() == protocol::magic::REGTEST);
    }
}
