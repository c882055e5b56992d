// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for SHA-256 and the frame checksum

#include <catch2/catch_test_macros.hpp>
#include "crypto/sha256.hpp"
#include "network/envelope.hpp"
#include "util/strencodings.hpp"
#include <string>
#include <vector>

using namespace peerwire;

TEST_CASE("Sha256 - Known vectors", "[crypto][unit]") {
    SECTION("Empty input") {
        auto digest = crypto::Sha256(nullptr, 0);
        REQUIRE(util::HexStr(digest.data(), digest.size()) ==
                "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("abc") {
        const std::string abc = "abc";
        auto digest = crypto::Sha256(reinterpret_cast<const uint8_t*>(abc.data()), abc.size());
        REQUIRE(util::HexStr(digest.data(), digest.size()) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
}

TEST_CASE("Sha256d - Double hash of empty input", "[crypto][unit]") {
    auto digest = crypto::Sha256d(std::vector<uint8_t>{});
    REQUIRE(util::HexStr(digest.data(), digest.size()) ==
            "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

TEST_CASE("Checksum - First four bytes of sha256d", "[checksum][unit]") {
    SECTION("Empty payload") {
        auto checksum = message::compute_checksum(std::vector<uint8_t>{});
        REQUIRE(checksum == message::Checksum{0x5D, 0xF6, 0xE0, 0xE2});
    }

    SECTION("Matches the digest prefix for arbitrary data") {
        std::vector<uint8_t> payload{0x61, 0x62, 0x63, 0x00, 0xFF};
        auto digest = crypto::Sha256d(payload);
        auto checksum = message::compute_checksum(payload);
        for (size_t i = 0; i < checksum.size(); ++i) {
            REQUIRE(checksum[i] == digest[i]);
        }
    }

    SECTION("Pointer and vector forms agree") {
        std::vector<uint8_t> payload(1000, 0x5A);
        REQUIRE(message::compute_checksum(payload.data(), payload.size()) ==
                message::compute_checksum(payload));
    }

    SECTION("Single bit change alters the checksum") {
        std::vector<uint8_t> a(32, 0x00);
        std::vector<uint8_t> b = a;
        b[31] ^= 0x01;
        REQUIRE(message::compute_checksum(a) != message::compute_checksum(b));
    }
}
