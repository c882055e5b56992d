// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for the 12-byte command field

#include <catch2/catch_test_macros.hpp>
#include "network/envelope.hpp"
#include <algorithm>
#include <string>

using namespace peerwire;
using namespace peerwire::message;
using network::WireError;

TEST_CASE("Command codec - Encoding", "[command][unit]") {
    SECTION("Left-justified and zero-filled") {
        CommandField field;
        field.fill(0xEE);
        REQUIRE(encode_command("getheaders", field) == WireError::None);
        REQUIRE(std::string(field.begin(), field.begin() + 10) == "getheaders");
        REQUIRE(field[10] == 0);
        REQUIRE(field[11] == 0);
    }

    SECTION("Exactly 12 bytes uses the whole field") {
        CommandField field{};
        REQUIRE(encode_command("abcdefghijkl", field) == WireError::None);
        REQUIRE(field[11] == 'l');
    }

    SECTION("Single character") {
        CommandField field{};
        REQUIRE(encode_command("x", field) == WireError::None);
        REQUIRE(field[0] == 'x');
        REQUIRE(field[1] == 0);
    }

    SECTION("Rejected names") {
        CommandField field{};
        REQUIRE(encode_command("", field) == WireError::InvalidCommand);
        REQUIRE(encode_command("abcdefghijklm", field) == WireError::InvalidCommand);
        REQUIRE(encode_command(std::string("ab\0c", 4), field) == WireError::InvalidCommand);
        REQUIRE(encode_command("caf\xC3\xA9", field) == WireError::InvalidCommand);
        REQUIRE(encode_command("tab\t", field) == WireError::InvalidCommand);
    }
}

TEST_CASE("Command codec - Decoding", "[command][unit]") {
    SECTION("Trailing zeros are stripped") {
        CommandField field{};
        encode_command("verack", field);
        std::string out;
        REQUIRE(decode_command(field, out) == WireError::None);
        REQUIRE(out == "verack");
    }

    SECTION("Full-width command") {
        CommandField field;
        const std::string name = "sendheaders1";
        std::copy(name.begin(), name.end(), field.begin());
        std::string out;
        REQUIRE(decode_command(field, out) == WireError::None);
        REQUIRE(out == name);
    }

    SECTION("All zero field is invalid") {
        CommandField field{};
        std::string out = "unchanged";
        REQUIRE(decode_command(field, out) == WireError::InvalidCommand);
        REQUIRE(out == "unchanged");
    }

    SECTION("Embedded NUL before the last non-zero byte") {
        CommandField field{};
        field[0] = 'p';
        field[1] = 0;
        field[2] = 'x';
        std::string out;
        REQUIRE(decode_command(field, out) == WireError::InvalidCommand);
    }

    SECTION("Non-printable byte") {
        CommandField field{};
        field[0] = 'p';
        field[1] = 0x80;
        std::string out;
        REQUIRE(decode_command(field, out) == WireError::InvalidCommand);
    }
}

TEST_CASE("Command codec - Every registered command name encodes", "[command][unit]") {
    const char* names[] = {
        protocol::commands::VERSION, protocol::commands::VERACK,
        protocol::commands::ADDR, protocol::commands::GETADDR,
        protocol::commands::INV, protocol::commands::GETDATA,
        protocol::commands::NOTFOUND, protocol::commands::GETBLOCKS,
        protocol::commands::GETHEADERS, protocol::commands::HEADERS,
        protocol::commands::SENDHEADERS, protocol::commands::BLOCK,
        protocol::commands::MERKLEBLOCK, protocol::commands::TX,
        protocol::commands::FILTERLOAD, protocol::commands::PING,
        protocol::commands::PONG,
    };

    for (const char* name : names) {
        CommandField field{};
        REQUIRE(encode_command(name, field) == WireError::None);
        std::string out;
        REQUIRE(decode_command(field, out) == WireError::None);
        REQUIRE(out == name);
    }
}
