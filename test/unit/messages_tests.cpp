// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for the standard message payload codecs

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/protocol.hpp"
#include <vector>

using namespace peerwire;
using namespace peerwire::message;
using network::WireError;

namespace {

protocol::Hash256 filled(uint8_t b) {
    protocol::Hash256 h;
    h.fill(b);
    return h;
}

CBlockHeader make_header(uint32_t nonce) {
    CBlockHeader header;
    header.nVersion = 0x20000000;
    header.hashPrevBlock = filled(0x01);
    header.hashMerkleRoot = filled(0x02);
    header.nTime = 1700000000;
    header.nBits = 0x1d00ffff;
    header.nNonce = nonce;
    return header;
}

CTransaction make_tx() {
    CTransaction tx;
    CTxIn in;
    in.prevout = COutPoint(filled(0x33), 0);
    in.scriptSig = {0x04, 0xFF, 0xFF, 0x00, 0x1D};
    tx.vin.push_back(in);
    CTxOut out;
    out.nValue = 50LL * 100000000;
    out.scriptPubKey = {0x41, 0x04, 0x67};
    tx.vout.push_back(out);
    return tx;
}

} // namespace

TEST_CASE("VersionMessage - Round trip", "[messages][version][unit]") {
    VersionMessage msg;
    msg.version = protocol::PROTOCOL_VERSION;
    msg.services = protocol::NODE_NETWORK;
    msg.timestamp = 1700000000;
    msg.addr_recv = protocol::NetworkAddress::from_ipv4(protocol::NODE_NETWORK, 0x7F000001, 8333);
    msg.addr_from = protocol::NetworkAddress::from_ipv4(protocol::NODE_NONE, 0x0A000002, 18444);
    msg.nonce = 0x0123456789ABCDEFULL;
    msg.user_agent = protocol::GetUserAgent();
    msg.start_height = 820000;
    msg.relay = false;

    auto payload = msg.serialize();
    // 4 + 8 + 8 + 26 + 26 + 8 + (1 + ua) + 4 + 1
    REQUIRE(payload.size() == 86 + msg.user_agent.size());

    VersionMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.version == msg.version);
    REQUIRE(decoded.services == msg.services);
    REQUIRE(decoded.timestamp == msg.timestamp);
    REQUIRE(decoded.addr_recv == msg.addr_recv);
    REQUIRE(decoded.addr_from == msg.addr_from);
    REQUIRE(decoded.nonce == msg.nonce);
    REQUIRE(decoded.user_agent == msg.user_agent);
    REQUIRE(decoded.start_height == msg.start_height);
    REQUIRE_FALSE(decoded.relay);
}

TEST_CASE("VersionMessage - Relay flag is optional", "[messages][version][unit]") {
    VersionMessage msg;
    msg.version = 60000;
    msg.relay = false;
    auto payload = msg.serialize();
    payload.pop_back();

    VersionMessage decoded;
    decoded.relay = false;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.relay);
    REQUIRE(decoded.version == 60000);
}

TEST_CASE("VersionMessage - Relay flag follows the bytes, not the version", "[messages][version][unit]") {
    // An old version number with the flag present still decodes the flag
    VersionMessage msg;
    msg.version = 31800;
    msg.relay = false;
    auto payload = msg.serialize();

    VersionMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.version == 31800);
    REQUIRE_FALSE(decoded.relay);

    // Encoding always writes the flag
    VersionMessage current;
    current.version = protocol::PROTOCOL_VERSION;
    REQUIRE(current.serialize().size() == payload.size());
    REQUIRE(current.serialize().back() == 0x01);
}

TEST_CASE("VersionMessage - Truncated before start height", "[messages][version][unit]") {
    VersionMessage msg;
    msg.version = protocol::PROTOCOL_VERSION;
    auto payload = msg.serialize();
    payload.resize(payload.size() - 3);

    VersionMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::Underflow);
    REQUIRE(decoded.version == 0);
}

TEST_CASE("Empty messages", "[messages][unit]") {
    VerackMessage verack;
    GetAddrMessage getaddr;
    SendHeadersMessage sendheaders;

    REQUIRE(verack.command() == "verack");
    REQUIRE(getaddr.command() == "getaddr");
    REQUIRE(sendheaders.command() == "sendheaders");
    REQUIRE(verack.serialize().empty());
    REQUIRE(verack.deserialize(std::vector<uint8_t>{}) == WireError::None);
    REQUIRE(verack.ToString() == "verack()");

    // Extra bytes are tolerated
    REQUIRE(sendheaders.deserialize(std::vector<uint8_t>{0x01}) == WireError::None);
}

TEST_CASE("Ping and pong", "[messages][unit]") {
    PingMessage ping(0x1122334455667788ULL);
    auto payload = ping.serialize();
    REQUIRE(payload == std::vector<uint8_t>{0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11});

    PongMessage pong;
    REQUIRE(pong.deserialize(payload) == WireError::None);
    REQUIRE(pong.nonce == ping.nonce);
    REQUIRE(pong.ToString() == "pong(nonce=1234605616436508552)");

    PingMessage short_ping(5);
    REQUIRE(short_ping.deserialize(std::vector<uint8_t>(7, 0)) == WireError::Underflow);
    REQUIRE(short_ping.nonce == 5);
}

TEST_CASE("AddrMessage - Round trip", "[messages][addr][unit]") {
    AddrMessage msg;
    for (uint32_t i = 0; i < 3; ++i) {
        msg.addresses.emplace_back(1700000000 + i, protocol::NetworkAddress::from_ipv4(
                                                       protocol::NODE_NETWORK, 0xC0A80001 + i, 8333));
    }

    auto payload = msg.serialize();
    REQUIRE(payload.size() == 1 + 3 * 30);

    AddrMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.addresses == msg.addresses);
    REQUIRE(decoded.addresses[2].address.ToString() == "192.168.0.3:8333");
}

TEST_CASE("Inventory messages", "[messages][inv][unit]") {
    InvMessage inv;
    inv.inventory.emplace_back(protocol::InventoryType::MSG_BLOCK, filled(0x01));
    inv.inventory.emplace_back(protocol::InventoryType::MSG_TX, filled(0x02));

    auto payload = inv.serialize();
    REQUIRE(payload.size() == 1 + 2 * 36);
    REQUIRE(payload[1] == 0x02);  // MSG_BLOCK

    SECTION("inv") {
        InvMessage decoded;
        REQUIRE(decoded.deserialize(payload) == WireError::None);
        REQUIRE(decoded.inventory == inv.inventory);
    }

    SECTION("getdata and notfound share the layout") {
        GetDataMessage getdata;
        NotFoundMessage notfound;
        REQUIRE(getdata.deserialize(payload) == WireError::None);
        REQUIRE(notfound.deserialize(payload) == WireError::None);
        REQUIRE(getdata.inventory == inv.inventory);
        REQUIRE(getdata.command() == "getdata");
        REQUIRE(notfound.command() == "notfound");
    }
}

TEST_CASE("HeadersMessage - Round trip", "[messages][headers][unit]") {
    HeadersMessage msg;
    msg.headers.push_back(make_header(1));
    msg.headers.push_back(make_header(2));

    auto payload = msg.serialize();
    REQUIRE(payload.size() == 1 + 2 * 81);
    REQUIRE(payload[81] == 0x00);  // tx count after the first header

    HeadersMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.headers.size() == 2);
    REQUIRE(decoded.headers[0] == msg.headers[0]);
    REQUIRE(decoded.headers[1].nNonce == 2);
}

TEST_CASE("HeadersMessage - Limit", "[messages][headers][unit]") {
    HeadersMessage msg;
    msg.headers.assign(protocol::MAX_HEADERS_SIZE + 1, make_header(0));

    HeadersMessage decoded;
    REQUIRE(decoded.deserialize(msg.serialize()) == WireError::LimitExceeded);
}

TEST_CASE("BlockMessage - Round trip", "[messages][block][unit]") {
    BlockMessage msg;
    msg.block = CBlock(make_header(7));
    msg.block.vtx.push_back(make_tx());
    msg.block.vtx.push_back(make_tx());

    BlockMessage decoded;
    REQUIRE(decoded.deserialize(msg.serialize()) == WireError::None);
    REQUIRE(decoded.block.GetBlockHeader() == msg.block.GetBlockHeader());
    REQUIRE(decoded.block.vtx.size() == 2);
    REQUIRE(decoded.block.vtx[0] == msg.block.vtx[0]);
}

TEST_CASE("TxMessage - Round trip and txid", "[messages][tx][unit]") {
    TxMessage msg;
    msg.tx = make_tx();

    TxMessage decoded;
    REQUIRE(decoded.deserialize(msg.serialize()) == WireError::None);
    REQUIRE(decoded.tx == msg.tx);
    REQUIRE(decoded.tx.GetHash() == msg.tx.GetHash());
}

TEST_CASE("MerkleBlockMessage - Round trip", "[messages][bloom][unit]") {
    MerkleBlockMessage msg;
    msg.header = make_header(3);
    msg.total_transactions = 12;
    msg.hashes = {filled(0xA1), filled(0xA2)};
    msg.flags = {0x1D};

    auto payload = msg.serialize();
    REQUIRE(payload.size() == 80 + 4 + 1 + 64 + 2);

    MerkleBlockMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.header == msg.header);
    REQUIRE(decoded.total_transactions == 12);
    REQUIRE(decoded.hashes == msg.hashes);
    REQUIRE(decoded.flags == msg.flags);
}

TEST_CASE("FilterLoadMessage - Round trip", "[messages][bloom][unit]") {
    FilterLoadMessage msg;
    msg.filter = {0xB5, 0x0F};
    msg.hash_funcs = 11;
    msg.tweak = 5;
    msg.flags = 1;

    auto payload = msg.serialize();
    REQUIRE(payload.size() == 1 + 2 + 4 + 4 + 1);

    FilterLoadMessage decoded;
    REQUIRE(decoded.deserialize(payload) == WireError::None);
    REQUIRE(decoded.filter == msg.filter);
    REQUIRE(decoded.hash_funcs == 11);
    REQUIRE(decoded.tweak == 5);
    REQUIRE(decoded.flags == 1);
}

TEST_CASE("UnknownMessage - Keeps command and payload", "[messages][unit]") {
    UnknownMessage msg("foobar", {0x61, 0x62, 0x63});
    REQUIRE(msg.command() == "foobar");
    REQUIRE(msg.payload() == std::vector<uint8_t>{0x61, 0x62, 0x63});
    REQUIRE(msg.serialize() == msg.payload());
    REQUIRE(msg.ToString() == "unknown(command=foobar, bytes=3)");
}
