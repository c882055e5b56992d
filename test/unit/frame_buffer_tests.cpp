// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for incremental frame extraction

#include <catch2/catch_test_macros.hpp>
#include "network/envelope.hpp"
#include "network/protocol.hpp"
#include <vector>

using namespace peerwire;
using namespace peerwire::message;
using network::WireError;

namespace {

constexpr uint32_t kMagic = protocol::magic::REGTEST;

std::vector<uint8_t> frame_of(const std::string& command, const std::vector<uint8_t>& payload,
                              uint32_t magic = kMagic) {
    std::vector<uint8_t> frame;
    REQUIRE(encode_envelope(magic, command, payload, frame) == WireError::None);
    return frame;
}

} // namespace

TEST_CASE("FrameBuffer - Byte at a time delivery", "[framebuffer][unit]") {
    const auto frame = frame_of("pong", {1, 2, 3, 4, 5, 6, 7, 8});
    FrameBuffer buffer(kMagic);

    Envelope env;
    bool complete = false;
    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        buffer.append(&frame[i], 1);
        REQUIRE(buffer.next(env, complete) == WireError::None);
        REQUIRE_FALSE(complete);
    }

    buffer.append(&frame.back(), 1);
    REQUIRE(buffer.next(env, complete) == WireError::None);
    REQUIRE(complete);
    REQUIRE(env.command == "pong");
    REQUIRE(env.payload.size() == 8);
    REQUIRE(buffer.buffered() == 0);
}

TEST_CASE("FrameBuffer - Several frames in one chunk", "[framebuffer][unit]") {
    auto data = frame_of("verack", {});
    auto ping = frame_of("ping", {0, 0, 0, 0, 0, 0, 0, 1});
    auto partial = frame_of("getaddr", {});
    data.insert(data.end(), ping.begin(), ping.end());
    data.insert(data.end(), partial.begin(), partial.begin() + 10);

    FrameBuffer buffer(kMagic);
    buffer.append(data);

    Envelope env;
    bool complete = false;
    REQUIRE(buffer.next(env, complete) == WireError::None);
    REQUIRE(complete);
    REQUIRE(env.command == "verack");

    REQUIRE(buffer.next(env, complete) == WireError::None);
    REQUIRE(complete);
    REQUIRE(env.command == "ping");

    // Partial frame is kept
    REQUIRE(buffer.next(env, complete) == WireError::None);
    REQUIRE_FALSE(complete);
    REQUIRE(buffer.buffered() == 10);

    buffer.append(partial.data() + 10, partial.size() - 10);
    REQUIRE(buffer.next(env, complete) == WireError::None);
    REQUIRE(complete);
    REQUIRE(env.command == "getaddr");
}

TEST_CASE("FrameBuffer - Foreign magic is rejected after four bytes", "[framebuffer][unit]") {
    auto frame = frame_of("verack", {}, protocol::magic::MAINNET);
    FrameBuffer buffer(kMagic);

    Envelope env;
    bool complete = false;
    buffer.append(frame.data(), 3);
    REQUIRE(buffer.next(env, complete) == WireError::None);

    buffer.append(frame.data() + 3, 1);
    REQUIRE(buffer.next(env, complete) == WireError::ProtocolMismatch);
    REQUIRE_FALSE(complete);
}

TEST_CASE("FrameBuffer - Oversized header is rejected without the payload", "[framebuffer][unit]") {
    auto frame = frame_of("block", {});
    uint32_t huge = protocol::MAX_PROTOCOL_MESSAGE_LENGTH + 1;
    frame[16] = huge & 0xFF;
    frame[17] = (huge >> 8) & 0xFF;
    frame[18] = (huge >> 16) & 0xFF;
    frame[19] = (huge >> 24) & 0xFF;

    FrameBuffer buffer(kMagic);
    buffer.append(frame);

    Envelope env;
    bool complete = false;
    REQUIRE(buffer.next(env, complete) == WireError::PayloadTooLarge);
}

TEST_CASE("FrameBuffer - Errors are sticky", "[framebuffer][unit]") {
    auto frame = frame_of("tx", {0x01, 0x02});
    frame.back() ^= 0xFF;

    FrameBuffer buffer(kMagic);
    buffer.append(frame);

    Envelope env;
    bool complete = false;
    REQUIRE(buffer.next(env, complete) == WireError::ChecksumMismatch);
    REQUIRE(buffer.error() == WireError::ChecksumMismatch);

    // A valid frame afterwards does not reset the state
    buffer.append(frame_of("verack", {}));
    REQUIRE(buffer.next(env, complete) == WireError::ChecksumMismatch);
    REQUIRE_FALSE(complete);
}
