// Fuzz target for message header and envelope parsing
// Tests parsing of the frame header which includes magic bytes, command,
// length, and checksum, followed by the payload

#include "network/envelope.hpp"
#include "network/protocol.hpp"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace peerwire::message;
    using namespace peerwire::protocol;
    using peerwire::network::WireError;

    MessageHeader header;
    if (deserialize_header(data, size, header)) {
        auto serialized = serialize_header(header);
        MessageHeader header2;
        if (!deserialize_header(serialized.data(), serialized.size(), header2) ||
            header.magic != header2.magic || header.command != header2.command ||
            header.length != header2.length ||
            header.checksum != header2.checksum) {
            __builtin_trap();
        }

        // Whatever magic the input carries, use it so later checks run
        Envelope env;
        size_t consumed = 0;
        WireError err = decode_envelope(data, size, header.magic, env, &consumed);
        if (consumed > size) __builtin_trap();
        if (err == WireError::None) {
            if (consumed != MESSAGE_HEADER_SIZE + env.payload.size()) __builtin_trap();
            if (compute_checksum(env.payload) != env.checksum) __builtin_trap();

            // Re-framing a decoded envelope reproduces the consumed bytes
            std::vector<uint8_t> frame;
            if (encode_envelope(env.magic, env.command, env.payload, frame) !=
                    WireError::None ||
                frame.size() != consumed ||
                !std::equal(frame.begin(), frame.end(), data)) {
                __builtin_trap();
            }
        }
    }

    // Incremental extraction must never consume a partial frame
    FrameBuffer buffer(magic::MAINNET);
    buffer.append(data, size);
    Envelope env;
    bool complete = false;
    while (buffer.next(env, complete) == WireError::None && complete) {
    }

    return 0;
}
