// Fuzz target for network message deserialization
// Tests all message types for crash-free parsing of untrusted network data

#include "network/message.hpp"
#include "network/message_registry.hpp"
#include "network/protocol.hpp"
#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

namespace {

std::unique_ptr<peerwire::message::Message> make_message(uint8_t selector) {
    using namespace peerwire::message;

    switch (selector % 18) {
        case 0: return std::make_unique<VersionMessage>();
        case 1: return std::make_unique<VerackMessage>();
        case 2: return std::make_unique<PingMessage>();
        case 3: return std::make_unique<PongMessage>();
        case 4: return std::make_unique<AddrMessage>();
        case 5: return std::make_unique<GetAddrMessage>();
        case 6: return std::make_unique<InvMessage>();
        case 7: return std::make_unique<GetDataMessage>();
        case 8: return std::make_unique<NotFoundMessage>();
        case 9: return std::make_unique<GetHeadersMessage>();
        case 10: return std::make_unique<GetBlocksMessage>();
        case 11: return std::make_unique<HeadersMessage>();
        case 12: return std::make_unique<SendHeadersMessage>();
        case 13: return std::make_unique<BlockMessage>();
        case 14: return std::make_unique<TxMessage>();
        case 15: return std::make_unique<MerkleBlockMessage>();
        case 16: return std::make_unique<FilterLoadMessage>();
        default: return std::make_unique<UnknownMessage>();
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using peerwire::network::WireError;

    if (size < 1) return 0;

    // Use first byte to select message type
    uint8_t msg_type = data[0];
    const uint8_t* payload = data + 1;
    size_t payload_size = size - 1;

    auto msg = make_message(msg_type);

    // Test deserialization - should handle any input gracefully
    if (msg->deserialize(payload, payload_size) != WireError::None) {
        return 0;
    }

    // A decoded message re-serializes into something its own decoder accepts
    auto serialized = msg->serialize();
    auto msg2 = make_message(msg_type);
    if (msg2->deserialize(serialized) != WireError::None) __builtin_trap();
    if (msg2->serialize() != serialized) __builtin_trap();

    // Registry dispatch of the same payload must agree with the direct decode
    const auto &registry = peerwire::network::MessageRegistry::Default();
    peerwire::message::Envelope envelope;
    envelope.command = msg->command();
    envelope.payload.assign(payload, payload + payload_size);
    peerwire::message::MessagePtr decoded;
    if (!envelope.command.empty() &&
        registry.Decode(envelope, decoded) != WireError::None) {
        __builtin_trap();
    }

    return 0;
}
