// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for MessageRegistry - command to decoder dispatch

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/message_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace peerwire;
using namespace peerwire::message;
using network::MessageRegistry;
using network::WireError;

namespace {

Envelope make_envelope(const std::string& command, std::vector<uint8_t> payload) {
    Envelope env;
    env.magic = protocol::magic::MAINNET;
    env.command = command;
    env.checksum = compute_checksum(payload);
    env.payload = std::move(payload);
    return env;
}

// Minimal extension message used to test registry extension
class FeeFilterMessage : public Message {
public:
    uint64_t feerate{0};

    std::string command() const override { return "feefilter"; }
    std::vector<uint8_t> serialize() const override {
        MessageSerializer s;
        s.write_uint64(feerate);
        return s.release();
    }

protected:
    void deserialize_payload(MessageDeserializer& d) override {
        const uint64_t rate = d.read_uint64();
        if (!d.has_error()) {
            feerate = rate;
        }
    }
};

} // namespace

TEST_CASE("MessageRegistry - Default command set", "[registry][unit]") {
    const auto& registry = MessageRegistry::Default();
    auto commands = registry.GetRegisteredCommands();

    REQUIRE(commands.size() == 17);
    REQUIRE(std::is_sorted(commands.begin(), commands.end()));
    REQUIRE(registry.HasCommand("version"));
    REQUIRE(registry.HasCommand("getheaders"));
    REQUIRE(registry.HasCommand("filterload"));
    REQUIRE_FALSE(registry.HasCommand("foobar"));

    // Same instance every time
    REQUIRE(&MessageRegistry::Default() == &registry);
}

TEST_CASE("MessageRegistry - Known command decodes to its type", "[registry][unit]") {
    const auto& registry = MessageRegistry::Default();

    PingMessage ping(42);
    MessagePtr out;
    REQUIRE(registry.Decode(make_envelope("ping", ping.serialize()), out) == WireError::None);
    REQUIRE(out != nullptr);
    REQUIRE(out->command() == "ping");

    auto* decoded = dynamic_cast<PingMessage*>(out.get());
    REQUIRE(decoded != nullptr);
    REQUIRE(decoded->nonce == 42);
}

TEST_CASE("MessageRegistry - Unknown command falls back to opaque message", "[registry][unit]") {
    const auto& registry = MessageRegistry::Default();

    MessagePtr out;
    REQUIRE(registry.Decode(make_envelope("foobar", {0x61, 0x62, 0x63}), out) == WireError::None);

    auto* unknown = dynamic_cast<UnknownMessage*>(out.get());
    REQUIRE(unknown != nullptr);
    REQUIRE(unknown->command() == "foobar");
    REQUIRE(unknown->payload() == std::vector<uint8_t>{0x61, 0x62, 0x63});
}

TEST_CASE("MessageRegistry - Decoder failure is returned", "[registry][unit]") {
    const auto& registry = MessageRegistry::Default();

    MessagePtr out;
    REQUIRE(registry.Decode(make_envelope("ping", {0x01, 0x02, 0x03}), out) == WireError::Underflow);
    REQUIRE(out == nullptr);
}

TEST_CASE("MessageRegistry - Extension with a new command", "[registry][unit]") {
    auto entries = MessageRegistry::DefaultEntries();
    entries["feefilter"] = MessageRegistry::MakeDecoder<FeeFilterMessage>();
    const MessageRegistry registry(std::move(entries));

    REQUIRE(registry.GetRegisteredCommands().size() == 18);
    REQUIRE(registry.HasCommand("feefilter"));
    // The default registry is unaffected
    REQUIRE_FALSE(MessageRegistry::Default().HasCommand("feefilter"));

    FeeFilterMessage fee;
    fee.feerate = 1000;
    MessagePtr out;
    REQUIRE(registry.Decode(make_envelope("feefilter", fee.serialize()), out) == WireError::None);
    auto* decoded = dynamic_cast<FeeFilterMessage*>(out.get());
    REQUIRE(decoded != nullptr);
    REQUIRE(decoded->feerate == 1000);

    // Existing decoders still work
    REQUIRE(registry.Decode(make_envelope("verack", {}), out) == WireError::None);
    REQUIRE(out->command() == "verack");
}

TEST_CASE("MessageRegistry - Construction validates entries", "[registry][unit]") {
    SECTION("Invalid command name") {
        MessageRegistry::Entries entries;
        entries["much_too_long_name"] = MessageRegistry::MakeDecoder<PingMessage>();
        REQUIRE_THROWS_AS(MessageRegistry(std::move(entries)), std::invalid_argument);
    }

    SECTION("Empty command name") {
        MessageRegistry::Entries entries;
        entries[""] = MessageRegistry::MakeDecoder<PingMessage>();
        REQUIRE_THROWS_AS(MessageRegistry(std::move(entries)), std::invalid_argument);
    }

    SECTION("Empty decoder") {
        MessageRegistry::Entries entries;
        entries["ping"] = MessageRegistry::DecodeFn{};
        REQUIRE_THROWS_AS(MessageRegistry(std::move(entries)), std::invalid_argument);
    }
}

TEST_CASE("MessageRegistry - Decoder that returns no message", "[registry][unit]") {
    MessageRegistry::Entries entries;
    entries["broken"] = [](const std::vector<uint8_t>&, MessagePtr&) { return WireError::None; };
    const MessageRegistry registry(std::move(entries));

    MessagePtr out;
    REQUIRE(registry.Decode(make_envelope("broken", {}), out) == WireError::Malformed);
}
