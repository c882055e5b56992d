// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef PEERWIRE_NETWORK_MESSAGE_REGISTRY_HPP
#define PEERWIRE_NETWORK_MESSAGE_REGISTRY_HPP

#include "network/envelope.hpp"
#include "network/message.hpp"
#include "network/wire_error.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerwire {
namespace network {

/**
 * MessageRegistry - command string to payload decoder table
 *
 * Design:
 * - The table is fixed at construction; there are no mutators, so one
 *   instance can be shared by any number of connections without locking
 * - Extensible: a new message kind is a new entry, no change to framing or
 *   to other decoders
 * - Commands without an entry decode to message::UnknownMessage
 *
 * Usage:
 *   auto entries = MessageRegistry::DefaultEntries();
 *   entries["sendcmpct"] = MessageRegistry::MakeDecoder<SendCmpctMessage>();
 *   const MessageRegistry registry(std::move(entries));
 *   registry.Decode(envelope, msg);
 */
class MessageRegistry {
public:
  // Decode a payload into a freshly built message; non-None is fatal
  using DecodeFn = std::function<WireError(const std::vector<uint8_t> &payload,
                                           message::MessagePtr &out)>;
  using Entries = std::unordered_map<std::string, DecodeFn>;

  /**
   * @throws std::invalid_argument if a key is not a valid command name or a
   *         decoder is empty
   */
  explicit MessageRegistry(Entries entries);

  // Non-copyable
  MessageRegistry(const MessageRegistry &) = delete;
  MessageRegistry &operator=(const MessageRegistry &) = delete;

  /**
   * Turn a framed payload into a typed message
   *
   * Registered command: the decoder's result, any decode failure returned
   * unchanged. Unregistered command: an UnknownMessage carrying the command
   * and payload; this path never fails.
   */
  WireError Decode(const message::Envelope &envelope,
                   message::MessagePtr &out) const;

  bool HasCommand(const std::string &command) const;

  // Sorted, for diagnostics
  std::vector<std::string> GetRegisteredCommands() const;

  // Decoder that default-constructs T and runs its payload codec
  template <typename T> static DecodeFn MakeDecoder() {
    return [](const std::vector<uint8_t> &payload, message::MessagePtr &out) {
      auto msg = std::make_unique<T>();
      WireError err = msg->deserialize(payload);
      if (err == WireError::None) {
        out = std::move(msg);
      }
      return err;
    };
  }

  // The standard command set (see Default())
  static Entries DefaultEntries();

  /**
   * Process-wide registry of the standard commands, built on first use
   * (thread-safe static initialization) and never modified afterwards.
   */
  static const MessageRegistry &Default();

private:
  Entries decoders_;
};

} // namespace network
} // namespace peerwire

#endif // PEERWIRE_NETWORK_MESSAGE_REGISTRY_HPP
