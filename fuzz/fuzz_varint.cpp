// Fuzz target for VarInt decoding
// Tests variable-length integer parsing which is notorious for bugs

#include "network/serialize.hpp"
#include <cstdint>
#include <cstddef>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace peerwire::message;

    VarInt vi;
    size_t consumed = vi.decode(data, size);
    if (consumed == 0) {
        // Nothing consumed means the prefix selected more bytes than exist
        if (size > 0 && data[0] < 0xfd) __builtin_trap();
        return 0;
    }
    if (consumed > size) __builtin_trap();

    // Re-encode: always the minimal form, never longer than what was read
    uint8_t buffer[VarInt::MAX_ENCODED_SIZE];
    size_t encoded_size = vi.encode(buffer);
    if (encoded_size != vi.size() || encoded_size > consumed) __builtin_trap();

    VarInt vi2;
    if (vi2.decode(buffer, encoded_size) != encoded_size) __builtin_trap();
    if (vi.value != vi2.value) __builtin_trap();

    // The deserializer must agree with the raw decoder
    MessageDeserializer d(data, size);
    uint64_t v = d.read_varint(false);
    if (d.has_error() || v != vi.value || d.position() != consumed) {
        __builtin_trap();
    }

    return 0;
}
