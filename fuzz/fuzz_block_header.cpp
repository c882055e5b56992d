// Fuzz target for CBlockHeader deserialization
// Tests block header parsing from untrusted network data

#include "primitives/block.hpp"
#include <cstdint>
#include <cstddef>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using peerwire::CBlockHeader;

    CBlockHeader header;

    // Anything but exactly 80 bytes is rejected
    bool ok = header.Deserialize(data, size);
    if (ok != (size == CBlockHeader::HEADER_SIZE)) __builtin_trap();
    if (!ok) return 0;

    auto serialized = header.Serialize();
    if (serialized.size() != CBlockHeader::HEADER_SIZE) __builtin_trap();
    for (size_t i = 0; i < size; ++i) {
        if (serialized[i] != data[i]) __builtin_trap();
    }

    CBlockHeader header2;
    if (!header2.Deserialize(serialized.data(), serialized.size()) ||
        !(header == header2) || header.GetHash() != header2.GetHash()) {
        __builtin_trap();
    }

    return 0;
}
