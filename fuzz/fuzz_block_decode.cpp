// Fuzz target for Block deserialization
// Tests block parsing from untrusted peer data

#include "chain/block.hpp"
#include "util/serialize.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    strata::chain::Block block;
    try {
        block = strata::chain::Block::Deserialize(std::span<const uint8_t>(data, size));
    } catch (const strata::util::DeserializeError&) {
        // Malformed input is expected
        return 0;
    }

    // A block that parsed must re-encode to exactly the input bytes
    const std::vector<uint8_t> serialized = block.Serialize();
    if (serialized.size() != size || !std::equal(serialized.begin(), serialized.end(), data)) {
        __builtin_trap();
    }
    if (block.SerializedSize() != size) {
        __builtin_trap();
    }

    // Identity must be stable across a second decode
    const strata::chain::Block again = strata::chain::Block::Deserialize(serialized);
    if (again.GetHash() != block.GetHash()) {
        __builtin_trap();
    }

    return 0;
}
