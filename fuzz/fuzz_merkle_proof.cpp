// Fuzz target for storage proof verification
// Builds a file from the input, then checks proofs for every segment and
// that a tampered proof never verifies.

#include "crypto/merkle.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using namespace strata::crypto;

    if (size > SEGMENT_SIZE * 64) {
        return 0;
    }
    const std::span<const uint8_t> file(data, size);
    const auto segments = SplitSegments(file);
    if (segments.size() != SegmentCount(size)) {
        __builtin_trap();
    }

    std::vector<uint256> leaves;
    for (const auto& segment : segments) {
        leaves.push_back(MerkleLeafHash(segment));
    }
    const uint256 root = FileMerkleRoot(file);
    if (root != MerkleRootFromHashes(leaves)) {
        __builtin_trap();
    }

    for (uint64_t i = 0; i < segments.size(); ++i) {
        std::vector<uint256> proof = BuildMerkleProof(leaves, i);
        if (!VerifyMerkleProof(root, segments[i], proof, i, segments.size())) {
            __builtin_trap();
        }
        if (!proof.empty()) {
            proof.back().data()[0] ^= 0x01;
            if (VerifyMerkleProof(root, segments[i], proof, i, segments.size())) {
                __builtin_trap();
            }
        }
    }

    return 0;
}
