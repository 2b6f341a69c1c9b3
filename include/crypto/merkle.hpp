// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace strata {
namespace crypto {

// Files under storage contracts are proven in segments of this many bytes.
constexpr size_t SEGMENT_SIZE = 64;

// Leaves and interior nodes are domain-separated so an interior node can
// never be passed off as a leaf.
uint256 MerkleLeafHash(std::span<const uint8_t> data);
uint256 MerkleNodeHash(const uint256& left, const uint256& right);

/**
 * Merkle root over an ordered list of leaves.
 *
 * For n > 1 the left subtree holds the largest power of two strictly below n
 * leaves. A single leaf's root is its leaf hash; an empty tree has the null
 * root.
 */
uint256 MerkleRoot(const std::vector<std::vector<uint8_t>>& leaves);
uint256 MerkleRootFromHashes(std::span<const uint256> leaf_hashes);

// Sibling hashes from the leaf up to the root.
std::vector<uint256> BuildMerkleProof(std::span<const uint256> leaf_hashes, uint64_t index);

bool VerifyMerkleProof(const uint256& root, std::span<const uint8_t> leaf, std::span<const uint256> proof,
                       uint64_t index, uint64_t num_leaves);

// Number of segments in a file; an empty file still has one (empty) segment.
uint64_t SegmentCount(uint64_t file_size);
std::vector<std::vector<uint8_t>> SplitSegments(std::span<const uint8_t> file);
uint256 FileMerkleRoot(std::span<const uint8_t> file);

}  // namespace crypto
}  // namespace strata
