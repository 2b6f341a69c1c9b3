// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license
// Unit tests for crypto/merkle.cpp

#include "crypto/merkle.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace strata;
using namespace strata::crypto;

namespace {

std::vector<std::vector<uint8_t>> MakeLeaves(size_t n) {
    std::vector<std::vector<uint8_t>> leaves;
    for (size_t i = 0; i < n; ++i) {
        leaves.push_back(std::vector<uint8_t>(3, static_cast<uint8_t>(i + 1)));
    }
    return leaves;
}

std::vector<uint256> LeafHashes(const std::vector<std::vector<uint8_t>>& leaves) {
    std::vector<uint256> hashes;
    for (const auto& leaf : leaves) {
        hashes.push_back(MerkleLeafHash(leaf));
    }
    return hashes;
}

}  // namespace

TEST_CASE("Merkle - tree shape", "[crypto][merkle]") {
    SECTION("Empty tree has null root") {
        CHECK(MerkleRoot({}).IsNull());
    }

    SECTION("Single leaf root is the leaf hash") {
        auto leaves = MakeLeaves(1);
        CHECK(MerkleRoot(leaves) == MerkleLeafHash(leaves[0]));
    }

    SECTION("Three leaves split two and one") {
        auto leaves = MakeLeaves(3);
        auto h = LeafHashes(leaves);
        CHECK(MerkleRoot(leaves) == MerkleNodeHash(MerkleNodeHash(h[0], h[1]), h[2]));
    }

    SECTION("Five leaves split four and one") {
        auto leaves = MakeLeaves(5);
        auto h = LeafHashes(leaves);
        const uint256 left = MerkleNodeHash(MerkleNodeHash(h[0], h[1]), MerkleNodeHash(h[2], h[3]));
        CHECK(MerkleRoot(leaves) == MerkleNodeHash(left, h[4]));
    }

    SECTION("Leaf and node hashes are domain separated") {
        auto h = LeafHashes(MakeLeaves(2));
        std::vector<uint8_t> concat(h[0].begin(), h[0].end());
        concat.insert(concat.end(), h[1].begin(), h[1].end());
        CHECK(MerkleLeafHash(concat) != MerkleNodeHash(h[0], h[1]));
    }
}

TEST_CASE("Merkle - proofs verify for every leaf", "[crypto][merkle]") {
    for (size_t n : {1u, 2u, 3u, 5u, 7u, 8u, 13u}) {
        auto leaves = MakeLeaves(n);
        auto hashes = LeafHashes(leaves);
        const uint256 root = MerkleRootFromHashes(hashes);
        for (uint64_t i = 0; i < n; ++i) {
            auto proof = BuildMerkleProof(hashes, i);
            INFO("leaves=" << n << " index=" << i);
            CHECK(VerifyMerkleProof(root, leaves[i], proof, i, n));
        }
    }
}

TEST_CASE("Merkle - bad proofs are rejected", "[crypto][merkle]") {
    auto leaves = MakeLeaves(6);
    auto hashes = LeafHashes(leaves);
    const uint256 root = MerkleRootFromHashes(hashes);
    auto proof = BuildMerkleProof(hashes, 2);

    SECTION("Wrong leaf data") {
        std::vector<uint8_t> bad = leaves[2];
        bad[0] ^= 0xff;
        CHECK_FALSE(VerifyMerkleProof(root, bad, proof, 2, 6));
    }

    SECTION("Wrong index") {
        CHECK_FALSE(VerifyMerkleProof(root, leaves[2], proof, 3, 6));
    }

    SECTION("Index beyond leaf count") {
        CHECK_FALSE(VerifyMerkleProof(root, leaves[2], proof, 6, 6));
    }

    SECTION("Truncated proof") {
        proof.pop_back();
        CHECK_FALSE(VerifyMerkleProof(root, leaves[2], proof, 2, 6));
    }

    SECTION("Extra proof element") {
        proof.push_back(root);
        CHECK_FALSE(VerifyMerkleProof(root, leaves[2], proof, 2, 6));
    }

    SECTION("Out-of-range proof request throws") {
        CHECK_THROWS_AS(BuildMerkleProof(hashes, 6), std::out_of_range);
    }
}

TEST_CASE("Merkle - file segmentation", "[crypto][merkle]") {
    CHECK(SegmentCount(0) == 1);
    CHECK(SegmentCount(1) == 1);
    CHECK(SegmentCount(SEGMENT_SIZE) == 1);
    CHECK(SegmentCount(SEGMENT_SIZE + 1) == 2);

    std::vector<uint8_t> file(SEGMENT_SIZE * 2 + 10, 0xab);
    auto segments = SplitSegments(file);
    REQUIRE(segments.size() == 3);
    CHECK(segments[0].size() == SEGMENT_SIZE);
    CHECK(segments[2].size() == 10);
    CHECK(FileMerkleRoot(file) == MerkleRoot(segments));
}
