// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "crypto/merkle.hpp"

#include "util/hash.hpp"

#include <algorithm>
#include <stdexcept>

namespace strata {
namespace crypto {

namespace {

constexpr uint8_t LEAF_PREFIX = 0x00;
constexpr uint8_t NODE_PREFIX = 0x01;

// Largest power of two strictly less than n (n >= 2).
uint64_t SplitPoint(uint64_t n) {
  uint64_t k = 1;
  while (k * 2 < n)
    k *= 2;
  return k;
}

void AppendPath(std::span<const uint256> hashes, uint64_t index, std::vector<uint256>& path) {
  if (hashes.size() <= 1)
    return;
  const uint64_t k = SplitPoint(hashes.size());
  if (index < k) {
    AppendPath(hashes.subspan(0, k), index, path);
    path.push_back(MerkleRootFromHashes(hashes.subspan(k)));
  } else {
    AppendPath(hashes.subspan(k), index - k, path);
    path.push_back(MerkleRootFromHashes(hashes.subspan(0, k)));
  }
}

}  // namespace

uint256 MerkleLeafHash(std::span<const uint8_t> data) {
  uint256 out;
  CHash256().Write(&LEAF_PREFIX, 1).Write(data).Finalize(out);
  return out;
}

uint256 MerkleNodeHash(const uint256& left, const uint256& right) {
  uint256 out;
  CHash256().Write(&NODE_PREFIX, 1).Write(left.data(), left.size()).Write(right.data(), right.size()).Finalize(out);
  return out;
}

uint256 MerkleRootFromHashes(std::span<const uint256> leaf_hashes) {
  if (leaf_hashes.empty())
    return uint256();
  if (leaf_hashes.size() == 1)
    return leaf_hashes[0];
  const uint64_t k = SplitPoint(leaf_hashes.size());
  return MerkleNodeHash(MerkleRootFromHashes(leaf_hashes.subspan(0, k)),
                        MerkleRootFromHashes(leaf_hashes.subspan(k)));
}

uint256 MerkleRoot(const std::vector<std::vector<uint8_t>>& leaves) {
  std::vector<uint256> hashes;
  hashes.reserve(leaves.size());
  for (const auto& leaf : leaves) {
    hashes.push_back(MerkleLeafHash(leaf));
  }
  return MerkleRootFromHashes(hashes);
}

std::vector<uint256> BuildMerkleProof(std::span<const uint256> leaf_hashes, uint64_t index) {
  if (index >= leaf_hashes.size()) {
    throw std::out_of_range("merkle proof index beyond leaf count");
  }
  std::vector<uint256> path;
  AppendPath(leaf_hashes, index, path);
  return path;
}

bool VerifyMerkleProof(const uint256& root, std::span<const uint8_t> leaf, std::span<const uint256> proof,
                       uint64_t index, uint64_t num_leaves) {
  if (index >= num_leaves)
    return false;

  // Audit path walk: fn tracks our position, sn the last position at the
  // current level.
  uint64_t fn = index;
  uint64_t sn = num_leaves - 1;
  uint256 r = MerkleLeafHash(leaf);
  for (const uint256& p : proof) {
    if (sn == 0)
      return false;
    if ((fn & 1) || fn == sn) {
      r = MerkleNodeHash(p, r);
      while (!(fn & 1) && fn != 0) {
        fn >>= 1;
        sn >>= 1;
      }
    } else {
      r = MerkleNodeHash(r, p);
    }
    fn >>= 1;
    sn >>= 1;
  }
  return sn == 0 && r == root;
}

uint64_t SegmentCount(uint64_t file_size) {
  if (file_size == 0)
    return 1;
  return (file_size + SEGMENT_SIZE - 1) / SEGMENT_SIZE;
}

std::vector<std::vector<uint8_t>> SplitSegments(std::span<const uint8_t> file) {
  std::vector<std::vector<uint8_t>> segments;
  for (size_t off = 0; off < file.size(); off += SEGMENT_SIZE) {
    const size_t len = std::min(SEGMENT_SIZE, file.size() - off);
    segments.emplace_back(file.begin() + off, file.begin() + off + len);
  }
  if (segments.empty()) {
    segments.emplace_back();
  }
  return segments;
}

uint256 FileMerkleRoot(std::span<const uint8_t> file) {
  return MerkleRoot(SplitSegments(file));
}

}  // namespace crypto
}  // namespace strata
