// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/block_index.hpp"

#include <algorithm>
#include <vector>

#include <fmt/format.h>

namespace strata {
namespace chain {

namespace {

int InvertLowestOne(int n) {
  return n & (n - 1);
}

// Height the skip pointer of a node at |height| jumps to.
int GetSkipHeight(int height) {
  if (height < 2)
    return 0;
  return (height & 1) ? InvertLowestOne(InvertLowestOne(height - 1)) + 1 : InvertLowestOne(height);
}

}  // namespace

std::string NodeStatusString(NodeStatus status) {
  switch (status) {
  case NodeStatus::PENDING:
    return "pending";
  case NodeStatus::CANONICAL:
    return "canonical";
  case NodeStatus::REVERTED:
    return "reverted";
  }
  return "unknown";
}

Timestamp CBlockIndex::EarliestChildTimestamp(int window) const {
  std::vector<Timestamp> times;
  times.reserve(static_cast<size_t>(window));
  const CBlockIndex* p = this;
  for (int i = 0; i < window; ++i) {
    times.push_back(p->GetBlockTime());
    if (p->pprev)
      p = p->pprev;
  }
  std::sort(times.begin(), times.end());
  return times[times.size() / 2];
}

void CBlockIndex::BuildSkip() noexcept {
  if (pprev)
    pskip = pprev->GetAncestor(GetSkipHeight(nHeight));
}

const CBlockIndex* CBlockIndex::GetAncestor(int height) const noexcept {
  if (height > nHeight || height < 0)
    return nullptr;

  const CBlockIndex* walk = this;
  int height_walk = nHeight;
  while (height_walk > height) {
    const int height_skip = GetSkipHeight(height_walk);
    const int height_skip_prev = GetSkipHeight(height_walk - 1);
    if (walk->pskip != nullptr &&
        (height_skip == height ||
         (height_skip > height && !(height_skip_prev < height_skip - 2 && height_skip_prev >= height)))) {
      walk = walk->pskip;
      height_walk = height_skip;
    } else {
      walk = walk->pprev;
      height_walk--;
    }
  }
  return walk;
}

CBlockIndex* CBlockIndex::GetAncestor(int height) noexcept {
  return const_cast<CBlockIndex*>(static_cast<const CBlockIndex*>(this)->GetAncestor(height));
}

std::string CBlockIndex::ToString() const {
  return fmt::format("CBlockIndex(hash={}, height={}, status={}, work={}, time={}, diffs={})",
                     m_block_hash.GetHex().substr(0, 16), nHeight, NodeStatusString(status),
                     nChainWork.GetHex().substr(48), block.timestamp, diffs ? "cached" : "none");
}

arith_uint256 GetBlockProof(const arith_uint256& target) noexcept {
  if (target.IsZero())
    return 0;
  if ((~target).IsZero())
    return 1;
  return (~target / (target + 1)) + 1;
}

const CBlockIndex* LastCommonAncestor(const CBlockIndex* pa, const CBlockIndex* pb) noexcept {
  if (pa == nullptr || pb == nullptr)
    return nullptr;

  if (pa->nHeight > pb->nHeight) {
    pa = pa->GetAncestor(pb->nHeight);
  } else if (pb->nHeight > pa->nHeight) {
    pb = pb->GetAncestor(pa->nHeight);
  }

  while (pa != pb && pa && pb) {
    pa = pa->pprev;
    pb = pb->pprev;
  }
  return pa;
}

}  // namespace chain
}  // namespace strata
