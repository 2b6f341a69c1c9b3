// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/diff.hpp"
#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace strata {
namespace chain {

// Lifecycle of a node in the block tree. Nodes on a branch proven invalid
// are erased from the tree outright rather than kept with a status.
enum class NodeStatus : uint8_t {
  PENDING,    // Stored, never applied to the ledger
  CANONICAL,  // On the current path; its diffs are applied
  REVERTED,   // Was canonical, diffs reverted during a reorg; diffs stay cached
};

std::string NodeStatusString(NodeStatus status);

// CBlockIndex - A block inside the block tree
class CBlockIndex {
public:
  NodeStatus status{NodeStatus::PENDING};

  // Set by BlockManager::AddToBlockIndex() after creation.
  uint256 m_block_hash{};

  // Parent (DOES NOT OWN). nullptr for genesis.
  CBlockIndex* pprev{nullptr};

  // Skip list pointer for O(log n) ancestor lookup. Set by BuildSkip().
  CBlockIndex* pskip{nullptr};

  int nHeight{0};

  // Cumulative work through this block
  arith_uint256 nChainWork{};

  // Target this block's children must meet
  arith_uint256 nChildTarget{};

  Block block;

  // Ledger diffs of this block, computed the first time it is applied and
  // reused on every later revert and reapply.
  std::optional<consensus::BlockDiffs> diffs;

  // Insertion order; breaks work ties in favour of the first seen branch.
  uint64_t nSequenceId{0};

  int64_t nTimeReceived{0};

  explicit CBlockIndex(const Block& b) : block(b) {}

  [[nodiscard]] const uint256& GetBlockHash() const noexcept { return m_block_hash; }
  [[nodiscard]] Timestamp GetBlockTime() const noexcept { return block.timestamp; }

  // Median timestamp of the last |window| blocks ending at this one. Near
  // genesis the window is padded with the genesis timestamp. A child's
  // timestamp may not be earlier than this.
  [[nodiscard]] Timestamp EarliestChildTimestamp(int window) const;

  void BuildSkip() noexcept;

  [[nodiscard]] const CBlockIndex* GetAncestor(int height) const noexcept;
  [[nodiscard]] CBlockIndex* GetAncestor(int height) noexcept;

  [[nodiscard]] std::string ToString() const;

  // Nodes are linked by raw pointer; never copy or move them.
  CBlockIndex(const CBlockIndex&) = delete;
  CBlockIndex& operator=(const CBlockIndex&) = delete;
  CBlockIndex(CBlockIndex&&) = delete;
  CBlockIndex& operator=(CBlockIndex&&) = delete;
};

// Work represented by meeting |target|: 2^256 / (target + 1), computed as
// ~target / (target + 1) + 1.
[[nodiscard]] arith_uint256 GetBlockProof(const arith_uint256& target) noexcept;

// Returns nullptr if either input is nullptr. All nodes share genesis.
[[nodiscard]] const CBlockIndex* LastCommonAncestor(const CBlockIndex* pa, const CBlockIndex* pb) noexcept;

}  // namespace chain
}  // namespace strata
