// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "chain/transaction.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <vector>

namespace strata {
namespace consensus {

// APPLY: the object enters the ledger when the diff is applied.
// REVERT: the object leaves the ledger when the diff is applied.
// Reverting a diff performs the opposite action.
enum class DiffDirection : uint8_t {
  APPLY,
  REVERT,
};

inline DiffDirection Invert(DiffDirection d) {
  return d == DiffDirection::APPLY ? DiffDirection::REVERT : DiffDirection::APPLY;
}

struct CoinOutputDiff {
  DiffDirection direction;
  uint256 id;
  chain::CoinOutput output;
  friend bool operator==(const CoinOutputDiff&, const CoinOutputDiff&) = default;
};

struct FileContractDiff {
  DiffDirection direction;
  uint256 id;
  chain::FileContract contract;
  friend bool operator==(const FileContractDiff&, const FileContractDiff&) = default;
};

struct FundOutputDiff {
  DiffDirection direction;
  uint256 id;
  chain::FundOutput output;
  friend bool operator==(const FundOutputDiff&, const FundOutputDiff&) = default;
};

struct DelayedOutputDiff {
  DiffDirection direction;
  chain::BlockHeight maturity_height;
  uint256 id;
  chain::CoinOutput output;
  friend bool operator==(const DelayedOutputDiff&, const DelayedOutputDiff&) = default;
};

struct FundPoolDiff {
  chain::Currency previous;
  chain::Currency adjusted;
  friend bool operator==(const FundPoolDiff&, const FundPoolDiff&) = default;
};

/**
 * Every ledger mutation caused by one block, in the order it was made.
 *
 * The categories touch disjoint maps, so each list is applied in order and
 * reverted in reverse order independently of the others.
 */
struct BlockDiffs {
  std::vector<CoinOutputDiff> coin_output_diffs;
  std::vector<FileContractDiff> file_contract_diffs;
  std::vector<FundOutputDiff> fund_output_diffs;
  std::vector<DelayedOutputDiff> delayed_output_diffs;
  std::vector<FundPoolDiff> fund_pool_diffs;

  size_t size() const {
    return coin_output_diffs.size() + file_contract_diffs.size() + fund_output_diffs.size() +
           delayed_output_diffs.size() + fund_pool_diffs.size();
  }
  bool empty() const { return size() == 0; }

  friend bool operator==(const BlockDiffs&, const BlockDiffs&) = default;
};

}  // namespace consensus
}  // namespace strata
