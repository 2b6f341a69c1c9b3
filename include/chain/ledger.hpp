// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "chain/diff.hpp"
#include "chain/transaction.hpp"
#include "util/uint.hpp"

#include <map>
#include <set>
#include <vector>

namespace strata {
namespace consensus {

/**
 * LedgerState - Unspent outputs, open file contracts, delayed outputs and
 * the fund pool at the current tip.
 *
 * Pure data: ApplyDiffs() and RevertDiffs() are the only mutators. A diff
 * that does not fit the state (creating an id that exists, removing one
 * that does not or whose contents differ) raises ConsistencyFault.
 *
 * Ordered maps keep iteration, and so the digest, deterministic.
 *
 * Not thread-safe; ChainstateManager serializes access.
 */
class LedgerState {
public:
  using CoinOutputMap = std::map<uint256, chain::CoinOutput>;
  using FileContractMap = std::map<uint256, chain::FileContract>;
  using FundOutputMap = std::map<uint256, chain::FundOutput>;
  using DelayedOutputMap = std::map<chain::BlockHeight, CoinOutputMap>;

  const chain::CoinOutput* GetCoinOutput(const uint256& id) const;
  const chain::FileContract* GetFileContract(const uint256& id) const;
  const chain::FundOutput* GetFundOutput(const uint256& id) const;
  // nullptr when nothing matures at |height|.
  const CoinOutputMap* GetDelayedOutputs(chain::BlockHeight height) const;
  // Contracts whose proof window closes at |height|.
  std::vector<uint256> ContractsExpiringAt(chain::BlockHeight height) const;
  const chain::Currency& GetFundPool() const { return fund_pool_; }

  const CoinOutputMap& CoinOutputs() const { return coin_outputs_; }
  const FileContractMap& FileContracts() const { return file_contracts_; }
  const FundOutputMap& FundOutputs() const { return fund_outputs_; }
  const DelayedOutputMap& DelayedOutputs() const { return delayed_outputs_; }

  void ApplyDiffs(const BlockDiffs& diffs);
  void RevertDiffs(const BlockDiffs& diffs);

  // Hash over the full contents in a canonical order. Two ledgers are equal
  // iff their digests are.
  uint256 GetDigest() const;

  // Direct write access that bypasses diffs, for corrupting the ledger in
  // tests of the consistency checker.
  CoinOutputMap& TestGetMutableCoinOutputs() { return coin_outputs_; }

private:
  void Commit(DiffDirection direction, const CoinOutputDiff& diff);
  void Commit(DiffDirection direction, const FileContractDiff& diff);
  void Commit(DiffDirection direction, const FundOutputDiff& diff);
  void Commit(DiffDirection direction, const DelayedOutputDiff& diff);

  CoinOutputMap coin_outputs_;
  FileContractMap file_contracts_;
  FundOutputMap fund_outputs_;
  DelayedOutputMap delayed_outputs_;
  chain::Currency fund_pool_;

  // Secondary index: window_end -> contract ids.
  std::map<chain::BlockHeight, std::set<uint256>> contract_expirations_;
};

}  // namespace consensus
}  // namespace strata
