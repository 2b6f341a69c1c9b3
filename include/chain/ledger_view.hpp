// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/diff.hpp"
#include "chain/ledger.hpp"

#include <map>
#include <optional>
#include <vector>

namespace strata {
namespace consensus {

/**
 * LedgerView - Copy-on-write overlay over a LedgerState.
 *
 * Reads see the base ledger plus every change made through the view. Each
 * change is recorded as a diff; the base ledger is never touched. Once a
 * block has been fully processed, TakeDiffs() yields the diffs that
 * LedgerState::ApplyDiffs() commits.
 *
 * Mutators raise ConsistencyFault when asked to create an id that exists or
 * remove one that does not; validation is expected to have ruled both out.
 */
class LedgerView {
public:
  explicit LedgerView(const LedgerState& base) : base_(base) {}

  LedgerView(const LedgerView&) = delete;
  LedgerView& operator=(const LedgerView&) = delete;

  const chain::CoinOutput* GetCoinOutput(const uint256& id) const;
  const chain::FileContract* GetFileContract(const uint256& id) const;
  const chain::FundOutput* GetFundOutput(const uint256& id) const;
  const chain::Currency& GetFundPool() const { return fund_pool_ ? *fund_pool_ : base_.GetFundPool(); }

  // Delayed outputs maturing at |height|, in id order.
  std::vector<std::pair<uint256, chain::CoinOutput>> GetDelayedOutputs(chain::BlockHeight height) const;
  // Open contracts whose window closes at |height|, in id order.
  std::vector<uint256> ContractsExpiringAt(chain::BlockHeight height) const;

  void CreateCoinOutput(const uint256& id, const chain::CoinOutput& output);
  void SpendCoinOutput(const uint256& id);
  void CreateFileContract(const uint256& id, const chain::FileContract& contract);
  void RemoveFileContract(const uint256& id);
  void CreateFundOutput(const uint256& id, const chain::FundOutput& output);
  void SpendFundOutput(const uint256& id);
  void CreateDelayedOutput(chain::BlockHeight maturity_height, const uint256& id, const chain::CoinOutput& output);
  void RemoveDelayedOutput(chain::BlockHeight maturity_height, const uint256& id);
  void SetFundPool(const chain::Currency& value);

  BlockDiffs TakeDiffs() { return std::move(diffs_); }
  const BlockDiffs& Diffs() const { return diffs_; }

private:
  template <typename T>
  using Overlay = std::map<uint256, std::optional<T>>;

  const LedgerState& base_;

  // Present value: created or still live. nullopt: removed in this view.
  Overlay<chain::CoinOutput> coin_outputs_;
  Overlay<chain::FileContract> file_contracts_;
  Overlay<chain::FundOutput> fund_outputs_;
  std::map<chain::BlockHeight, Overlay<chain::CoinOutput>> delayed_outputs_;
  std::optional<chain::Currency> fund_pool_;

  BlockDiffs diffs_;
};

}  // namespace consensus
}  // namespace strata
