// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/ledger_view.hpp"

#include "chain/consistency.hpp"

#include <set>

#include <fmt/format.h>

namespace strata {
namespace consensus {

namespace {

template <typename T, typename Lookup>
const T* Resolve(const std::map<uint256, std::optional<T>>& overlay, const uint256& id, Lookup base_lookup) {
  auto it = overlay.find(id);
  if (it != overlay.end()) {
    return it->second ? &*it->second : nullptr;
  }
  return base_lookup(id);
}

std::string ShortId(const uint256& id) {
  return id.GetHex().substr(0, 16);
}

}  // namespace

const chain::CoinOutput* LedgerView::GetCoinOutput(const uint256& id) const {
  return Resolve(coin_outputs_, id, [this](const uint256& i) { return base_.GetCoinOutput(i); });
}

const chain::FileContract* LedgerView::GetFileContract(const uint256& id) const {
  return Resolve(file_contracts_, id, [this](const uint256& i) { return base_.GetFileContract(i); });
}

const chain::FundOutput* LedgerView::GetFundOutput(const uint256& id) const {
  return Resolve(fund_outputs_, id, [this](const uint256& i) { return base_.GetFundOutput(i); });
}

std::vector<std::pair<uint256, chain::CoinOutput>> LedgerView::GetDelayedOutputs(chain::BlockHeight height) const {
  std::map<uint256, chain::CoinOutput> merged;
  if (const auto* base = base_.GetDelayedOutputs(height)) {
    merged = *base;
  }
  auto it = delayed_outputs_.find(height);
  if (it != delayed_outputs_.end()) {
    for (const auto& [id, out] : it->second) {
      if (out) {
        merged[id] = *out;
      } else {
        merged.erase(id);
      }
    }
  }
  return {merged.begin(), merged.end()};
}

std::vector<uint256> LedgerView::ContractsExpiringAt(chain::BlockHeight height) const {
  std::set<uint256> ids;
  for (const auto& id : base_.ContractsExpiringAt(height)) {
    ids.insert(id);
  }
  for (const auto& [id, fc] : file_contracts_) {
    if (fc && fc->window_end == height) {
      ids.insert(id);
    } else {
      ids.erase(id);
    }
  }
  // A contract revised in this view may have moved away from |height|.
  std::vector<uint256> out;
  for (const auto& id : ids) {
    const auto* fc = GetFileContract(id);
    if (fc && fc->window_end == height)
      out.push_back(id);
  }
  return out;
}

void LedgerView::CreateCoinOutput(const uint256& id, const chain::CoinOutput& output) {
  if (GetCoinOutput(id)) {
    throw ConsistencyFault(fmt::format("coin output {} created twice", ShortId(id)));
  }
  coin_outputs_[id] = output;
  diffs_.coin_output_diffs.push_back({DiffDirection::APPLY, id, output});
}

void LedgerView::SpendCoinOutput(const uint256& id) {
  const auto* existing = GetCoinOutput(id);
  if (!existing) {
    throw ConsistencyFault(fmt::format("spending unknown coin output {}", ShortId(id)));
  }
  diffs_.coin_output_diffs.push_back({DiffDirection::REVERT, id, *existing});
  coin_outputs_[id] = std::nullopt;
}

void LedgerView::CreateFileContract(const uint256& id, const chain::FileContract& contract) {
  if (GetFileContract(id)) {
    throw ConsistencyFault(fmt::format("file contract {} created twice", ShortId(id)));
  }
  file_contracts_[id] = contract;
  diffs_.file_contract_diffs.push_back({DiffDirection::APPLY, id, contract});
}

void LedgerView::RemoveFileContract(const uint256& id) {
  const auto* existing = GetFileContract(id);
  if (!existing) {
    throw ConsistencyFault(fmt::format("removing unknown file contract {}", ShortId(id)));
  }
  diffs_.file_contract_diffs.push_back({DiffDirection::REVERT, id, *existing});
  file_contracts_[id] = std::nullopt;
}

void LedgerView::CreateFundOutput(const uint256& id, const chain::FundOutput& output) {
  if (GetFundOutput(id)) {
    throw ConsistencyFault(fmt::format("fund output {} created twice", ShortId(id)));
  }
  fund_outputs_[id] = output;
  diffs_.fund_output_diffs.push_back({DiffDirection::APPLY, id, output});
}

void LedgerView::SpendFundOutput(const uint256& id) {
  const auto* existing = GetFundOutput(id);
  if (!existing) {
    throw ConsistencyFault(fmt::format("spending unknown fund output {}", ShortId(id)));
  }
  diffs_.fund_output_diffs.push_back({DiffDirection::REVERT, id, *existing});
  fund_outputs_[id] = std::nullopt;
}

void LedgerView::CreateDelayedOutput(chain::BlockHeight maturity_height, const uint256& id,
                                     const chain::CoinOutput& output) {
  for (const auto& [existing_id, out] : GetDelayedOutputs(maturity_height)) {
    if (existing_id == id) {
      throw ConsistencyFault(fmt::format("delayed output {} created twice", ShortId(id)));
    }
  }
  delayed_outputs_[maturity_height][id] = output;
  diffs_.delayed_output_diffs.push_back({DiffDirection::APPLY, maturity_height, id, output});
}

void LedgerView::RemoveDelayedOutput(chain::BlockHeight maturity_height, const uint256& id) {
  for (const auto& [existing_id, out] : GetDelayedOutputs(maturity_height)) {
    if (existing_id == id) {
      diffs_.delayed_output_diffs.push_back({DiffDirection::REVERT, maturity_height, id, out});
      delayed_outputs_[maturity_height][id] = std::nullopt;
      return;
    }
  }
  throw ConsistencyFault(fmt::format("removing unknown delayed output {}", ShortId(id)));
}

void LedgerView::SetFundPool(const chain::Currency& value) {
  diffs_.fund_pool_diffs.push_back({GetFundPool(), value});
  fund_pool_ = value;
}

}  // namespace consensus
}  // namespace strata
