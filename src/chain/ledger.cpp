// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/ledger.hpp"

#include "chain/consistency.hpp"
#include "util/hash.hpp"
#include "util/serialize.hpp"

#include <fmt/format.h>

namespace strata {
namespace consensus {

namespace {

std::string ShortId(const uint256& id) {
  return id.GetHex().substr(0, 16);
}

}  // namespace

const chain::CoinOutput* LedgerState::GetCoinOutput(const uint256& id) const {
  auto it = coin_outputs_.find(id);
  return it == coin_outputs_.end() ? nullptr : &it->second;
}

const chain::FileContract* LedgerState::GetFileContract(const uint256& id) const {
  auto it = file_contracts_.find(id);
  return it == file_contracts_.end() ? nullptr : &it->second;
}

const chain::FundOutput* LedgerState::GetFundOutput(const uint256& id) const {
  auto it = fund_outputs_.find(id);
  return it == fund_outputs_.end() ? nullptr : &it->second;
}

const LedgerState::CoinOutputMap* LedgerState::GetDelayedOutputs(chain::BlockHeight height) const {
  auto it = delayed_outputs_.find(height);
  return it == delayed_outputs_.end() ? nullptr : &it->second;
}

std::vector<uint256> LedgerState::ContractsExpiringAt(chain::BlockHeight height) const {
  auto it = contract_expirations_.find(height);
  if (it == contract_expirations_.end())
    return {};
  return std::vector<uint256>(it->second.begin(), it->second.end());
}

void LedgerState::Commit(DiffDirection direction, const CoinOutputDiff& diff) {
  if (direction == DiffDirection::APPLY) {
    if (!coin_outputs_.emplace(diff.id, diff.output).second) {
      throw ConsistencyFault(fmt::format("coin output {} created twice", ShortId(diff.id)));
    }
    return;
  }
  auto it = coin_outputs_.find(diff.id);
  if (it == coin_outputs_.end() || !(it->second == diff.output)) {
    throw ConsistencyFault(fmt::format("removing coin output {} that is not in the ledger", ShortId(diff.id)));
  }
  coin_outputs_.erase(it);
}

void LedgerState::Commit(DiffDirection direction, const FileContractDiff& diff) {
  const chain::BlockHeight expiry = diff.contract.window_end;
  if (direction == DiffDirection::APPLY) {
    if (!file_contracts_.emplace(diff.id, diff.contract).second) {
      throw ConsistencyFault(fmt::format("file contract {} created twice", ShortId(diff.id)));
    }
    contract_expirations_[expiry].insert(diff.id);
    return;
  }
  auto it = file_contracts_.find(diff.id);
  if (it == file_contracts_.end() || !(it->second == diff.contract)) {
    throw ConsistencyFault(fmt::format("removing file contract {} that is not in the ledger", ShortId(diff.id)));
  }
  file_contracts_.erase(it);
  auto exp = contract_expirations_.find(expiry);
  if (exp != contract_expirations_.end()) {
    exp->second.erase(diff.id);
    if (exp->second.empty())
      contract_expirations_.erase(exp);
  }
}

void LedgerState::Commit(DiffDirection direction, const FundOutputDiff& diff) {
  if (direction == DiffDirection::APPLY) {
    if (!fund_outputs_.emplace(diff.id, diff.output).second) {
      throw ConsistencyFault(fmt::format("fund output {} created twice", ShortId(diff.id)));
    }
    return;
  }
  auto it = fund_outputs_.find(diff.id);
  if (it == fund_outputs_.end() || !(it->second == diff.output)) {
    throw ConsistencyFault(fmt::format("removing fund output {} that is not in the ledger", ShortId(diff.id)));
  }
  fund_outputs_.erase(it);
}

void LedgerState::Commit(DiffDirection direction, const DelayedOutputDiff& diff) {
  if (direction == DiffDirection::APPLY) {
    if (!delayed_outputs_[diff.maturity_height].emplace(diff.id, diff.output).second) {
      throw ConsistencyFault(
          fmt::format("delayed output {} at height {} created twice", ShortId(diff.id), diff.maturity_height));
    }
    return;
  }
  auto bucket = delayed_outputs_.find(diff.maturity_height);
  if (bucket == delayed_outputs_.end()) {
    throw ConsistencyFault(fmt::format("no delayed outputs at height {}", diff.maturity_height));
  }
  auto it = bucket->second.find(diff.id);
  if (it == bucket->second.end() || !(it->second == diff.output)) {
    throw ConsistencyFault(fmt::format("removing delayed output {} that is not in the ledger", ShortId(diff.id)));
  }
  bucket->second.erase(it);
  if (bucket->second.empty())
    delayed_outputs_.erase(bucket);
}

void LedgerState::ApplyDiffs(const BlockDiffs& diffs) {
  for (const auto& d : diffs.coin_output_diffs)
    Commit(d.direction, d);
  for (const auto& d : diffs.file_contract_diffs)
    Commit(d.direction, d);
  for (const auto& d : diffs.fund_output_diffs)
    Commit(d.direction, d);
  for (const auto& d : diffs.delayed_output_diffs)
    Commit(d.direction, d);
  for (const auto& d : diffs.fund_pool_diffs) {
    if (!(fund_pool_ == d.previous)) {
      throw ConsistencyFault(fmt::format("fund pool is {}, diff expects {}", fund_pool_.ToString(),
                                         d.previous.ToString()));
    }
    fund_pool_ = d.adjusted;
  }
}

void LedgerState::RevertDiffs(const BlockDiffs& diffs) {
  for (auto it = diffs.fund_pool_diffs.rbegin(); it != diffs.fund_pool_diffs.rend(); ++it) {
    if (!(fund_pool_ == it->adjusted)) {
      throw ConsistencyFault(fmt::format("fund pool is {}, revert expects {}", fund_pool_.ToString(),
                                         it->adjusted.ToString()));
    }
    fund_pool_ = it->previous;
  }
  for (auto it = diffs.delayed_output_diffs.rbegin(); it != diffs.delayed_output_diffs.rend(); ++it)
    Commit(Invert(it->direction), *it);
  for (auto it = diffs.fund_output_diffs.rbegin(); it != diffs.fund_output_diffs.rend(); ++it)
    Commit(Invert(it->direction), *it);
  for (auto it = diffs.file_contract_diffs.rbegin(); it != diffs.file_contract_diffs.rend(); ++it)
    Commit(Invert(it->direction), *it);
  for (auto it = diffs.coin_output_diffs.rbegin(); it != diffs.coin_output_diffs.rend(); ++it)
    Commit(Invert(it->direction), *it);
}

uint256 LedgerState::GetDigest() const {
  util::Encoder enc;
  enc.WriteU64(coin_outputs_.size());
  for (const auto& [id, out] : coin_outputs_) {
    enc.WriteUint256(id);
    out.Encode(enc);
  }
  enc.WriteU64(file_contracts_.size());
  for (const auto& [id, fc] : file_contracts_) {
    enc.WriteUint256(id);
    fc.Encode(enc);
  }
  enc.WriteU64(fund_outputs_.size());
  for (const auto& [id, out] : fund_outputs_) {
    enc.WriteUint256(id);
    out.Encode(enc);
  }
  enc.WriteU64(delayed_outputs_.size());
  for (const auto& [height, bucket] : delayed_outputs_) {
    enc.WriteU64(height).WriteU64(bucket.size());
    for (const auto& [id, out] : bucket) {
      enc.WriteUint256(id);
      out.Encode(enc);
    }
  }
  enc.WriteArith(fund_pool_);
  return Hash(enc.Data());
}

}  // namespace consensus
}  // namespace strata
