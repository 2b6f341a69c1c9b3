// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/consistency.hpp"

#include "chain/ledger.hpp"
#include "chain/tx_verify.hpp"
#include "util/logging.hpp"

#include <fmt/format.h>

namespace strata {
namespace consensus {

namespace {

void Accumulate(chain::Currency& total, const chain::Currency& value) {
  if (!chain::CheckedAdd(total, value)) {
    LOG_CONSENSUS_CRITICAL("ledger value total overflows 256 bits");
    throw ConsistencyFault("ledger value total overflows 256 bits");
  }
}

}  // namespace

chain::Currency CirculatingCoins(const LedgerState& ledger) {
  chain::Currency total;
  for (const auto& [id, out] : ledger.CoinOutputs()) {
    Accumulate(total, out.value);
  }
  for (const auto& [height, bucket] : ledger.DelayedOutputs()) {
    for (const auto& [id, out] : bucket) {
      Accumulate(total, out.value);
    }
  }
  // The tax share of a payout already sits in the fund pool.
  for (const auto& [id, fc] : ledger.FileContracts()) {
    Accumulate(total, fc.payout - chain::ContractTax(fc.payout));
  }
  const chain::Currency& pool = ledger.GetFundPool();
  for (const auto& [id, fund] : ledger.FundOutputs()) {
    Accumulate(total, FundClaim(pool, fund.claim_start, fund.value));
  }
  return total;
}

void CheckLedgerConsistency(const LedgerState& ledger, chain::BlockHeight height) {
  const chain::Currency expected = chain::TotalCoinbase(height);
  const chain::Currency actual = CirculatingCoins(ledger);
  if (!(actual == expected)) {
    const std::string msg = fmt::format("coin supply mismatch at height {}: ledger holds {}, expected {}", height,
                                        actual.ToString(), expected.ToString());
    LOG_CONSENSUS_CRITICAL("{}", msg);
    throw ConsistencyFault(msg);
  }

  chain::Currency shares;
  for (const auto& [id, fund] : ledger.FundOutputs()) {
    Accumulate(shares, fund.value);
  }
  if (!(shares == chain::FUND_SHARE_COUNT)) {
    const std::string msg = fmt::format("fund share mismatch at height {}: ledger holds {}, expected {}", height,
                                        shares.ToString(), chain::FUND_SHARE_COUNT);
    LOG_CONSENSUS_CRITICAL("{}", msg);
    throw ConsistencyFault(msg);
  }
}

}  // namespace consensus
}  // namespace strata
