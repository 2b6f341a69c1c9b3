// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/validation.hpp"

#include "chain/block.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/time.hpp"

#include <fmt/format.h>

namespace strata {
namespace validation {

std::string ConsensusErrorString(ConsensusError error) {
  switch (error) {
  case ConsensusError::OK:
    return "ok";
  case ConsensusError::BLOCK_KNOWN:
    return "block-known";
  case ConsensusError::NON_EXTENDING_BLOCK:
    return "non-extending-block";
  case ConsensusError::DOS_BLOCK:
    return "dos-block";
  case ConsensusError::ORPHAN:
    return "orphan";
  case ConsensusError::MISSED_TARGET:
    return "missed-target";
  case ConsensusError::LARGE_BLOCK:
    return "large-block";
  case ConsensusError::EARLY_TIMESTAMP:
    return "early-timestamp";
  case ConsensusError::FUTURE_TIMESTAMP:
    return "future-timestamp";
  case ConsensusError::EXTREME_FUTURE_TIMESTAMP:
    return "extreme-future-timestamp";
  case ConsensusError::BAD_MINER_PAYOUTS:
    return "bad-miner-payouts";
  case ConsensusError::COIN_INPUT_OUTPUT_MISMATCH:
    return "coin-input-output-mismatch";
  case ConsensusError::FUND_INPUT_OUTPUT_MISMATCH:
    return "fund-input-output-mismatch";
  case ConsensusError::MISSING_COIN_OUTPUT:
    return "missing-coin-output";
  case ConsensusError::MISSING_FUND_OUTPUT:
    return "missing-fund-output";
  case ConsensusError::DOUBLE_SPEND:
    return "double-spend";
  case ConsensusError::ZERO_OUTPUT:
    return "zero-output";
  case ConsensusError::WRONG_UNLOCK_CONDITIONS:
    return "wrong-unlock-conditions";
  case ConsensusError::PREMATURE_UNLOCK:
    return "premature-unlock";
  case ConsensusError::INVALID_SIGNATURE:
    return "invalid-signature";
  case ConsensusError::MISSING_SIGNATURES:
    return "missing-signatures";
  case ConsensusError::FRIVOLOUS_SIGNATURE:
    return "frivolous-signature";
  case ConsensusError::BAD_FILE_CONTRACT:
    return "bad-file-contract";
  case ConsensusError::UNRECOGNIZED_FILE_CONTRACT:
    return "unrecognized-file-contract";
  case ConsensusError::BAD_REVISION_NUMBER:
    return "bad-revision-number";
  case ConsensusError::LATE_REVISION:
    return "late-revision";
  case ConsensusError::REVISION_PAYOUT_MISMATCH:
    return "revision-payout-mismatch";
  case ConsensusError::INVALID_STORAGE_PROOF:
    return "invalid-storage-proof";
  case ConsensusError::STORAGE_PROOF_TIMING:
    return "storage-proof-timing";
  case ConsensusError::STORAGE_PROOF_RULES:
    return "storage-proof-rules";
  case ConsensusError::VALUE_OVERFLOW:
    return "value-overflow";
  }
  return "unknown";
}

std::string ValidationState::ToString() const {
  if (IsValid())
    return "valid";
  if (debug_message_.empty())
    return reject_reason_;
  return reject_reason_ + ", " + debug_message_;
}

bool CheckMinerPayouts(const chain::Block& block, chain::BlockHeight height, ValidationState& state) {
  for (size_t i = 0; i < block.miner_payouts.size(); ++i) {
    if (block.miner_payouts[i].value.IsZero()) {
      return state.Invalid(ConsensusError::BAD_MINER_PAYOUTS, "zero-miner-payout",
                           fmt::format("payout {} has zero value", i));
    }
  }
  chain::Currency expected = chain::CalculateCoinbase(height);
  const auto fees = block.TotalMinerFees();
  if (!fees || !chain::CheckedAdd(expected, *fees))
    return state.Invalid(ConsensusError::BAD_MINER_PAYOUTS, "miner-fees-overflow");
  const auto payouts = block.TotalMinerPayouts();
  if (!payouts)
    return state.Invalid(ConsensusError::BAD_MINER_PAYOUTS, "miner-payouts-overflow");
  const chain::Currency& actual = *payouts;
  if (!(actual == expected)) {
    return state.Invalid(ConsensusError::BAD_MINER_PAYOUTS, "bad-miner-payouts",
                         fmt::format("payouts total {}, expected {}", actual.ToString(), expected.ToString()));
  }
  return true;
}

bool ContextualCheckBlock(const chain::Block& block, const uint256& hash, const chain::CBlockIndex& parent,
                          const chain::ChainParams& params, int64_t now, ValidationState& state) {
  const auto& consensus = params.GetConsensus();

  if (!consensus::CheckProofOfWork(hash, parent.nChildTarget)) {
    return state.Invalid(ConsensusError::MISSED_TARGET, "high-hash",
                         fmt::format("block id {} above target {}", hash.GetHex(), parent.nChildTarget.GetHex()));
  }

  const size_t size = block.SerializedSize();
  if (size > consensus.nBlockSizeLimit) {
    return state.Invalid(ConsensusError::LARGE_BLOCK, "bad-blk-length",
                         fmt::format("block is {} bytes, limit {}", size, consensus.nBlockSizeLimit));
  }

  const chain::Timestamp earliest = parent.EarliestChildTimestamp(consensus.nMedianTimestampWindow);
  if (block.timestamp < earliest) {
    return state.Invalid(ConsensusError::EARLY_TIMESTAMP, "time-too-old",
                         fmt::format("timestamp {} < median {}", block.timestamp, earliest));
  }

  // Unsigned comparison: timestamps are 64-bit on the wire.
  const uint64_t wall = now > 0 ? static_cast<uint64_t>(now) : 0;
  if (block.timestamp > wall + static_cast<uint64_t>(consensus.nExtremeFutureThreshold)) {
    return state.Invalid(ConsensusError::EXTREME_FUTURE_TIMESTAMP, "time-too-new-extreme",
                         fmt::format("timestamp {} > now {} + {}", block.timestamp, now,
                                     consensus.nExtremeFutureThreshold));
  }
  if (block.timestamp > wall + static_cast<uint64_t>(consensus.nFutureThreshold)) {
    return state.Invalid(ConsensusError::FUTURE_TIMESTAMP, "time-too-new",
                         fmt::format("timestamp {} > now {} + {}", block.timestamp, now, consensus.nFutureThreshold));
  }

  return CheckMinerPayouts(block, static_cast<chain::BlockHeight>(parent.nHeight) + 1, state);
}

int64_t GetAdjustedTime() {
  return util::GetTime();
}

}  // namespace validation
}  // namespace strata
