// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <string>

namespace strata {

namespace chain {
class Block;
class CBlockIndex;
class ChainParams;
}  // namespace chain

namespace validation {

// Outcome of AcceptBlock. Everything except OK is a rejection or a signal;
// the fatal consistency fault is an exception, not a value here.
enum class ConsensusError : uint8_t {
  OK,

  // Known-state signals
  BLOCK_KNOWN,
  NON_EXTENDING_BLOCK,
  DOS_BLOCK,

  // Structural, checked before the block enters the tree
  ORPHAN,
  MISSED_TARGET,
  LARGE_BLOCK,
  EARLY_TIMESTAMP,
  FUTURE_TIMESTAMP,
  EXTREME_FUTURE_TIMESTAMP,
  BAD_MINER_PAYOUTS,

  // Full validation against the ledger
  COIN_INPUT_OUTPUT_MISMATCH,
  FUND_INPUT_OUTPUT_MISMATCH,
  MISSING_COIN_OUTPUT,
  MISSING_FUND_OUTPUT,
  DOUBLE_SPEND,
  ZERO_OUTPUT,
  WRONG_UNLOCK_CONDITIONS,
  PREMATURE_UNLOCK,
  INVALID_SIGNATURE,
  MISSING_SIGNATURES,
  FRIVOLOUS_SIGNATURE,
  BAD_FILE_CONTRACT,
  UNRECOGNIZED_FILE_CONTRACT,
  BAD_REVISION_NUMBER,
  LATE_REVISION,
  REVISION_PAYOUT_MISMATCH,
  INVALID_STORAGE_PROOF,
  STORAGE_PROOF_TIMING,
  STORAGE_PROOF_RULES,
  VALUE_OVERFLOW,
};

std::string ConsensusErrorString(ConsensusError error);

// ValidationState - Result of a validation step with a reason for failure.
class ValidationState {
public:
  enum class Mode {
    VALID,
    INVALID,  // Block or transaction breaks a consensus rule
    ERROR,    // Failure not attributable to the block
  };

  bool Invalid(ConsensusError error, const std::string& reject_reason, const std::string& debug_message = "") {
    mode_ = Mode::INVALID;
    error_ = error;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string& reject_reason) {
    mode_ = Mode::ERROR;
    reject_reason_ = reject_reason;
    return false;
  }

  bool IsValid() const { return mode_ == Mode::VALID; }
  bool IsInvalid() const { return mode_ == Mode::INVALID; }
  bool IsError() const { return mode_ == Mode::ERROR; }

  ConsensusError GetError() const { return error_; }
  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Mode mode_{Mode::VALID};
  ConsensusError error_{ConsensusError::OK};
  std::string reject_reason_;
  std::string debug_message_;
};

// Payouts must be non-zero and sum to coinbase(height) plus the miner fees
// of every transaction.
bool CheckMinerPayouts(const chain::Block& block, chain::BlockHeight height, ValidationState& state);

/**
 * Checks that need only the block and its parent node, in order: proof of
 * work against the parent's child target, serialized size, earliest
 * timestamp, extreme-future and future timestamps, miner payouts.
 *
 * |now| is the current wall-clock time (GetAdjustedTime()).
 */
bool ContextualCheckBlock(const chain::Block& block, const uint256& hash, const chain::CBlockIndex& parent,
                          const chain::ChainParams& params, int64_t now, ValidationState& state);

// Wall-clock time used for future-timestamp checks. Mockable.
int64_t GetAdjustedTime();

}  // namespace validation
}  // namespace strata
