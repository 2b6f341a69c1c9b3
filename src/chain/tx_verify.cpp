// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/tx_verify.hpp"

#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "chain/consistency.hpp"
#include "chain/ledger_view.hpp"
#include "chain/transaction.hpp"
#include "chain/validation.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/merkle.hpp"
#include "util/hash.hpp"
#include "util/serialize.hpp"

#include <map>
#include <optional>
#include <set>

#include <fmt/format.h>

namespace strata {
namespace consensus {

using validation::ConsensusError;
using validation::ValidationState;

namespace {

// nullopt when the values overflow 256 bits.
std::optional<chain::Currency> SumOutputs(const std::vector<chain::CoinOutput>& outputs) {
  chain::Currency total;
  for (const auto& out : outputs) {
    if (!chain::CheckedAdd(total, out.value))
      return std::nullopt;
  }
  return total;
}

std::string ShortId(const uint256& id) {
  return id.GetHex().substr(0, 16);
}

// Conditions a transaction must satisfy to spend one parent.
struct SignatureRequirement {
  const chain::UnlockConditions* conditions;
  uint64_t remaining;
  std::set<uint64_t> used_keys;
};

bool CheckSignatures(const chain::Transaction& tx, chain::BlockHeight height, ValidationState& state) {
  std::map<uint256, SignatureRequirement> required;
  auto add = [&](const uint256& parent_id, const chain::UnlockConditions& uc) {
    required.emplace(parent_id, SignatureRequirement{&uc, uc.signatures_required, {}});
  };
  for (const auto& in : tx.coin_inputs) {
    add(in.parent_id, in.unlock_conditions);
  }
  for (const auto& in : tx.fund_inputs) {
    add(in.parent_id, in.unlock_conditions);
  }
  for (const auto& rev : tx.file_contract_revisions) {
    add(rev.parent_id, rev.unlock_conditions);
  }

  for (size_t i = 0; i < tx.signatures.size(); ++i) {
    const auto& sig = tx.signatures[i];
    auto it = required.find(sig.parent_id);
    if (it == required.end()) {
      return state.Invalid(ConsensusError::FRIVOLOUS_SIGNATURE, "sig-unknown-parent",
                           fmt::format("signature {} covers unknown parent {}", i, ShortId(sig.parent_id)));
    }
    auto& req = it->second;
    if (req.remaining == 0) {
      return state.Invalid(ConsensusError::FRIVOLOUS_SIGNATURE, "sig-excess",
                           fmt::format("signature {} exceeds the required count", i));
    }
    if (sig.public_key_index >= req.conditions->public_keys.size()) {
      return state.Invalid(ConsensusError::INVALID_SIGNATURE, "sig-bad-key-index",
                           fmt::format("signature {} names key {}", i, sig.public_key_index));
    }
    if (!req.used_keys.insert(sig.public_key_index).second) {
      return state.Invalid(ConsensusError::FRIVOLOUS_SIGNATURE, "sig-key-reused",
                           fmt::format("signature {} reuses key {}", i, sig.public_key_index));
    }
    if (sig.timelock > height) {
      return state.Invalid(ConsensusError::INVALID_SIGNATURE, "sig-premature",
                           fmt::format("signature {} locked until {}", i, sig.timelock));
    }

    const auto& key = req.conditions->public_keys[sig.public_key_index];
    if (key.algorithm != chain::SIGNATURE_ED25519) {
      return state.Invalid(ConsensusError::INVALID_SIGNATURE, "sig-unknown-algorithm",
                           fmt::format("signature {} uses '{}'", i, key.algorithm));
    }
    const uint256 sighash = tx.SigHash(i);
    if (!crypto::VerifyEd25519(key.key, std::span<const uint8_t>(sighash.data(), sighash.size()), sig.signature)) {
      return state.Invalid(ConsensusError::INVALID_SIGNATURE, "sig-verify-failed",
                           fmt::format("signature {} does not verify", i));
    }
    --req.remaining;
  }

  for (const auto& [parent_id, req] : required) {
    if (req.remaining > 0) {
      return state.Invalid(ConsensusError::MISSING_SIGNATURES, "sig-missing",
                           fmt::format("parent {} lacks {} signatures", ShortId(parent_id), req.remaining));
    }
  }
  return true;
}

bool CheckUnlock(const chain::UnlockConditions& uc, const chain::UnlockHash& expected, chain::BlockHeight height,
                 const uint256& parent_id, ValidationState& state) {
  if (uc.GetUnlockHash() != expected) {
    return state.Invalid(ConsensusError::WRONG_UNLOCK_CONDITIONS, "bad-unlock-conditions",
                         fmt::format("conditions do not unlock {}", ShortId(parent_id)));
  }
  if (uc.timelock > height) {
    return state.Invalid(ConsensusError::PREMATURE_UNLOCK, "premature-unlock",
                         fmt::format("{} locked until {}", ShortId(parent_id), uc.timelock));
  }
  return true;
}

bool CheckStorageProof(const chain::StorageProof& sp, const chain::FileContract& fc, const chain::CBlockIndex& parent,
                       ValidationState& state) {
  const chain::BlockHeight parent_height = static_cast<chain::BlockHeight>(parent.nHeight);
  if (parent_height < fc.window_start || parent_height >= fc.window_end) {
    return state.Invalid(ConsensusError::STORAGE_PROOF_TIMING, "proof-outside-window",
                         fmt::format("parent height {} outside [{}, {})", parent_height, fc.window_start,
                                     fc.window_end));
  }

  const chain::CBlockIndex* trigger = parent.GetAncestor(static_cast<int>(fc.window_start) - 1);
  if (!trigger) {
    return state.Error(fmt::format("no trigger block for contract {}", ShortId(sp.parent_id)));
  }

  const uint64_t num_segments = crypto::SegmentCount(fc.file_size);
  const uint64_t index = StorageProofSegment(trigger->GetBlockHash(), sp.parent_id, fc.file_size);
  if (sp.segment.size() > crypto::SEGMENT_SIZE ||
      !crypto::VerifyMerkleProof(fc.file_merkle_root, sp.segment, sp.hash_set, index, num_segments)) {
    return state.Invalid(ConsensusError::INVALID_STORAGE_PROOF, "bad-storage-proof",
                         fmt::format("segment {} of {} does not match contract {}", index, num_segments,
                                     ShortId(sp.parent_id)));
  }
  return true;
}

}  // namespace

bool CheckTransaction(const chain::Transaction& tx, ValidationState& state) {
  for (const auto& out : tx.coin_outputs) {
    if (out.value.IsZero())
      return state.Invalid(ConsensusError::ZERO_OUTPUT, "zero-coin-output");
  }
  for (const auto& out : tx.fund_outputs) {
    if (out.value.IsZero())
      return state.Invalid(ConsensusError::ZERO_OUTPUT, "zero-fund-output");
  }
  for (const auto& fee : tx.miner_fees) {
    if (fee.IsZero())
      return state.Invalid(ConsensusError::ZERO_OUTPUT, "zero-miner-fee");
  }

  if (!tx.storage_proofs.empty() &&
      (!tx.coin_outputs.empty() || !tx.file_contracts.empty() || !tx.file_contract_revisions.empty() ||
       !tx.fund_outputs.empty())) {
    return state.Invalid(ConsensusError::STORAGE_PROOF_RULES, "proof-with-outputs",
                         "storage proofs cannot be combined with new outputs, contracts or revisions");
  }

  std::set<uint256> parents;
  auto claim = [&](const uint256& id) { return parents.insert(id).second; };
  for (const auto& in : tx.coin_inputs) {
    if (!claim(in.parent_id))
      return state.Invalid(ConsensusError::DOUBLE_SPEND, "dup-coin-input", ShortId(in.parent_id));
  }
  for (const auto& rev : tx.file_contract_revisions) {
    if (!claim(rev.parent_id))
      return state.Invalid(ConsensusError::DOUBLE_SPEND, "dup-contract-parent", ShortId(rev.parent_id));
  }
  for (const auto& sp : tx.storage_proofs) {
    if (!claim(sp.parent_id))
      return state.Invalid(ConsensusError::DOUBLE_SPEND, "dup-contract-parent", ShortId(sp.parent_id));
  }
  for (const auto& in : tx.fund_inputs) {
    if (!claim(in.parent_id))
      return state.Invalid(ConsensusError::DOUBLE_SPEND, "dup-fund-input", ShortId(in.parent_id));
  }

  for (size_t i = 0; i < tx.file_contracts.size(); ++i) {
    const auto& fc = tx.file_contracts[i];
    if (fc.payout.IsZero()) {
      return state.Invalid(ConsensusError::BAD_FILE_CONTRACT, "contract-zero-payout", fmt::format("contract {}", i));
    }
    if (fc.window_end <= fc.window_start) {
      return state.Invalid(ConsensusError::BAD_FILE_CONTRACT, "contract-bad-window",
                           fmt::format("contract {} window [{}, {})", i, fc.window_start, fc.window_end));
    }
    const auto valid = SumOutputs(fc.valid_proof_outputs);
    const auto missed = SumOutputs(fc.missed_proof_outputs);
    if (!valid || !missed) {
      return state.Invalid(ConsensusError::VALUE_OVERFLOW, "contract-outputs-overflow", fmt::format("contract {}", i));
    }
    const chain::Currency net = fc.payout - chain::ContractTax(fc.payout);
    if (!(*valid == net) || !(*missed == net)) {
      return state.Invalid(ConsensusError::BAD_FILE_CONTRACT, "contract-bad-outputs",
                           fmt::format("contract {} outputs must total {}", i, net.ToString()));
    }
  }

  for (size_t i = 0; i < tx.file_contract_revisions.size(); ++i) {
    const auto& rev = tx.file_contract_revisions[i];
    if (!SumOutputs(rev.new_valid_proof_outputs) || !SumOutputs(rev.new_missed_proof_outputs)) {
      return state.Invalid(ConsensusError::VALUE_OVERFLOW, "revision-outputs-overflow", fmt::format("revision {}", i));
    }
    if (rev.new_window_end <= rev.new_window_start) {
      return state.Invalid(ConsensusError::BAD_FILE_CONTRACT, "revision-bad-window",
                           fmt::format("revision {} window [{}, {})", i, rev.new_window_start, rev.new_window_end));
    }
  }
  return true;
}

bool ContextualCheckTransaction(const chain::Transaction& tx, const LedgerView& view, const chain::CBlockIndex& parent,
                                const chain::ConsensusParams& params, ValidationState& state) {
  const chain::BlockHeight parent_height = static_cast<chain::BlockHeight>(parent.nHeight);
  const chain::BlockHeight height = parent_height + 1;

  for (size_t i = 0; i < tx.file_contracts.size(); ++i) {
    if (tx.file_contracts[i].window_start <= parent_height) {
      return state.Invalid(ConsensusError::BAD_FILE_CONTRACT, "contract-window-passed",
                           fmt::format("contract {} window starts at {}, parent height {}", i,
                                       tx.file_contracts[i].window_start, parent_height));
    }
  }

  for (const auto& rev : tx.file_contract_revisions) {
    const chain::FileContract* fc = view.GetFileContract(rev.parent_id);
    if (!fc) {
      return state.Invalid(ConsensusError::UNRECOGNIZED_FILE_CONTRACT, "revision-unknown-contract",
                           ShortId(rev.parent_id));
    }
    if (parent_height >= fc->window_start) {
      return state.Invalid(ConsensusError::LATE_REVISION, "revision-too-late",
                           fmt::format("contract {} window opened at {}", ShortId(rev.parent_id), fc->window_start));
    }
    if (rev.new_revision_number <= fc->revision_number) {
      return state.Invalid(ConsensusError::BAD_REVISION_NUMBER, "revision-number-not-increasing",
                           fmt::format("{} <= {}", rev.new_revision_number, fc->revision_number));
    }
    if (!(SumOutputs(rev.new_valid_proof_outputs) == SumOutputs(fc->valid_proof_outputs)) ||
        !(SumOutputs(rev.new_missed_proof_outputs) == SumOutputs(fc->missed_proof_outputs))) {
      return state.Invalid(ConsensusError::REVISION_PAYOUT_MISMATCH, "revision-payout-changed",
                           ShortId(rev.parent_id));
    }
    if (rev.new_window_start <= parent_height) {
      return state.Invalid(ConsensusError::BAD_FILE_CONTRACT, "revision-window-passed",
                           fmt::format("new window starts at {}", rev.new_window_start));
    }
    if (!CheckUnlock(rev.unlock_conditions, fc->unlock_hash, height, rev.parent_id, state))
      return false;
  }

  for (const auto& sp : tx.storage_proofs) {
    const chain::FileContract* fc = view.GetFileContract(sp.parent_id);
    if (!fc) {
      return state.Invalid(ConsensusError::UNRECOGNIZED_FILE_CONTRACT, "proof-unknown-contract", ShortId(sp.parent_id));
    }
    if (!CheckStorageProof(sp, *fc, parent, state))
      return false;
  }

  if (!CheckSignatures(tx, height, state))
    return false;

  chain::Currency coin_in;
  for (const auto& in : tx.coin_inputs) {
    const chain::CoinOutput* out = view.GetCoinOutput(in.parent_id);
    if (!out) {
      return state.Invalid(ConsensusError::MISSING_COIN_OUTPUT, "missing-coin-output", ShortId(in.parent_id));
    }
    if (!CheckUnlock(in.unlock_conditions, out->unlock_hash, height, in.parent_id, state))
      return false;
    if (!chain::CheckedAdd(coin_in, out->value))
      return state.Invalid(ConsensusError::VALUE_OVERFLOW, "coin-inputs-overflow");
  }
  const auto outputs = SumOutputs(tx.coin_outputs);
  const auto fees = tx.TotalMinerFees();
  if (!outputs || !fees)
    return state.Invalid(ConsensusError::VALUE_OVERFLOW, "coin-outputs-overflow");
  chain::Currency coin_out = *outputs;
  bool in_range = chain::CheckedAdd(coin_out, *fees);
  for (const auto& fc : tx.file_contracts) {
    in_range = in_range && chain::CheckedAdd(coin_out, fc.payout);
  }
  if (!in_range)
    return state.Invalid(ConsensusError::VALUE_OVERFLOW, "coin-outputs-overflow");
  if (!(coin_in == coin_out)) {
    return state.Invalid(ConsensusError::COIN_INPUT_OUTPUT_MISMATCH, "coin-input-output-mismatch",
                         fmt::format("inputs {}, outputs {}", coin_in.ToString(), coin_out.ToString()));
  }

  chain::Currency fund_in;
  for (const auto& in : tx.fund_inputs) {
    const chain::FundOutput* out = view.GetFundOutput(in.parent_id);
    if (!out) {
      return state.Invalid(ConsensusError::MISSING_FUND_OUTPUT, "missing-fund-output", ShortId(in.parent_id));
    }
    if (!CheckUnlock(in.unlock_conditions, out->unlock_hash, height, in.parent_id, state))
      return false;
    if (!chain::CheckedAdd(fund_in, out->value))
      return state.Invalid(ConsensusError::VALUE_OVERFLOW, "fund-inputs-overflow");
  }
  chain::Currency fund_out;
  for (const auto& out : tx.fund_outputs) {
    if (!chain::CheckedAdd(fund_out, out.value))
      return state.Invalid(ConsensusError::VALUE_OVERFLOW, "fund-outputs-overflow");
  }
  if (!(fund_in == fund_out)) {
    return state.Invalid(ConsensusError::FUND_INPUT_OUTPUT_MISMATCH, "fund-input-output-mismatch",
                         fmt::format("inputs {}, outputs {}", fund_in.ToString(), fund_out.ToString()));
  }
  return true;
}

void ApplyTransaction(const chain::Transaction& tx, LedgerView& view, chain::BlockHeight height,
                      const chain::ConsensusParams& params) {
  const chain::BlockHeight maturity = height + params.nMaturityDelay;

  for (const auto& in : tx.coin_inputs) {
    view.SpendCoinOutput(in.parent_id);
  }
  for (size_t i = 0; i < tx.coin_outputs.size(); ++i) {
    view.CreateCoinOutput(tx.CoinOutputId(i), tx.coin_outputs[i]);
  }

  for (size_t i = 0; i < tx.file_contracts.size(); ++i) {
    const auto& fc = tx.file_contracts[i];
    view.CreateFileContract(tx.FileContractId(i), fc);
    view.SetFundPool(view.GetFundPool() + chain::ContractTax(fc.payout));
  }

  for (const auto& rev : tx.file_contract_revisions) {
    const chain::FileContract* current = view.GetFileContract(rev.parent_id);
    if (!current) {
      throw ConsistencyFault(fmt::format("revising unknown file contract {}", ShortId(rev.parent_id)));
    }
    chain::FileContract revised = *current;
    revised.file_size = rev.new_file_size;
    revised.file_merkle_root = rev.new_file_merkle_root;
    revised.window_start = rev.new_window_start;
    revised.window_end = rev.new_window_end;
    revised.valid_proof_outputs = rev.new_valid_proof_outputs;
    revised.missed_proof_outputs = rev.new_missed_proof_outputs;
    revised.unlock_hash = rev.new_unlock_hash;
    revised.revision_number = rev.new_revision_number;
    view.RemoveFileContract(rev.parent_id);
    view.CreateFileContract(rev.parent_id, revised);
  }

  for (const auto& sp : tx.storage_proofs) {
    const chain::FileContract* current = view.GetFileContract(sp.parent_id);
    if (!current) {
      throw ConsistencyFault(fmt::format("proving unknown file contract {}", ShortId(sp.parent_id)));
    }
    const chain::FileContract fc = *current;
    for (size_t i = 0; i < fc.valid_proof_outputs.size(); ++i) {
      view.CreateDelayedOutput(maturity, chain::StorageProofOutputId(sp.parent_id, true, i),
                               fc.valid_proof_outputs[i]);
    }
    view.RemoveFileContract(sp.parent_id);
  }

  for (const auto& in : tx.fund_inputs) {
    const chain::FundOutput* current = view.GetFundOutput(in.parent_id);
    if (!current) {
      throw ConsistencyFault(fmt::format("spending unknown fund output {}", ShortId(in.parent_id)));
    }
    chain::CoinOutput claim;
    claim.value = FundClaim(view.GetFundPool(), current->claim_start, current->value);
    claim.unlock_hash = in.claim_unlock_hash;
    view.CreateDelayedOutput(maturity, chain::FundClaimOutputId(in.parent_id), claim);
    view.SpendFundOutput(in.parent_id);
  }
  for (size_t i = 0; i < tx.fund_outputs.size(); ++i) {
    chain::FundOutput out = tx.fund_outputs[i];
    out.claim_start = view.GetFundPool();
    view.CreateFundOutput(tx.FundOutputId(i), out);
  }
}

uint64_t StorageProofSegment(const uint256& trigger_block_id, const uint256& contract_id, uint64_t file_size) {
  util::Encoder enc;
  enc.WriteUint256(trigger_block_id).WriteUint256(contract_id);
  const arith_uint256 seed = UintToArith256(Hash(enc.Data()));
  const arith_uint256 index = seed % arith_uint256(crypto::SegmentCount(file_size));
  return index.GetLow64();
}

chain::Currency FundClaim(const chain::Currency& pool, const chain::Currency& claim_start, const chain::Currency& value) {
  if (pool < claim_start) {
    throw ConsistencyFault(
        fmt::format("fund pool {} below claim start {}", pool.ToString(), claim_start.ToString()));
  }
  return (pool - claim_start) / chain::Currency(chain::FUND_SHARE_COUNT) * value;
}

}  // namespace consensus
}  // namespace strata
