// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/diff_engine.hpp"

#include "chain/block.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "chain/ledger_view.hpp"
#include "chain/transaction.hpp"
#include "chain/tx_verify.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

namespace strata {
namespace consensus {

namespace {

// Everything a block does to the ledger after its transactions.
void ApplyMaintenance(const chain::Block& block, chain::BlockHeight height, LedgerView& view,
                      const chain::ConsensusParams& params) {
  const chain::BlockHeight maturity = height + params.nMaturityDelay;

  for (const auto& [id, output] : view.GetDelayedOutputs(height)) {
    view.RemoveDelayedOutput(height, id);
    view.CreateCoinOutput(id, output);
  }

  for (const auto& contract_id : view.ContractsExpiringAt(height)) {
    const chain::FileContract fc = *view.GetFileContract(contract_id);
    for (size_t i = 0; i < fc.missed_proof_outputs.size(); ++i) {
      view.CreateDelayedOutput(maturity, chain::StorageProofOutputId(contract_id, false, i),
                               fc.missed_proof_outputs[i]);
    }
    view.RemoveFileContract(contract_id);
    LOG_CONSENSUS_DEBUG("Contract {} missed its proof window at height {}", contract_id.GetHex().substr(0, 16), height);
  }

  for (size_t i = 0; i < block.miner_payouts.size(); ++i) {
    view.CreateDelayedOutput(maturity, block.MinerPayoutId(i), block.miner_payouts[i]);
  }
}

}  // namespace

bool ComputeBlockDiffs(const chain::CBlockIndex& node, const LedgerState& ledger, const chain::ConsensusParams& params,
                       BlockDiffs& out, validation::ValidationState& state) {
  if (!node.pprev) {
    return state.Error("block diffs requested for a node without parent");
  }
  const chain::CBlockIndex& parent = *node.pprev;
  const chain::BlockHeight height = static_cast<chain::BlockHeight>(node.nHeight);

  LedgerView view(ledger);
  for (size_t i = 0; i < node.block.transactions.size(); ++i) {
    const auto& tx = node.block.transactions[i];
    if (!CheckTransaction(tx, state) || !ContextualCheckTransaction(tx, view, parent, params, state)) {
      LOG_CONSENSUS_DEBUG("Transaction {} of block {} rejected: {}", i, node.GetBlockHash().GetHex().substr(0, 16),
                          state.ToString());
      return false;
    }
    ApplyTransaction(tx, view, height, params);
  }

  ApplyMaintenance(node.block, height, view, params);
  out = view.TakeDiffs();
  return true;
}

BlockDiffs ComputeGenesisDiffs(const chain::Block& genesis, const chain::ConsensusParams& params) {
  LedgerState empty;
  LedgerView view(empty);
  for (const auto& tx : genesis.transactions) {
    ApplyTransaction(tx, view, 0, params);
  }
  ApplyMaintenance(genesis, 0, view, params);
  return view.TakeDiffs();
}

}  // namespace consensus
}  // namespace strata
