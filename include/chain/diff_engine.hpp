// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/diff.hpp"

namespace strata {

namespace chain {
class Block;
class CBlockIndex;
struct ConsensusParams;
}  // namespace chain

namespace validation {
class ValidationState;
}

namespace consensus {

class LedgerState;

/**
 * Validates every transaction of |node|'s block against |ledger| and
 * produces the diffs that move the ledger from the parent's state to the
 * node's state. |ledger| must currently reflect node.pprev and is not
 * modified.
 *
 * Effects are recorded in this order: transactions, maturing delayed
 * outputs, contracts whose proof window closes at this height, miner
 * payouts.
 *
 * Returns false with |state| set when a transaction is rejected.
 */
bool ComputeBlockDiffs(const chain::CBlockIndex& node, const LedgerState& ledger, const chain::ConsensusParams& params,
                       BlockDiffs& out, validation::ValidationState& state);

// Diffs that build the genesis ledger from an empty one. Genesis is not
// validated.
BlockDiffs ComputeGenesisDiffs(const chain::Block& genesis, const chain::ConsensusParams& params);

}  // namespace consensus
}  // namespace strata
