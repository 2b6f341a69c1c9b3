// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "util/uint.hpp"

#include <cstdint>

namespace strata {

namespace chain {
class CBlockIndex;
struct ConsensusParams;
class Transaction;
}  // namespace chain

namespace validation {
class ValidationState;
}

namespace consensus {

class LedgerView;

// Rules that need nothing but the transaction: no zero outputs or fees, no
// parent id used twice, storage proofs travel alone, contract and revision
// shapes.
bool CheckTransaction(const chain::Transaction& tx, validation::ValidationState& state);

/**
 * Rules checked against the ledger as it stands after every earlier
 * transaction of the same block. |parent| is the node the block extends; the
 * block itself sits at parent.nHeight + 1.
 *
 * Covers signatures, spent outputs and their unlock conditions, coin and
 * fund balance, contract windows, revisions and storage proofs.
 */
bool ContextualCheckTransaction(const chain::Transaction& tx, const LedgerView& view, const chain::CBlockIndex& parent,
                                const chain::ConsensusParams& params, validation::ValidationState& state);

// Records the effects of a valid transaction in |view|. |height| is the
// height of the block carrying it.
void ApplyTransaction(const chain::Transaction& tx, LedgerView& view, chain::BlockHeight height,
                      const chain::ConsensusParams& params);

// Index of the file segment a storage proof must cover.
uint64_t StorageProofSegment(const uint256& trigger_block_id, const uint256& contract_id, uint64_t file_size);

// Value a fund output can claim from a pool of |pool|.
chain::Currency FundClaim(const chain::Currency& pool, const chain::Currency& claim_start, const chain::Currency& value);

}  // namespace consensus
}  // namespace strata
