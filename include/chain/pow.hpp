// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

namespace strata {

namespace chain {
class CBlockIndex;
struct ConsensusParams;
}  // namespace chain

namespace consensus {

/**
 * Target the children of |node| must meet.
 *
 * The parent's child target is scaled by actual/expected timespan over the
 * last nTargetWindow blocks (from genesis while the chain is shorter),
 * clamped to a change of at most one part in ten thousand per block, and
 * never eased beyond powLimit. Genesis children get powLimit.
 */
arith_uint256 CalculateChildTarget(const chain::CBlockIndex& node, const chain::ConsensusParams& params);

// A block id meets |target| when, read as a big-endian number, it does not
// exceed the target.
bool CheckProofOfWork(const uint256& block_hash, const arith_uint256& target) noexcept;

// powLimit / target, for logging.
double GetDifficulty(const arith_uint256& target, const chain::ConsensusParams& params);

}  // namespace consensus
}  // namespace strata
