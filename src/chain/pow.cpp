// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/pow.hpp"

#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"

namespace strata {
namespace consensus {

arith_uint256 CalculateChildTarget(const chain::CBlockIndex& node, const chain::ConsensusParams& params) {
  const arith_uint256 pow_limit = UintToArith256(params.powLimit);
  if (node.pprev == nullptr)
    return pow_limit;

  const arith_uint256& parent_target = node.pprev->nChildTarget;
  const int window = static_cast<int>(params.nTargetWindow);

  const chain::CBlockIndex* reference = nullptr;
  int64_t expected = 0;
  if (node.nHeight < window) {
    reference = node.GetAncestor(0);
    expected = static_cast<int64_t>(node.nHeight) * params.nBlockFrequency;
  } else {
    reference = node.GetAncestor(node.nHeight - window);
    expected = static_cast<int64_t>(window) * params.nBlockFrequency;
  }
  const int64_t actual = static_cast<int64_t>(node.GetBlockTime()) - static_cast<int64_t>(reference->GetBlockTime());

  const int64_t den = static_cast<int64_t>(params.nMaxAdjustmentDen);
  const arith_uint256 step = parent_target / arith_uint256(params.nMaxAdjustmentDen);

  arith_uint256 target;
  if (actual * den >= expected * static_cast<int64_t>(params.nMaxAdjustmentUpNum)) {
    target = parent_target + step;
  } else if (actual * den <= expected * static_cast<int64_t>(params.nMaxAdjustmentDownNum)) {
    target = parent_target - step;
  } else {
    // |actual - expected| < expected / 10000 here, so this stays within a step.
    const arith_uint256 per_second = parent_target / arith_uint256(static_cast<uint64_t>(expected));
    if (actual >= expected) {
      target = parent_target + per_second * arith_uint256(static_cast<uint64_t>(actual - expected));
    } else {
      target = parent_target - per_second * arith_uint256(static_cast<uint64_t>(expected - actual));
    }
  }

  if (target > pow_limit)
    target = pow_limit;
  return target;
}

bool CheckProofOfWork(const uint256& block_hash, const arith_uint256& target) noexcept {
  return UintToArith256(block_hash) <= target;
}

double GetDifficulty(const arith_uint256& target, const chain::ConsensusParams& params) {
  if (target.IsZero())
    return 0.0;
  return UintToArith256(params.powLimit).getdouble() / target.getdouble();
}

}  // namespace consensus
}  // namespace strata
