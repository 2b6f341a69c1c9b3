// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"

#include <cstdint>

namespace strata {
namespace chain {

using Currency = arith_uint256;
using BlockHeight = uint64_t;
using Timestamp = uint64_t;

// Fund shares in existence; fixed at genesis.
constexpr uint64_t FUND_SHARE_COUNT = 10000;

// File contracts pay 3.9% of their payout into the fund pool.
constexpr uint32_t CONTRACT_TAX_NUMERATOR = 39;
constexpr uint32_t CONTRACT_TAX_DENOMINATOR = 1000;

// Block subsidy in whole coins: starts at INITIAL_COINBASE and drops by one
// coin per height until it reaches MINIMUM_COINBASE.
constexpr uint64_t INITIAL_COINBASE = 300000;
constexpr uint64_t MINIMUM_COINBASE = 30000;

// Base units per coin (10^24).
Currency CoinPrecision();

Currency CalculateCoinbase(BlockHeight height);

// Sum of CalculateCoinbase(h) for h in [0, height]: the coin supply a
// consistent ledger holds once the block at |height| is applied.
Currency TotalCoinbase(BlockHeight height);

// Adds |value| to |total| unless the sum leaves the 256-bit range, in which
// case |total| is left untouched and false is returned.
[[nodiscard]] bool CheckedAdd(Currency& total, const Currency& value);

// payout * 39 / 1000, rounded down to a multiple of FUND_SHARE_COUNT so the
// pool always divides evenly among fund shares.
Currency ContractTax(const Currency& payout);

}  // namespace chain
}  // namespace strata
