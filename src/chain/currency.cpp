// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/currency.hpp"

namespace strata {
namespace chain {

Currency CoinPrecision() {
  static const Currency precision = [] {
    Currency p = 1;
    for (int i = 0; i < 24; ++i) {
      p *= 10;
    }
    return p;
  }();
  return precision;
}

Currency CalculateCoinbase(BlockHeight height) {
  uint64_t coins = MINIMUM_COINBASE;
  if (height < INITIAL_COINBASE - MINIMUM_COINBASE) {
    coins = INITIAL_COINBASE - height;
  }
  return Currency(coins) * CoinPrecision();
}

Currency TotalCoinbase(BlockHeight height) {
  constexpr uint64_t decay_end = INITIAL_COINBASE - MINIMUM_COINBASE;

  // Decaying part: heights [0, min(height, decay_end)].
  const uint64_t last = height < decay_end ? height : decay_end;
  const Currency n = Currency(last) + 1;
  Currency coins = n * Currency(INITIAL_COINBASE) - (Currency(last) * n) / Currency(2);

  if (height > decay_end) {
    coins += Currency(height - decay_end) * Currency(MINIMUM_COINBASE);
  }
  return coins * CoinPrecision();
}

bool CheckedAdd(Currency& total, const Currency& value) {
  const Currency sum = total + value;
  if (sum < total)
    return false;
  total = sum;
  return true;
}

Currency ContractTax(const Currency& payout) {
  Currency tax = payout * CONTRACT_TAX_NUMERATOR / Currency(CONTRACT_TAX_DENOMINATOR);
  return tax - tax % Currency(FUND_SHARE_COUNT);
}

}  // namespace chain
}  // namespace strata
