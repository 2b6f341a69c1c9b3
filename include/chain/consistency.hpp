// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"

#include <stdexcept>
#include <string>

namespace strata {
namespace consensus {

class LedgerState;

/**
 * The ledger no longer matches what the applied blocks imply.
 *
 * Raised by the ledger and the consistency checker. It reports a defect in
 * the engine rather than bad input, so nothing inside the library catches
 * it: the owning process is expected to stop.
 */
class ConsistencyFault : public std::logic_error {
public:
  explicit ConsistencyFault(const std::string& what) : std::logic_error(what) {}
};

// Coins held by the ledger: unspent outputs, delayed outputs, open contract
// payouts net of tax, and fund pool value not yet claimed by fund outputs.
// Throws ConsistencyFault if the total overflows 256 bits.
chain::Currency CirculatingCoins(const LedgerState& ledger);

// Throws ConsistencyFault unless the ledger holds exactly the coinbase
// issued through |height|, and the fund outputs sum to FUND_SHARE_COUNT.
void CheckLedgerConsistency(const LedgerState& ledger, chain::BlockHeight height);

}  // namespace consensus
}  // namespace strata
