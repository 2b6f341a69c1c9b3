// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "chain/transaction.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace strata {
namespace chain {

/**
 * A block. Its identity is the hash of (parent_id, nonce, timestamp,
 * merkle root over payouts and transactions); the same id is what the
 * proof-of-work target is checked against.
 */
class Block {
public:
  uint256 parent_id;
  uint64_t nonce{0};
  Timestamp timestamp{0};
  std::vector<CoinOutput> miner_payouts;
  std::vector<Transaction> transactions;

  uint256 GetHash() const;
  uint256 MerkleRoot() const;

  // Block id for a given merkle root; lets a nonce search hash the
  // transactions only once.
  static uint256 HeaderHash(const uint256& parent_id, uint64_t nonce, Timestamp timestamp,
                            const uint256& merkle_root);

  uint256 MinerPayoutId(uint64_t index) const;

  // Both return nullopt when the sum overflows 256 bits.
  std::optional<Currency> TotalMinerPayouts() const;
  std::optional<Currency> TotalMinerFees() const;

  size_t SerializedSize() const;
  std::vector<uint8_t> Serialize() const;
  // Throws util::DeserializeError on malformed or trailing data.
  static Block Deserialize(std::span<const uint8_t> data);

  void Encode(util::Encoder& enc) const;
  static Block Decode(util::Decoder& dec);

  std::string ToString() const;
};

}  // namespace chain
}  // namespace strata
