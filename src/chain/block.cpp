// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/block.hpp"

#include "crypto/merkle.hpp"
#include "util/hash.hpp"

#include <fmt/format.h>

namespace strata {
namespace chain {

uint256 Block::MerkleRoot() const {
  std::vector<uint256> leaves;
  leaves.reserve(miner_payouts.size() + transactions.size());
  for (const auto& payout : miner_payouts) {
    util::Encoder enc;
    payout.Encode(enc);
    leaves.push_back(crypto::MerkleLeafHash(enc.Data()));
  }
  for (const auto& tx : transactions) {
    util::Encoder enc;
    tx.Encode(enc);
    leaves.push_back(crypto::MerkleLeafHash(enc.Data()));
  }
  return crypto::MerkleRootFromHashes(leaves);
}

uint256 Block::HeaderHash(const uint256& parent_id, uint64_t nonce, Timestamp timestamp,
                          const uint256& merkle_root) {
  util::Encoder enc;
  enc.WriteUint256(parent_id).WriteU64(nonce).WriteU64(timestamp).WriteUint256(merkle_root);
  return Hash(enc.Data());
}

uint256 Block::GetHash() const {
  return HeaderHash(parent_id, nonce, timestamp, MerkleRoot());
}

uint256 Block::MinerPayoutId(uint64_t index) const {
  util::Encoder enc;
  enc.WriteUint256(GetHash()).WriteU64(index);
  return Hash(enc.Data());
}

std::optional<Currency> Block::TotalMinerPayouts() const {
  Currency total;
  for (const auto& payout : miner_payouts) {
    if (!CheckedAdd(total, payout.value))
      return std::nullopt;
  }
  return total;
}

std::optional<Currency> Block::TotalMinerFees() const {
  Currency total;
  for (const auto& tx : transactions) {
    const auto fees = tx.TotalMinerFees();
    if (!fees || !CheckedAdd(total, *fees))
      return std::nullopt;
  }
  return total;
}

void Block::Encode(util::Encoder& enc) const {
  enc.WriteUint256(parent_id).WriteU64(nonce).WriteU64(timestamp);
  util::EncodeVector(enc, miner_payouts);
  util::EncodeVector(enc, transactions);
}

Block Block::Decode(util::Decoder& dec) {
  Block block;
  block.parent_id = dec.ReadUint256();
  block.nonce = dec.ReadU64();
  block.timestamp = dec.ReadU64();
  block.miner_payouts = util::DecodeVector<CoinOutput>(dec, 64);
  block.transactions = util::DecodeVector<Transaction>(dec, 80);
  return block;
}

std::vector<uint8_t> Block::Serialize() const {
  util::Encoder enc;
  Encode(enc);
  return enc.Release();
}

Block Block::Deserialize(std::span<const uint8_t> data) {
  util::Decoder dec(data);
  Block block = Decode(dec);
  if (!dec.Empty()) {
    throw util::DeserializeError(fmt::format("{} trailing bytes after block", dec.Remaining()));
  }
  return block;
}

size_t Block::SerializedSize() const {
  util::Encoder enc;
  Encode(enc);
  return enc.Size();
}

std::string Block::ToString() const {
  return fmt::format("Block(hash={}, parent={}, time={}, nonce={}, payouts={}, txs={})",
                     GetHash().GetHex().substr(0, 16), parent_id.GetHex().substr(0, 16), timestamp, nonce,
                     miner_payouts.size(), transactions.size());
}

}  // namespace chain
}  // namespace strata
