// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency.hpp"
#include "util/serialize.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace chain {

using UnlockHash = uint256;

inline const std::string SIGNATURE_ED25519 = "ed25519";

struct PublicKey {
  std::string algorithm;
  std::vector<uint8_t> key;

  void Encode(util::Encoder& enc) const;
  static PublicKey Decode(util::Decoder& dec);
  friend bool operator==(const PublicKey&, const PublicKey&) = default;
};

/**
 * Spend conditions. An output is locked to the unlock hash of its conditions
 * and the spender reveals the full conditions. Default-constructed conditions
 * need no signatures, so outputs locked to their hash are spendable by anyone.
 */
struct UnlockConditions {
  BlockHeight timelock{0};
  std::vector<PublicKey> public_keys;
  uint64_t signatures_required{0};

  UnlockHash GetUnlockHash() const;

  void Encode(util::Encoder& enc) const;
  static UnlockConditions Decode(util::Decoder& dec);
  friend bool operator==(const UnlockConditions&, const UnlockConditions&) = default;
};

struct CoinOutput {
  Currency value;
  UnlockHash unlock_hash;

  void Encode(util::Encoder& enc) const;
  static CoinOutput Decode(util::Decoder& dec);
  friend bool operator==(const CoinOutput&, const CoinOutput&) = default;
};

struct CoinInput {
  uint256 parent_id;
  UnlockConditions unlock_conditions;

  void Encode(util::Encoder& enc) const;
  static CoinInput Decode(util::Decoder& dec);
};

struct FundOutput {
  Currency value;
  UnlockHash unlock_hash;
  // Fund pool level when the output was created. Assigned by consensus; the
  // value carried in a transaction is ignored.
  Currency claim_start;

  void Encode(util::Encoder& enc) const;
  static FundOutput Decode(util::Decoder& dec);
  friend bool operator==(const FundOutput&, const FundOutput&) = default;
};

struct FundInput {
  uint256 parent_id;
  UnlockConditions unlock_conditions;
  // Receives the pool claim accumulated by the spent output.
  UnlockHash claim_unlock_hash;

  void Encode(util::Encoder& enc) const;
  static FundInput Decode(util::Decoder& dec);
};

struct FileContract {
  uint64_t file_size{0};
  uint256 file_merkle_root;
  BlockHeight window_start{0};
  BlockHeight window_end{0};
  Currency payout;
  std::vector<CoinOutput> valid_proof_outputs;
  std::vector<CoinOutput> missed_proof_outputs;
  UnlockHash unlock_hash;
  uint64_t revision_number{0};

  void Encode(util::Encoder& enc) const;
  static FileContract Decode(util::Decoder& dec);
  friend bool operator==(const FileContract&, const FileContract&) = default;
};

struct FileContractRevision {
  uint256 parent_id;
  UnlockConditions unlock_conditions;
  uint64_t new_revision_number{0};
  uint64_t new_file_size{0};
  uint256 new_file_merkle_root;
  BlockHeight new_window_start{0};
  BlockHeight new_window_end{0};
  std::vector<CoinOutput> new_valid_proof_outputs;
  std::vector<CoinOutput> new_missed_proof_outputs;
  UnlockHash new_unlock_hash;

  void Encode(util::Encoder& enc) const;
  static FileContractRevision Decode(util::Decoder& dec);
};

struct StorageProof {
  uint256 parent_id;
  std::vector<uint8_t> segment;
  std::vector<uint256> hash_set;

  void Encode(util::Encoder& enc) const;
  static StorageProof Decode(util::Decoder& dec);
};

struct TransactionSignature {
  uint256 parent_id;
  uint64_t public_key_index{0};
  BlockHeight timelock{0};
  std::vector<uint8_t> signature;

  void Encode(util::Encoder& enc) const;
  static TransactionSignature Decode(util::Decoder& dec);
};

class Transaction {
public:
  std::vector<CoinInput> coin_inputs;
  std::vector<CoinOutput> coin_outputs;
  std::vector<FileContract> file_contracts;
  std::vector<FileContractRevision> file_contract_revisions;
  std::vector<StorageProof> storage_proofs;
  std::vector<FundInput> fund_inputs;
  std::vector<FundOutput> fund_outputs;
  std::vector<Currency> miner_fees;
  std::vector<std::vector<uint8_t>> arbitrary_data;
  std::vector<TransactionSignature> signatures;

  // Hash of every field except the signatures.
  uint256 GetId() const;

  uint256 CoinOutputId(uint64_t index) const;
  uint256 FileContractId(uint64_t index) const;
  uint256 FundOutputId(uint64_t index) const;

  // Message signed by signatures[sig_index].
  uint256 SigHash(uint64_t sig_index) const;

  // nullopt when the fees overflow 256 bits.
  std::optional<Currency> TotalMinerFees() const;

  void Encode(util::Encoder& enc) const;
  static Transaction Decode(util::Decoder& dec);

private:
  void EncodeUnsigned(util::Encoder& enc) const;
};

// Outputs created by a resolved storage contract.
uint256 StorageProofOutputId(const uint256& contract_id, bool proof_valid, uint64_t index);

// Delayed output holding the pool claim of a spent fund output.
uint256 FundClaimOutputId(const uint256& fund_output_id);

}  // namespace chain
}  // namespace strata
