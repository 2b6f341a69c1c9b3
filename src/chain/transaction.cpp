// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/transaction.hpp"

#include "crypto/merkle.hpp"
#include "util/hash.hpp"

#include <array>
#include <cstring>

namespace strata {
namespace chain {

namespace {

using util::Decoder;
using util::DecodeVector;
using util::Encoder;
using util::EncodeVector;

// Id derivations are separated by a 16-byte zero-padded tag.
using Specifier = std::array<uint8_t, 16>;

constexpr Specifier MakeSpecifier(const char* name) {
  Specifier s{};
  for (size_t i = 0; i < s.size() && name[i] != '\0'; ++i) {
    s[i] = static_cast<uint8_t>(name[i]);
  }
  return s;
}

constexpr Specifier SPECIFIER_COIN_OUTPUT = MakeSpecifier("coin output");
constexpr Specifier SPECIFIER_FILE_CONTRACT = MakeSpecifier("file contract");
constexpr Specifier SPECIFIER_FUND_OUTPUT = MakeSpecifier("fund output");
constexpr Specifier SPECIFIER_PROOF_OUTPUT = MakeSpecifier("proof output");
constexpr Specifier SPECIFIER_CLAIM_OUTPUT = MakeSpecifier("claim output");

uint256 DeriveId(const Specifier& specifier, const uint256& parent, uint64_t index) {
  Encoder enc;
  enc.WriteRaw(specifier).WriteUint256(parent).WriteU64(index);
  return Hash(enc.Data());
}

void EncodeCurrencies(Encoder& enc, const std::vector<Currency>& values) {
  enc.WriteU64(values.size());
  for (const auto& v : values) {
    enc.WriteArith(v);
  }
}

std::vector<Currency> DecodeCurrencies(Decoder& dec) {
  const uint64_t n = dec.ReadLength(32);
  std::vector<Currency> out;
  out.reserve(n);
  for (uint64_t i = 0; i < n; ++i) {
    out.push_back(dec.ReadArith());
  }
  return out;
}

}  // namespace

void PublicKey::Encode(Encoder& enc) const {
  enc.WriteString(algorithm).WriteBytes(key);
}

PublicKey PublicKey::Decode(Decoder& dec) {
  PublicKey pk;
  pk.algorithm = dec.ReadString();
  pk.key = dec.ReadBytes();
  return pk;
}

void UnlockConditions::Encode(Encoder& enc) const {
  enc.WriteU64(timelock);
  EncodeVector(enc, public_keys);
  enc.WriteU64(signatures_required);
}

UnlockConditions UnlockConditions::Decode(Decoder& dec) {
  UnlockConditions uc;
  uc.timelock = dec.ReadU64();
  uc.public_keys = DecodeVector<PublicKey>(dec, 16);
  uc.signatures_required = dec.ReadU64();
  return uc;
}

UnlockHash UnlockConditions::GetUnlockHash() const {
  std::vector<std::vector<uint8_t>> leaves;
  leaves.push_back(Encoder().WriteU64(timelock).Release());
  for (const auto& pk : public_keys) {
    Encoder enc;
    pk.Encode(enc);
    leaves.push_back(enc.Release());
  }
  leaves.push_back(Encoder().WriteU64(signatures_required).Release());
  return crypto::MerkleRoot(leaves);
}

void CoinOutput::Encode(Encoder& enc) const {
  enc.WriteArith(value).WriteUint256(unlock_hash);
}

CoinOutput CoinOutput::Decode(Decoder& dec) {
  CoinOutput out;
  out.value = dec.ReadArith();
  out.unlock_hash = dec.ReadUint256();
  return out;
}

void CoinInput::Encode(Encoder& enc) const {
  enc.WriteUint256(parent_id);
  unlock_conditions.Encode(enc);
}

CoinInput CoinInput::Decode(Decoder& dec) {
  CoinInput in;
  in.parent_id = dec.ReadUint256();
  in.unlock_conditions = UnlockConditions::Decode(dec);
  return in;
}

void FundOutput::Encode(Encoder& enc) const {
  enc.WriteArith(value).WriteUint256(unlock_hash).WriteArith(claim_start);
}

FundOutput FundOutput::Decode(Decoder& dec) {
  FundOutput out;
  out.value = dec.ReadArith();
  out.unlock_hash = dec.ReadUint256();
  out.claim_start = dec.ReadArith();
  return out;
}

void FundInput::Encode(Encoder& enc) const {
  enc.WriteUint256(parent_id);
  unlock_conditions.Encode(enc);
  enc.WriteUint256(claim_unlock_hash);
}

FundInput FundInput::Decode(Decoder& dec) {
  FundInput in;
  in.parent_id = dec.ReadUint256();
  in.unlock_conditions = UnlockConditions::Decode(dec);
  in.claim_unlock_hash = dec.ReadUint256();
  return in;
}

void FileContract::Encode(Encoder& enc) const {
  enc.WriteU64(file_size).WriteUint256(file_merkle_root).WriteU64(window_start).WriteU64(window_end);
  enc.WriteArith(payout);
  EncodeVector(enc, valid_proof_outputs);
  EncodeVector(enc, missed_proof_outputs);
  enc.WriteUint256(unlock_hash).WriteU64(revision_number);
}

FileContract FileContract::Decode(Decoder& dec) {
  FileContract fc;
  fc.file_size = dec.ReadU64();
  fc.file_merkle_root = dec.ReadUint256();
  fc.window_start = dec.ReadU64();
  fc.window_end = dec.ReadU64();
  fc.payout = dec.ReadArith();
  fc.valid_proof_outputs = DecodeVector<CoinOutput>(dec, 64);
  fc.missed_proof_outputs = DecodeVector<CoinOutput>(dec, 64);
  fc.unlock_hash = dec.ReadUint256();
  fc.revision_number = dec.ReadU64();
  return fc;
}

void FileContractRevision::Encode(Encoder& enc) const {
  enc.WriteUint256(parent_id);
  unlock_conditions.Encode(enc);
  enc.WriteU64(new_revision_number).WriteU64(new_file_size).WriteUint256(new_file_merkle_root);
  enc.WriteU64(new_window_start).WriteU64(new_window_end);
  EncodeVector(enc, new_valid_proof_outputs);
  EncodeVector(enc, new_missed_proof_outputs);
  enc.WriteUint256(new_unlock_hash);
}

FileContractRevision FileContractRevision::Decode(Decoder& dec) {
  FileContractRevision rev;
  rev.parent_id = dec.ReadUint256();
  rev.unlock_conditions = UnlockConditions::Decode(dec);
  rev.new_revision_number = dec.ReadU64();
  rev.new_file_size = dec.ReadU64();
  rev.new_file_merkle_root = dec.ReadUint256();
  rev.new_window_start = dec.ReadU64();
  rev.new_window_end = dec.ReadU64();
  rev.new_valid_proof_outputs = DecodeVector<CoinOutput>(dec, 64);
  rev.new_missed_proof_outputs = DecodeVector<CoinOutput>(dec, 64);
  rev.new_unlock_hash = dec.ReadUint256();
  return rev;
}

void StorageProof::Encode(Encoder& enc) const {
  enc.WriteUint256(parent_id).WriteBytes(segment);
  enc.WriteU64(hash_set.size());
  for (const auto& h : hash_set) {
    enc.WriteUint256(h);
  }
}

StorageProof StorageProof::Decode(Decoder& dec) {
  StorageProof sp;
  sp.parent_id = dec.ReadUint256();
  sp.segment = dec.ReadBytes();
  const uint64_t n = dec.ReadLength(32);
  sp.hash_set.reserve(n);
  for (uint64_t i = 0; i < n; ++i) {
    sp.hash_set.push_back(dec.ReadUint256());
  }
  return sp;
}

void TransactionSignature::Encode(Encoder& enc) const {
  enc.WriteUint256(parent_id).WriteU64(public_key_index).WriteU64(timelock).WriteBytes(signature);
}

TransactionSignature TransactionSignature::Decode(Decoder& dec) {
  TransactionSignature sig;
  sig.parent_id = dec.ReadUint256();
  sig.public_key_index = dec.ReadU64();
  sig.timelock = dec.ReadU64();
  sig.signature = dec.ReadBytes();
  return sig;
}

void Transaction::EncodeUnsigned(Encoder& enc) const {
  EncodeVector(enc, coin_inputs);
  EncodeVector(enc, coin_outputs);
  EncodeVector(enc, file_contracts);
  EncodeVector(enc, file_contract_revisions);
  EncodeVector(enc, storage_proofs);
  EncodeVector(enc, fund_inputs);
  EncodeVector(enc, fund_outputs);
  EncodeCurrencies(enc, miner_fees);
  enc.WriteU64(arbitrary_data.size());
  for (const auto& data : arbitrary_data) {
    enc.WriteBytes(data);
  }
}

void Transaction::Encode(Encoder& enc) const {
  EncodeUnsigned(enc);
  EncodeVector(enc, signatures);
}

Transaction Transaction::Decode(Decoder& dec) {
  Transaction tx;
  tx.coin_inputs = DecodeVector<CoinInput>(dec, 56);
  tx.coin_outputs = DecodeVector<CoinOutput>(dec, 64);
  tx.file_contracts = DecodeVector<FileContract>(dec, 144);
  tx.file_contract_revisions = DecodeVector<FileContractRevision>(dec, 160);
  tx.storage_proofs = DecodeVector<StorageProof>(dec, 48);
  tx.fund_inputs = DecodeVector<FundInput>(dec, 88);
  tx.fund_outputs = DecodeVector<FundOutput>(dec, 96);
  tx.miner_fees = DecodeCurrencies(dec);
  const uint64_t n = dec.ReadLength(8);
  tx.arbitrary_data.reserve(n);
  for (uint64_t i = 0; i < n; ++i) {
    tx.arbitrary_data.push_back(dec.ReadBytes());
  }
  tx.signatures = DecodeVector<TransactionSignature>(dec, 56);
  return tx;
}

uint256 Transaction::GetId() const {
  Encoder enc;
  EncodeUnsigned(enc);
  return Hash(enc.Data());
}

uint256 Transaction::CoinOutputId(uint64_t index) const {
  return DeriveId(SPECIFIER_COIN_OUTPUT, GetId(), index);
}

uint256 Transaction::FileContractId(uint64_t index) const {
  return DeriveId(SPECIFIER_FILE_CONTRACT, GetId(), index);
}

uint256 Transaction::FundOutputId(uint64_t index) const {
  return DeriveId(SPECIFIER_FUND_OUTPUT, GetId(), index);
}

uint256 Transaction::SigHash(uint64_t sig_index) const {
  const TransactionSignature& sig = signatures.at(sig_index);
  Encoder enc;
  enc.WriteUint256(GetId()).WriteUint256(sig.parent_id).WriteU64(sig.public_key_index).WriteU64(sig.timelock);
  return Hash(enc.Data());
}

std::optional<Currency> Transaction::TotalMinerFees() const {
  Currency total;
  for (const auto& fee : miner_fees) {
    if (!CheckedAdd(total, fee))
      return std::nullopt;
  }
  return total;
}

uint256 StorageProofOutputId(const uint256& contract_id, bool proof_valid, uint64_t index) {
  Encoder enc;
  enc.WriteRaw(SPECIFIER_PROOF_OUTPUT).WriteUint256(contract_id).WriteBool(proof_valid).WriteU64(index);
  return Hash(enc.Data());
}

uint256 FundClaimOutputId(const uint256& fund_output_id) {
  return DeriveId(SPECIFIER_CLAIM_OUTPUT, fund_output_id, 0);
}

}  // namespace chain
}  // namespace strata
