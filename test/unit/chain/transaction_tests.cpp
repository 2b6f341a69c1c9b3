// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license
// Unit tests for chain/transaction.cpp, chain/block.cpp and chain/currency.cpp

#include "chain/block.hpp"
#include "chain/currency.hpp"
#include "chain/transaction.hpp"
#include "util/serialize.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace strata;
using namespace strata::chain;

namespace {

uint256 MakeId(uint8_t tag) {
    uint256 id;
    id.data()[0] = tag;
    return id;
}

Transaction SampleTransaction() {
    Transaction tx;
    UnlockConditions uc;
    uc.public_keys.push_back(PublicKey{SIGNATURE_ED25519, std::vector<uint8_t>(32, 0x11)});
    uc.signatures_required = 1;
    tx.coin_inputs.push_back(CoinInput{MakeId(1), uc});
    tx.coin_outputs.push_back(CoinOutput{Currency(500), MakeId(2)});
    tx.coin_outputs.push_back(CoinOutput{Currency(300), MakeId(3)});
    FileContract fc;
    fc.file_size = 128;
    fc.window_start = 10;
    fc.window_end = 20;
    fc.payout = Currency(1000000);
    fc.valid_proof_outputs.push_back(CoinOutput{Currency(970000), MakeId(4)});
    fc.missed_proof_outputs.push_back(CoinOutput{Currency(970000), MakeId(5)});
    tx.file_contracts.push_back(fc);
    tx.miner_fees.push_back(Currency(7));
    tx.arbitrary_data.push_back({'h', 'i'});
    return tx;
}

}  // namespace

TEST_CASE("Transaction - id ignores signatures", "[transaction]") {
    Transaction tx = SampleTransaction();
    const uint256 before = tx.GetId();
    tx.signatures.push_back(TransactionSignature{MakeId(1), 0, 0, std::vector<uint8_t>(64, 0xaa)});
    CHECK(tx.GetId() == before);

    tx.coin_outputs[0].value = Currency(501);
    CHECK(tx.GetId() != before);
}

TEST_CASE("Transaction - derived ids are distinct", "[transaction]") {
    const Transaction tx = SampleTransaction();
    CHECK(tx.CoinOutputId(0) != tx.CoinOutputId(1));
    CHECK(tx.CoinOutputId(0) != tx.FileContractId(0));
    CHECK(tx.CoinOutputId(0) != tx.FundOutputId(0));
    CHECK(tx.FileContractId(0) != tx.FundOutputId(0));

    const uint256 contract = tx.FileContractId(0);
    CHECK(StorageProofOutputId(contract, true, 0) != StorageProofOutputId(contract, false, 0));
    CHECK(StorageProofOutputId(contract, true, 0) != StorageProofOutputId(contract, true, 1));
    CHECK(FundClaimOutputId(tx.FundOutputId(0)) != tx.FundOutputId(0));
}

TEST_CASE("Transaction - sighash binds signature fields", "[transaction]") {
    Transaction tx = SampleTransaction();
    tx.signatures.push_back(TransactionSignature{MakeId(1), 0, 0, {}});
    tx.signatures.push_back(TransactionSignature{MakeId(1), 1, 0, {}});
    CHECK(tx.SigHash(0) != tx.SigHash(1));

    const uint256 before = tx.SigHash(0);
    tx.signatures[0].signature = std::vector<uint8_t>(64, 0x01);
    CHECK(tx.SigHash(0) == before);

    tx.signatures[0].timelock = 5;
    CHECK(tx.SigHash(0) != before);

    CHECK_THROWS_AS(tx.SigHash(2), std::out_of_range);
}

TEST_CASE("Transaction - encoding preserves identity", "[transaction]") {
    Transaction tx = SampleTransaction();
    tx.signatures.push_back(TransactionSignature{MakeId(1), 0, 0, std::vector<uint8_t>(64, 0xaa)});

    util::Encoder enc;
    tx.Encode(enc);
    util::Decoder dec(enc.Data());
    const Transaction copy = Transaction::Decode(dec);
    CHECK(dec.Empty());
    CHECK(copy.GetId() == tx.GetId());
    REQUIRE(copy.signatures.size() == 1);
    CHECK(copy.signatures[0].signature == tx.signatures[0].signature);
    CHECK(copy.file_contracts[0] == tx.file_contracts[0]);
}

TEST_CASE("Transaction - unlock hash depends on every condition", "[transaction]") {
    UnlockConditions a;
    a.public_keys.push_back(PublicKey{SIGNATURE_ED25519, std::vector<uint8_t>(32, 0x11)});
    a.signatures_required = 1;

    UnlockConditions b = a;
    b.timelock = 1;
    UnlockConditions c = a;
    c.signatures_required = 0;
    UnlockConditions d = a;
    d.public_keys[0].key[0] = 0x12;

    CHECK(a.GetUnlockHash() != b.GetUnlockHash());
    CHECK(a.GetUnlockHash() != c.GetUnlockHash());
    CHECK(a.GetUnlockHash() != d.GetUnlockHash());
    CHECK(a.GetUnlockHash() == UnlockConditions(a).GetUnlockHash());
}

TEST_CASE("Block - identity and serialization", "[block]") {
    Block block;
    block.parent_id = MakeId(9);
    block.timestamp = 1700000001;
    block.miner_payouts.push_back(CoinOutput{CalculateCoinbase(1), MakeId(2)});
    block.transactions.push_back(SampleTransaction());

    const uint256 id = block.GetHash();
    CHECK(id == Block::HeaderHash(block.parent_id, block.nonce, block.timestamp, block.MerkleRoot()));

    SECTION("Nonce changes the id") {
        Block other = block;
        other.nonce = 1;
        CHECK(other.GetHash() != id);
    }

    SECTION("Payout ids differ per index") {
        block.miner_payouts.push_back(CoinOutput{Currency(1), MakeId(3)});
        CHECK(block.MinerPayoutId(0) != block.MinerPayoutId(1));
    }

    SECTION("Deserialize restores the block") {
        const auto bytes = block.Serialize();
        CHECK(bytes.size() == block.SerializedSize());
        const Block copy = Block::Deserialize(bytes);
        CHECK(copy.GetHash() == id);
    }

    SECTION("Trailing bytes are rejected") {
        auto bytes = block.Serialize();
        bytes.push_back(0);
        CHECK_THROWS_AS(Block::Deserialize(bytes), util::DeserializeError);
    }

    SECTION("Truncated bytes are rejected") {
        auto bytes = block.Serialize();
        bytes.resize(bytes.size() - 1);
        CHECK_THROWS_AS(Block::Deserialize(bytes), util::DeserializeError);
    }
}

TEST_CASE("Block - payout and fee totals", "[block]") {
    Block block;
    block.miner_payouts.push_back(CoinOutput{Currency(10), MakeId(1)});
    block.miner_payouts.push_back(CoinOutput{Currency(5), MakeId(2)});
    Transaction a = SampleTransaction();
    Transaction b = SampleTransaction();
    b.miner_fees.push_back(Currency(3));
    block.transactions = {a, b};
    CHECK(block.TotalMinerPayouts() == Currency(15));
    CHECK(block.TotalMinerFees() == Currency(17));

    SECTION("Overflowing sums have no total") {
        block.miner_payouts.push_back(CoinOutput{~Currency(0), MakeId(3)});
        block.transactions[1].miner_fees.push_back(~Currency(0));
        CHECK_FALSE(block.TotalMinerPayouts().has_value());
        CHECK_FALSE(block.TotalMinerFees().has_value());
        CHECK_FALSE(block.transactions[1].TotalMinerFees().has_value());
    }
}

TEST_CASE("Currency - coinbase schedule", "[currency]") {
    CHECK(CalculateCoinbase(0) == Currency(300000) * CoinPrecision());
    CHECK(CalculateCoinbase(1) == Currency(299999) * CoinPrecision());
    CHECK(CalculateCoinbase(269999) == Currency(30001) * CoinPrecision());
    CHECK(CalculateCoinbase(270000) == Currency(30000) * CoinPrecision());
    CHECK(CalculateCoinbase(1000000) == Currency(30000) * CoinPrecision());

    Currency sum;
    for (BlockHeight h = 0; h <= 5; ++h) {
        sum += CalculateCoinbase(h);
    }
    CHECK(TotalCoinbase(5) == sum);

    const BlockHeight past = 270000 + 10;
    CHECK(TotalCoinbase(past) - TotalCoinbase(past - 1) == CalculateCoinbase(past));
}

TEST_CASE("Currency - contract tax", "[currency]") {
    CHECK(ContractTax(Currency(400000000)) == Currency(15600000));
    CHECK(ContractTax(Currency(1000001)) == Currency(30000));
    CHECK(ContractTax(Currency(1000)).IsZero());
    CHECK((ContractTax(Currency(123456789)) % Currency(FUND_SHARE_COUNT)).IsZero());
}
