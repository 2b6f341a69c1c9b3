// Copyright (c) 2025 The Strata Developers
// File contracts and fund shares on a live chain
//
// Contracts are funded from the miner wallet, then either proven inside
// their window or left to expire. The fund pool they feed is claimed by
// spending the anyone-can-spend fund shares regtest creates at genesis.

#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/currency.hpp"
#include "chain/transaction.hpp"
#include "common/consensus_tester.hpp"
#include "crypto/merkle.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace strata;
using namespace strata::test;
using namespace strata::chain;
using namespace strata::validation;

namespace {

constexpr uint64_t kPayout = 400000000;
constexpr uint64_t kTax = 15600000;

std::vector<uint8_t> MakeFile(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 131) ^ (i >> 3));
    }
    return data;
}

class ContractFixture {
public:
    ContractFixture() : clock(RegtestStartTime()), file(MakeFile(crypto::SEGMENT_SIZE * 9 + 5)) {
        // Height 4: the payout of height 1 is spendable
        node.MineBlocks(4);
        for (const auto& segment : crypto::SplitSegments(file)) {
            leaves.push_back(crypto::MerkleLeafHash(segment));
        }
    }

    // Contract opening its window at |start|, confirmed in the next block.
    uint256 FormContract(BlockHeight start, BlockHeight end) {
        const Currency net = Currency(kPayout) - Currency(kTax);
        FileContract fc;
        fc.file_size = file.size();
        fc.file_merkle_root = crypto::FileMerkleRoot(file);
        fc.window_start = start;
        fc.window_end = end;
        fc.payout = Currency(kPayout);
        fc.valid_proof_outputs.push_back(CoinOutput{net, node.key().unlock_hash});
        fc.missed_proof_outputs.push_back(CoinOutput{net - Currency(1000), node.key().unlock_hash});
        fc.missed_proof_outputs.push_back(CoinOutput{Currency(1000), AnyoneCanSpendUnlockHash()});
        fc.unlock_hash = node.key().unlock_hash;

        Transaction tx;
        tx.file_contracts.push_back(fc);
        REQUIRE(node.FundTransaction(tx, Currency(kPayout)));
        node.SignTransaction(tx);
        REQUIRE(node.MineAndAccept({tx}) == ConsensusError::OK);
        return tx.FileContractId(0);
    }

    Transaction ProofFor(const uint256& contract_id) {
        const auto index = node.cs().StorageProofSegment(contract_id);
        REQUIRE(index.has_value());
        const auto segments = crypto::SplitSegments(file);
        REQUIRE(*index < segments.size());
        Transaction tx;
        tx.storage_proofs.push_back(
            StorageProof{contract_id, segments[*index], crypto::BuildMerkleProof(leaves, *index)});
        return tx;
    }

    void MineTo(BlockHeight height) {
        while (node.cs().CurrentHeight() < height) {
            node.MineBlocks(1);
        }
    }

    MockTimeGuard clock;
    ConsensusTester node;
    std::vector<uint8_t> file;
    std::vector<uint256> leaves;
};

}  // namespace

TEST_CASE("File contract - formation taxes the payout", "[contract][integration]") {
    ContractFixture f;
    REQUIRE(f.node.cs().FundPool().IsZero());

    const uint256 id = f.FormContract(8, 12);
    const auto state = f.node.cs().ContractState(id);
    REQUIRE(state.has_value());
    CHECK(state->contract.payout == Currency(kPayout));
    CHECK(state->contract.window_start == 8);
    CHECK(f.node.cs().FundPool() == Currency(kTax));
}

TEST_CASE("File contract - proven inside the window", "[contract][integration]") {
    ContractFixture f;
    const uint256 id = f.FormContract(7, 10);

    // The trigger block (height 6) must be canonical before the segment is known
    REQUIRE_FALSE(f.node.cs().StorageProofSegment(id).has_value());
    f.MineTo(7);

    SECTION("Valid proof pays the valid outputs") {
        const Transaction proof = f.ProofFor(id);
        REQUIRE(f.node.MineAndAccept({proof}) == ConsensusError::OK);
        const BlockHeight h = f.node.cs().CurrentHeight();
        REQUIRE_FALSE(f.node.cs().ContractState(id).has_value());

        const auto pending = f.node.cs().DelayedOutputsAt(h + f.node.params().GetConsensus().nMaturityDelay);
        bool found = false;
        for (const auto& [out_id, out] : pending) {
            if (out_id == StorageProofOutputId(id, true, 0)) {
                found = true;
                CHECK(out.value == Currency(kPayout) - Currency(kTax));
            }
            CHECK(out_id != StorageProofOutputId(id, false, 0));
        }
        CHECK(found);

        // Nothing is left to expire at the window end
        f.MineTo(10 + f.node.params().GetConsensus().nMaturityDelay);
        REQUIRE(f.node.cs().OutputValue(StorageProofOutputId(id, true, 0)).has_value());
        REQUIRE_FALSE(f.node.cs().OutputValue(StorageProofOutputId(id, false, 0)).has_value());
    }

    SECTION("Wrong segment invalidates the block") {
        Transaction proof = f.ProofFor(id);
        proof.storage_proofs[0].segment.back() ^= 0x80;
        const Block block = f.node.MineBlock({proof});
        REQUIRE(f.node.cs().AcceptBlock(block) == ConsensusError::INVALID_STORAGE_PROOF);
        REQUIRE(f.node.cs().IsDoSBlock(block.GetHash()));
        REQUIRE(f.node.cs().ContractState(id).has_value());
    }

    SECTION("Proof is too late once the window closed") {
        f.MineTo(10);
        REQUIRE_FALSE(f.node.cs().ContractState(id).has_value());
        const Transaction proof = [&] {
            Transaction tx;
            tx.storage_proofs.push_back(StorageProof{id, {}, {}});
            return tx;
        }();
        REQUIRE(f.node.MineAndAccept({proof}) == ConsensusError::UNRECOGNIZED_FILE_CONTRACT);
    }
}

TEST_CASE("File contract - window far beyond the chain has no segment yet", "[contract][integration]") {
    ContractFixture f;
    // Would truncate to height 4 if narrowed to 32 bits
    const BlockHeight start = (BlockHeight{1} << 32) + 5;
    const uint256 id = f.FormContract(start, start + 10);
    REQUIRE(f.node.cs().ContractState(id).has_value());
    REQUIRE(f.node.cs().CurrentHeight() > 4);
    CHECK_FALSE(f.node.cs().StorageProofSegment(id).has_value());
}

TEST_CASE("File contract - missed window pays the missed outputs", "[contract][integration]") {
    ContractFixture f;
    const uint256 id = f.FormContract(7, 9);
    const auto& consensus = f.node.params().GetConsensus();

    f.MineTo(8);
    REQUIRE(f.node.cs().ContractState(id).has_value());

    f.MineTo(9);
    REQUIRE_FALSE(f.node.cs().ContractState(id).has_value());
    const auto pending = f.node.cs().DelayedOutputsAt(9 + consensus.nMaturityDelay);
    Currency missed;
    for (const auto& [out_id, out] : pending) {
        if (out_id == StorageProofOutputId(id, false, 0) || out_id == StorageProofOutputId(id, false, 1)) {
            missed += out.value;
        }
    }
    CHECK(missed == Currency(kPayout) - Currency(kTax));

    f.MineTo(9 + consensus.nMaturityDelay);
    REQUIRE(f.node.cs().OutputValue(StorageProofOutputId(id, false, 1)) == Currency(1000));
}

TEST_CASE("File contract - revision before the window", "[contract][integration]") {
    ContractFixture f;
    const uint256 id = f.FormContract(9, 12);
    const FileContract current = f.node.cs().ContractState(id)->contract;

    FileContractRevision rev;
    rev.parent_id = id;
    rev.unlock_conditions = f.node.key().conditions;
    rev.new_revision_number = 1;
    rev.new_file_size = current.file_size;
    rev.new_file_merkle_root = current.file_merkle_root;
    rev.new_window_start = 10;
    rev.new_window_end = 14;
    rev.new_valid_proof_outputs = current.valid_proof_outputs;
    rev.new_missed_proof_outputs = current.missed_proof_outputs;
    rev.new_unlock_hash = current.unlock_hash;

    Transaction tx;
    tx.file_contract_revisions.push_back(rev);
    f.node.SignTransaction(tx);
    REQUIRE(f.node.MineAndAccept({tx}) == ConsensusError::OK);

    const auto revised = f.node.cs().ContractState(id);
    REQUIRE(revised.has_value());
    CHECK(revised->contract.revision_number == 1);
    CHECK(revised->contract.window_end == 14);

    // The same revision number cannot be used twice
    Transaction stale;
    stale.file_contract_revisions.push_back(rev);
    f.node.SignTransaction(stale);
    REQUIRE(f.node.MineAndAccept({stale}) == ConsensusError::BAD_REVISION_NUMBER);
}

TEST_CASE("Fund shares - claim of the contract tax", "[fund][integration]") {
    ContractFixture f;
    f.FormContract(8, 12);
    REQUIRE(f.node.cs().FundPool() == Currency(kTax));

    const Transaction& allocation = f.node.params().GenesisBlock().transactions.at(0);
    const uint256 shares = allocation.FundOutputId(1);
    const auto before = f.node.cs().FundOutput(shares);
    REQUIRE(before.has_value());
    REQUIRE(before->value == Currency(8000));
    REQUIRE(before->claim_start.IsZero());

    Transaction tx;
    tx.fund_inputs.push_back(FundInput{shares, UnlockConditions{}, f.node.key().unlock_hash});
    tx.fund_outputs.push_back(FundOutput{Currency(8000), f.node.key().unlock_hash, Currency()});
    REQUIRE(f.node.MineAndAccept({tx}) == ConsensusError::OK);
    const BlockHeight h = f.node.cs().CurrentHeight();

    // 8000 of 10000 shares: 15,600,000 / 10,000 * 8,000
    const auto pending = f.node.cs().DelayedOutputsAt(h + f.node.params().GetConsensus().nMaturityDelay);
    bool found = false;
    for (const auto& [id, out] : pending) {
        if (id == FundClaimOutputId(shares)) {
            found = true;
            CHECK(out.value == Currency(12480000));
            CHECK(out.unlock_hash == f.node.key().unlock_hash);
        }
    }
    CHECK(found);

    const auto moved = f.node.cs().FundOutput(tx.FundOutputId(0));
    REQUIRE(moved.has_value());
    CHECK(moved->claim_start == Currency(kTax));
    CHECK_FALSE(f.node.cs().FundOutput(shares).has_value());
    // Claims do not drain the pool
    CHECK(f.node.cs().FundPool() == Currency(kTax));
}
