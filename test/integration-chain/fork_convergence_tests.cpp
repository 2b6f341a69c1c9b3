// Copyright (c) 2025 The Strata Developers
// Fork convergence between independent nodes
//
// Nodes mine on their own and then exchange canonical chains. Whatever the
// delivery order, every node must end on the heaviest chain with an
// identical ledger.

#include "chain/chainstate_manager.hpp"
#include "chain/currency.hpp"
#include "common/consensus_tester.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace strata;
using namespace strata::test;
using namespace strata::chain;
using namespace strata::validation;

namespace {

void RequireConverged(ConsensusTester& a, ConsensusTester& b) {
    REQUIRE(a.cs().CurrentBlockID() == b.cs().CurrentBlockID());
    REQUIRE(a.cs().CurrentHeight() == b.cs().CurrentHeight());
    REQUIRE(a.cs().LedgerDigest() == b.cs().LedgerDigest());
    REQUIRE(a.cs().ConsensusDigest() == b.cs().ConsensusDigest());
}

}  // namespace

TEST_CASE("Convergence - longer branch wins on both sides", "[convergence][integration]") {
    MockTimeGuard clock(RegtestStartTime());
    ConsensusTester a("a");
    ConsensusTester b("b");

    a.MineBlocks(3);
    b.MineBlocks(5);
    REQUIRE(a.cs().LedgerDigest() != b.cs().LedgerDigest());

    a.SyncFrom(b);
    b.SyncFrom(a);
    RequireConverged(a, b);
    REQUIRE(a.cs().CurrentHeight() == 5);

    // a keeps its own branch as a fork
    const auto tips = a.cs().GetChainTips();
    REQUIRE(tips.size() == 2);
    REQUIRE(tips[0].status == ChainstateManager::ChainTip::Status::ACTIVE);
    REQUIRE(tips[1].status == ChainstateManager::ChainTip::Status::FORK);
    REQUIRE(tips[1].branchlen == 3);
}

TEST_CASE("Convergence - equal work keeps the first-seen tip", "[convergence][integration]") {
    MockTimeGuard clock(RegtestStartTime());
    ConsensusTester a("a");
    ConsensusTester b("b");

    a.MineBlocks(2);
    b.MineBlocks(2);
    const uint256 a_tip = a.cs().CurrentBlockID();
    const uint256 b_tip = b.cs().CurrentBlockID();

    a.SyncFrom(b);
    b.SyncFrom(a);
    REQUIRE(a.cs().CurrentBlockID() == a_tip);
    REQUIRE(b.cs().CurrentBlockID() == b_tip);
    REQUIRE(a.cs().GetBlockCount() == 5);

    // One more block on either side settles it
    b.MineBlocks(1);
    a.SyncFrom(b);
    RequireConverged(a, b);
}

TEST_CASE("Convergence - three nodes in any delivery order", "[convergence][integration]") {
    MockTimeGuard clock(RegtestStartTime());
    ConsensusTester a("a");
    ConsensusTester b("b");
    ConsensusTester c("c");

    a.MineBlocks(4);
    b.MineBlocks(6);
    c.MineBlocks(5);

    SECTION("Heaviest first") {
        a.SyncFrom(b);
        c.SyncFrom(b);
        b.SyncFrom(c);
    }

    SECTION("Heaviest last") {
        a.SyncFrom(c);
        c.SyncFrom(a);
        a.SyncFrom(b);
        c.SyncFrom(b);
    }

    SECTION("Chained through the middle node") {
        c.SyncFrom(b);
        a.SyncFrom(c);
    }

    RequireConverged(a, b);
    RequireConverged(b, c);
}

TEST_CASE("Convergence - spends on the losing branch are undone", "[convergence][integration]") {
    MockTimeGuard clock(RegtestStartTime());
    ConsensusTester a("a");
    ConsensusTester b("b");

    a.MineBlocks(4);
    const Currency before = a.WalletBalance();
    REQUIRE_FALSE(before.IsZero());

    uint256 burn;
    burn.data()[0] = 0x0b;
    Transaction tx;
    REQUIRE(a.FundTransaction(tx, Currency(5000)));
    tx.coin_outputs.push_back(CoinOutput{Currency(5000), burn});
    a.SignTransaction(tx);
    REQUIRE(a.MineAndAccept({tx}) == ConsensusError::OK);
    REQUIRE(a.cs().OutputValue(tx.CoinOutputId(1)).has_value());

    b.MineBlocks(7);
    a.SyncFrom(b);
    RequireConverged(a, b);

    // None of a's blocks survived, so neither did the spend or a's payouts
    REQUIRE_FALSE(a.cs().OutputValue(tx.CoinOutputId(1)).has_value());
    REQUIRE(a.WalletBalance().IsZero());
}

TEST_CASE("Convergence - ledger follows the tip back and forth", "[convergence][integration]") {
    MockTimeGuard clock(RegtestStartTime());
    ConsensusTester a("a");
    ConsensusTester b("b");

    a.MineBlocks(3);
    const uint256 a_tip = a.cs().CurrentBlockID();
    b.MineBlocks(4);

    a.SyncFrom(b);
    REQUIRE(a.cs().LedgerDigest() == b.cs().LedgerDigest());

    // a reclaims the lead on its original branch
    const auto branch = a.MineBranch(a_tip, 2);
    REQUIRE(a.cs().CurrentBlockID() == branch.back().GetHash());
    REQUIRE(a.cs().CurrentHeight() == 5);

    // A node that only ever saw the final chain holds the same ledger
    ConsensusTester fresh("fresh");
    fresh.SyncFrom(a);
    RequireConverged(a, fresh);

    b.SyncFrom(a);
    RequireConverged(a, b);
}
