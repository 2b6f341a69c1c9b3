// Copyright (c) 2025 The Strata Developers
// Unit tests for chain/block_manager.cpp - block tree storage
//
// Covers:
// - Initialization with genesis
// - Indexing (height, weight, orphans, duplicates)
// - Subtree removal and leaves
// - Block file writing and parsing, including corruption

#include "chain/block.hpp"
#include "chain/block_index.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainparams.hpp"
#include "chain/currency.hpp"
#include "util/files.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <vector>

#include <nlohmann/json.hpp>

using namespace strata;
using namespace strata::chain;
using json = nlohmann::json;

namespace {

class BlockManagerTestFixture {
public:
    BlockManagerTestFixture() : params(ChainParams::CreateRegTest()) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_file = "/tmp/strata_block_manager_test_" + std::to_string(now) + ".json";
        bm.Initialize(params->GenesisBlock(), params->GetConsensus());
    }

    ~BlockManagerTestFixture() { std::filesystem::remove(test_file); }

    Block Child(const uint256& parent, Timestamp time) {
        Block block;
        block.parent_id = parent;
        block.timestamp = time;
        block.nonce = ++nonce;
        block.miner_payouts.push_back(CoinOutput{CalculateCoinbase(1), uint256()});
        return block;
    }

    CBlockIndex* Add(CBlockIndex* parent) {
        Block block = Child(parent->GetBlockHash(), parent->GetBlockTime() + 1);
        return bm.AddToBlockIndex(block, block.GetHash(), params->GetConsensus());
    }

    std::unique_ptr<ChainParams> params;
    BlockManager bm;
    std::string test_file;
    uint64_t nonce{0};
};

}  // namespace

TEST_CASE("BlockManager - initialization", "[block_manager]") {
    BlockManagerTestFixture f;
    const uint256 genesis_hash = f.params->GenesisBlock().GetHash();

    CHECK(f.bm.GetBlockCount() == 1);
    CHECK(f.bm.GetGenesisHash() == genesis_hash);
    REQUIRE(f.bm.GetTip() != nullptr);
    CHECK(f.bm.GetTip()->GetBlockHash() == genesis_hash);
    CHECK(f.bm.GetTip()->nHeight == 0);
    CHECK(f.bm.GetTip()->status == NodeStatus::CANONICAL);
    CHECK(f.bm.ActiveChain().Height() == 0);

    SECTION("Second initialization is refused") {
        CHECK_FALSE(f.bm.Initialize(f.params->GenesisBlock(), f.params->GetConsensus()));
    }

    SECTION("Genesis with a parent is refused") {
        BlockManager other;
        Block bad = f.params->GenesisBlock();
        bad.parent_id = genesis_hash;
        CHECK_FALSE(other.Initialize(bad, f.params->GetConsensus()));
    }
}

TEST_CASE("BlockManager - indexing", "[block_manager]") {
    BlockManagerTestFixture f;
    CBlockIndex* genesis = f.bm.GetTip();

    SECTION("Child gets height, weight and pending status") {
        CBlockIndex* a = f.Add(genesis);
        REQUIRE(a != nullptr);
        CHECK(a->nHeight == 1);
        CHECK(a->pprev == genesis);
        CHECK(a->nChainWork > genesis->nChainWork);
        CHECK(a->status == NodeStatus::PENDING);
        CHECK_FALSE(a->diffs.has_value());
        CHECK(f.bm.LookupBlockIndex(a->GetBlockHash()) == a);
        CHECK(f.bm.GetBlockCount() == 2);
    }

    SECTION("Re-adding returns the existing node") {
        Block block = f.Child(genesis->GetBlockHash(), genesis->GetBlockTime() + 1);
        CBlockIndex* first = f.bm.AddToBlockIndex(block, block.GetHash(), f.params->GetConsensus());
        CBlockIndex* second = f.bm.AddToBlockIndex(block, block.GetHash(), f.params->GetConsensus());
        CHECK(first == second);
        CHECK(f.bm.GetBlockCount() == 2);
    }

    SECTION("Orphan is not indexed") {
        uint256 unknown;
        unknown.data()[0] = 0x42;
        Block orphan = f.Child(unknown, genesis->GetBlockTime() + 1);
        CHECK(f.bm.AddToBlockIndex(orphan, orphan.GetHash(), f.params->GetConsensus()) == nullptr);
        CHECK(f.bm.GetBlockCount() == 1);
    }

    SECTION("Sequence ids follow insertion order") {
        CBlockIndex* a = f.Add(genesis);
        CBlockIndex* b = f.Add(genesis);
        CHECK(a->nSequenceId < b->nSequenceId);
        CHECK(f.bm.GetChildren(genesis).size() == 2);
    }

    SECTION("Ancestor lookup on a long chain") {
        CBlockIndex* node = genesis;
        for (int i = 0; i < 100; ++i) {
            node = f.Add(node);
        }
        CHECK(node->nHeight == 100);
        REQUIRE(node->GetAncestor(37) != nullptr);
        CHECK(node->GetAncestor(37)->nHeight == 37);
        CHECK(node->GetAncestor(0) == genesis);
        CHECK(node->GetAncestor(101) == nullptr);
    }
}

TEST_CASE("BlockManager - subtree removal", "[block_manager]") {
    BlockManagerTestFixture f;
    CBlockIndex* genesis = f.bm.GetTip();

    // genesis - a - b - c
    //             \ d
    CBlockIndex* a = f.Add(genesis);
    CBlockIndex* b = f.Add(a);
    CBlockIndex* c = f.Add(b);
    CBlockIndex* d = f.Add(a);
    const uint256 b_hash = b->GetBlockHash();
    const uint256 c_hash = c->GetBlockHash();
    const uint256 d_hash = d->GetBlockHash();

    CHECK(f.bm.GetLeaves().size() == 2);

    const auto removed = f.bm.RemoveSubtree(b);
    CHECK(removed.size() == 2);
    CHECK(std::find(removed.begin(), removed.end(), b_hash) != removed.end());
    CHECK(std::find(removed.begin(), removed.end(), c_hash) != removed.end());
    CHECK(f.bm.LookupBlockIndex(b_hash) == nullptr);
    CHECK(f.bm.LookupBlockIndex(c_hash) == nullptr);
    CHECK(f.bm.LookupBlockIndex(d_hash) == d);
    CHECK(f.bm.GetChildren(a).size() == 1);
    CHECK(f.bm.GetBlockCount() == 3);

    SECTION("Active blocks are never erased") {
        f.bm.SetActiveTip(*d);
        const auto none = f.bm.RemoveSubtree(a);
        // |d| and |a| are on the active chain.
        CHECK(none.empty());
        CHECK(f.bm.LookupBlockIndex(d_hash) == d);
    }
}

TEST_CASE("BlockManager - active chain and fork point", "[block_manager]") {
    BlockManagerTestFixture f;
    CBlockIndex* genesis = f.bm.GetTip();
    CBlockIndex* a = f.Add(genesis);
    CBlockIndex* b = f.Add(a);
    CBlockIndex* c = f.Add(a);
    CBlockIndex* c2 = f.Add(c);

    f.bm.SetActiveTip(*b);
    CHECK(f.bm.ActiveChain().Height() == 2);
    CHECK(f.bm.ActiveChain().Contains(a));
    CHECK_FALSE(f.bm.ActiveChain().Contains(c));
    CHECK(f.bm.ActiveChain().FindFork(c2) == a);
    CHECK(LastCommonAncestor(b, c2) == a);

    f.bm.SetActiveTip(*c2);
    CHECK(f.bm.ActiveChain().Height() == 3);
    CHECK(f.bm.ActiveChain()[2] == c);
    CHECK_FALSE(f.bm.ActiveChain().Contains(b));
}

TEST_CASE("BlockManager - block file round trip", "[block_manager][persistence]") {
    BlockManagerTestFixture f;
    CBlockIndex* genesis = f.bm.GetTip();
    CBlockIndex* a = f.Add(genesis);
    CBlockIndex* b = f.Add(a);
    CBlockIndex* side = f.Add(genesis);
    f.bm.SetActiveTip(*b);

    std::set<uint256> dos{side->GetBlockHash()};
    REQUIRE(f.bm.Save(f.test_file, dos));

    BlockFile file;
    REQUIRE(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::SUCCESS);
    CHECK(file.tip == b->GetBlockHash());
    REQUIRE(file.blocks.size() == 4);
    // First-seen order.
    CHECK(file.blocks[0].GetHash() == genesis->GetBlockHash());
    CHECK(file.blocks[1].GetHash() == a->GetBlockHash());
    CHECK(file.blocks[2].GetHash() == b->GetBlockHash());
    CHECK(file.blocks[3].GetHash() == side->GetBlockHash());
    REQUIRE(file.dos_blocks.size() == 1);
    CHECK(file.dos_blocks[0] == side->GetBlockHash());
}

TEST_CASE("BlockManager - block file errors", "[block_manager][persistence]") {
    BlockManagerTestFixture f;
    f.Add(f.bm.GetTip());
    BlockFile file;

    SECTION("Missing file") {
        CHECK(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::FILE_NOT_FOUND);
    }

    SECTION("Not JSON") {
        REQUIRE(util::atomic_write_file(f.test_file, std::string("not json at all {")));
        CHECK(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::CORRUPTED);
    }

    REQUIRE(f.bm.Save(f.test_file, {}));
    json root = json::parse(util::read_file_string(f.test_file));

    SECTION("Wrong genesis") {
        uint256 other;
        other.data()[5] = 1;
        CHECK(BlockManager::ReadBlockFile(f.test_file, other, file) == LoadResult::CORRUPTED);
    }

    SECTION("Unsupported version") {
        root["version"] = 99;
        REQUIRE(util::atomic_write_file(f.test_file, root.dump()));
        CHECK(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::CORRUPTED);
    }

    SECTION("Tampered block bytes") {
        std::string data = root["blocks"][1]["data"].get<std::string>();
        data[data.size() - 1] = data[data.size() - 1] == '0' ? '1' : '0';
        root["blocks"][1]["data"] = data;
        REQUIRE(util::atomic_write_file(f.test_file, root.dump()));
        CHECK(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::CORRUPTED);
    }

    SECTION("Invalid hex") {
        root["blocks"][1]["data"] = "zz";
        REQUIRE(util::atomic_write_file(f.test_file, root.dump()));
        CHECK(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::CORRUPTED);
    }

    SECTION("Missing blocks array") {
        root.erase("blocks");
        REQUIRE(util::atomic_write_file(f.test_file, root.dump()));
        CHECK(BlockManager::ReadBlockFile(f.test_file, f.bm.GetGenesisHash(), file) == LoadResult::CORRUPTED);
    }
}
