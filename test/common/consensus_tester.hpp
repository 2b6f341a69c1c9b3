// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/transaction.hpp"
#include "chain/validation.hpp"
#include "crypto/ed25519.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace strata {
namespace test {

// Sets the mock clock for the lifetime of the guard.
class MockTimeGuard {
public:
    explicit MockTimeGuard(int64_t time);
    ~MockTimeGuard();

    MockTimeGuard(const MockTimeGuard&) = delete;
    MockTimeGuard& operator=(const MockTimeGuard&) = delete;

    void Set(int64_t time);
    void Advance(int64_t seconds);
};

// Single ed25519 key locked behind "one key, one signature" conditions.
struct TestKey {
    crypto::Ed25519KeyPair pair;
    chain::UnlockConditions conditions;
    chain::UnlockHash unlock_hash;
};

TestKey MakeTestKey();

// Append and fill one signature for every coin input, fund input and
// revision whose conditions are |key|'s.
void SignTransaction(const TestKey& key, chain::Transaction& tx);

// Start a mock clock comfortably after the regtest genesis timestamp.
int64_t RegtestStartTime();

/**
 * One consensus node on regtest plus a wallet key that collects its miner
 * payouts. Blocks are stamped one second after their parent; when the mock
 * clock is running it is advanced so freshly mined blocks are never early or
 * in the future.
 */
class ConsensusTester {
public:
    explicit ConsensusTester(std::string name = "tester");

    validation::ChainstateManager& cs() { return *chainstate_; }
    const chain::ChainParams& params() const { return *params_; }
    const TestKey& key() const { return key_; }
    const std::string& name() const { return name_; }

    // Unsolved block on |parent| paying coinbase plus fees to the wallet.
    chain::Block BlockOn(const uint256& parent, const std::vector<chain::Transaction>& txs = {});
    chain::Block BlockForWork(const std::vector<chain::Transaction>& txs = {});

    // Walk the nonce until the id meets the parent's child target.
    void SolveBlock(chain::Block& block) const;

    chain::Block MineBlockOn(const uint256& parent, const std::vector<chain::Transaction>& txs = {});
    chain::Block MineBlock(const std::vector<chain::Transaction>& txs = {});

    validation::ConsensusError MineAndAccept(const std::vector<chain::Transaction>& txs = {});

    // Mine and accept |count| empty blocks on the tip. Throws if any fails.
    void MineBlocks(int count);

    // Mine |count| blocks on |parent|, accepting each locally, and return
    // them for replay on other nodes.
    std::vector<chain::Block> MineBranch(const uint256& parent, int count);

    // Add mature wallet outputs covering |amount| plus a change output.
    // False when the wallet cannot cover it.
    bool FundTransaction(chain::Transaction& tx, const chain::Currency& amount);

    // Sign every input and revision locked to the wallet conditions.
    void SignTransaction(chain::Transaction& tx) const;

    chain::Currency WalletBalance() const;

    // Submit every block of |other|'s canonical chain this node lacks.
    void SyncFrom(ConsensusTester& other);

private:
    std::string name_;
    std::unique_ptr<chain::ChainParams> params_;
    std::unique_ptr<validation::ChainstateManager> chainstate_;
    TestKey key_;
    uint64_t nonce_seed_{0};
    std::set<uint256> reserved_outputs_;
};

}  // namespace test
}  // namespace strata
