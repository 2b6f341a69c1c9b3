// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace strata {
namespace chain {

enum class ChainType {
  MAIN,
  TESTNET,
  REGTEST,
};

struct ConsensusParams {
  // Target of the genesis block's children and the easiest target ever
  // allowed. A block meets target t when its id, read as a big-endian
  // number, is <= t.
  uint256 powLimit;
  uint256 hashGenesisBlock;

  // Retargeting
  int64_t nBlockFrequency{600};  // seconds
  uint64_t nTargetWindow{1000};  // blocks
  // Per-block target change is clamped to [DOWN_NUM/DEN, UP_NUM/DEN].
  static constexpr uint64_t nMaxAdjustmentUpNum = 10001;
  static constexpr uint64_t nMaxAdjustmentDownNum = 9999;
  static constexpr uint64_t nMaxAdjustmentDen = 10000;

  // Timestamps
  int nMedianTimestampWindow{11};
  int64_t nFutureThreshold{3 * 60 * 60};
  int64_t nExtremeFutureThreshold{5 * 60 * 60};

  // Blocks between creation of a delayed output and it becoming spendable.
  uint64_t nMaturityDelay{50};

  size_t nBlockSizeLimit{2000000};

  // Held FUTURE_TIMESTAMP blocks kept for reconsideration.
  size_t nMaxFutureBlocks{100};
};

/**
 * Per-network parameters. Each instance owns its genesis block; consensus
 * instances hold a const reference for their lifetime.
 */
class ChainParams {
public:
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();

  virtual ~ChainParams() = default;

  const ConsensusParams& GetConsensus() const { return consensus; }
  const Block& GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

protected:
  ChainParams() = default;

  ConsensusParams consensus;
  Block genesis;
  ChainType chainType{ChainType::MAIN};
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

// Unlock hash of the network foundation, which receives the genesis fund
// shares not handed to anyone-can-spend.
UnlockHash FoundationUnlockHash();

// Unlock hash of UnlockConditions{}: spendable by anyone.
UnlockHash AnyoneCanSpendUnlockHash();

Block CreateGenesisBlock(Timestamp time, const UnlockHash& payout_address, uint64_t anyone_can_spend_fund_shares);

}  // namespace chain
}  // namespace strata
