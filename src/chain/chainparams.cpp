// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/chainparams.hpp"

#include "util/hash.hpp"

#include <stdexcept>
#include <string_view>

namespace strata {
namespace chain {

namespace {

uint256 TargetFromHex(std::string_view hex) {
  auto target = uint256::FromHex(hex);
  if (!target) {
    throw std::logic_error("malformed target constant");
  }
  return *target;
}

}  // namespace

UnlockHash FoundationUnlockHash() {
  static const UnlockHash foundation = [] {
    static constexpr std::string_view kTag = "strata foundation";
    return Hash(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(kTag.data()), kTag.size()));
  }();
  return foundation;
}

UnlockHash AnyoneCanSpendUnlockHash() {
  static const UnlockHash anyone = UnlockConditions{}.GetUnlockHash();
  return anyone;
}

Block CreateGenesisBlock(Timestamp time, const UnlockHash& payout_address, uint64_t anyone_can_spend_fund_shares) {
  Block genesis;
  genesis.parent_id.SetNull();
  genesis.timestamp = time;
  genesis.nonce = 0;
  genesis.miner_payouts.push_back(CoinOutput{CalculateCoinbase(0), payout_address});

  Transaction allocation;
  if (anyone_can_spend_fund_shares < FUND_SHARE_COUNT) {
    allocation.fund_outputs.push_back(
        FundOutput{Currency(FUND_SHARE_COUNT - anyone_can_spend_fund_shares), FoundationUnlockHash(), Currency()});
  }
  if (anyone_can_spend_fund_shares > 0) {
    allocation.fund_outputs.push_back(
        FundOutput{Currency(anyone_can_spend_fund_shares), AnyoneCanSpendUnlockHash(), Currency()});
  }
  genesis.transactions.push_back(allocation);
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.powLimit = TargetFromHex("0000000020000000000000000000000000000000000000000000000000000000");
  consensus.nBlockFrequency = 600;  // 10 minutes
  consensus.nTargetWindow = 1000;
  consensus.nFutureThreshold = 3 * 60 * 60;
  consensus.nExtremeFutureThreshold = 5 * 60 * 60;
  consensus.nMaturityDelay = 50;
  consensus.nBlockSizeLimit = 2000000;

  genesis = CreateGenesisBlock(1761955200,  // Nov 1, 2025
                               FoundationUnlockHash(), 0);
  consensus.hashGenesisBlock = genesis.GetHash();
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  consensus.powLimit = TargetFromHex("0000ffff00000000000000000000000000000000000000000000000000000000");
  consensus.nBlockFrequency = 120;
  consensus.nTargetWindow = 200;
  consensus.nFutureThreshold = 3 * 60 * 60;
  consensus.nExtremeFutureThreshold = 5 * 60 * 60;
  consensus.nMaturityDelay = 10;
  consensus.nBlockSizeLimit = 2000000;

  genesis = CreateGenesisBlock(1760549555, FoundationUnlockHash(), 0);
  consensus.hashGenesisBlock = genesis.GetHash();
}

// ============================================================================
// RegTest Parameters
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  // Roughly one nonce in four meets the root target.
  consensus.powLimit = TargetFromHex("4000000000000000000000000000000000000000000000000000000000000000");
  consensus.nBlockFrequency = 1;
  consensus.nTargetWindow = 20;
  consensus.nFutureThreshold = 3;
  consensus.nExtremeFutureThreshold = 6;
  consensus.nMaturityDelay = 3;
  consensus.nBlockSizeLimit = 2000000;

  // Most fund shares are anyone-can-spend so tests can move them.
  genesis = CreateGenesisBlock(1700000000, AnyoneCanSpendUnlockHash(), 8000);
  consensus.hashGenesisBlock = genesis.GetHash();
}

}  // namespace chain
}  // namespace strata
