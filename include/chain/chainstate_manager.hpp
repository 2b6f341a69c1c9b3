// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/block_manager.hpp"
#include "chain/ledger.hpp"
#include "chain/notifications.hpp"
#include "chain/transaction.hpp"
#include "chain/validation.hpp"
#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace strata {

namespace chain {
class ChainParams;
class CBlockIndex;
}  // namespace chain

namespace validation {

// Read-only snapshot of an open file contract.
struct FileContractView {
  uint256 id;
  chain::FileContract contract;
};

// ChainstateManager - Owns the block tree, the canonical chain and the ledger
// at its tip. Main entry point for adding blocks (mining or network).
//
// THREAD SAFETY: one writer at a time. AcceptBlock and the other mutators hold
// the validation mutex exclusively; queries take it shared and always observe
// a ledger that matches a fully applied chain.
class ChainstateManager {
public:
  // Seeds the block tree and ledger with the genesis block of |params|.
  // LIFETIME: ChainParams reference must outlive this ChainstateManager
  explicit ChainstateManager(const chain::ChainParams& params);

  ChainstateManager(const ChainstateManager&) = delete;
  ChainstateManager& operator=(const ChainstateManager&) = delete;

  /**
   * Validate |block|, insert it into the block tree and switch to it when it
   * makes a strictly heavier chain.
   *
   * Returns OK when the block is now canonical, NON_EXTENDING_BLOCK when it
   * was stored on a lighter or equal branch, or the rejection kind. When a
   * heavier branch fails full validation the whole branch from the failing
   * block up is purged and its error is returned.
   *
   * Throws consensus::ConsistencyFault if the ledger is found corrupt; the
   * manager then refuses every further mutation.
   */
  ConsensusError AcceptBlock(const chain::Block& block);
  ConsensusError AcceptBlock(const chain::Block& block, ValidationState& state);

  // Resubmit held FUTURE_TIMESTAMP blocks whose time has come. Returns the
  // number that entered the block tree.
  size_t ReconsiderFutureBlocks();

  size_t GetFutureBlockCount() const;

  // === Chain queries ===

  chain::BlockHeight CurrentHeight() const;
  uint256 CurrentBlockID() const;
  chain::Block CurrentBlock() const;
  std::optional<chain::Block> BlockAtHeight(chain::BlockHeight height) const;

  // Any block in the tree, canonical or not.
  std::optional<chain::Block> GetBlock(const uint256& id) const;
  std::optional<chain::BlockHeight> HeightOf(const uint256& id) const;

  // True for blocks in the tree, canonical or not.
  bool IsKnown(const uint256& id) const;
  bool IsDoSBlock(const uint256& id) const;

  // Return total number of blocks in index (all branches)
  size_t GetBlockCount() const;

  // Target a child of |id| must meet and its earliest legal timestamp.
  std::optional<arith_uint256> ChildTarget(const uint256& id) const;
  std::optional<chain::Timestamp> EarliestChildTimestamp(const uint256& id) const;

  // Chain tip information (leaf nodes of the block tree)
  struct ChainTip {
    int height;
    uint256 hash;
    int branchlen;  // 0 for active tip, distance from fork point otherwise
    enum class Status { ACTIVE, FORK } status;
  };

  std::vector<ChainTip> GetChainTips() const;

  // === Ledger queries (canonical tip) ===

  std::optional<chain::Currency> OutputValue(const uint256& id) const;
  std::optional<chain::CoinOutput> CoinOutput(const uint256& id) const;
  std::optional<chain::FundOutput> FundOutput(const uint256& id) const;
  std::vector<std::pair<uint256, chain::CoinOutput>> CoinOutputsFor(const chain::UnlockHash& unlock_hash) const;
  std::vector<std::pair<uint256, chain::CoinOutput>> DelayedOutputsAt(chain::BlockHeight height) const;
  std::optional<FileContractView> ContractState(const uint256& id) const;
  chain::Currency FundPool() const;

  // Segment a storage proof for |contract_id| must cover, once the trigger
  // block (window start - 1) is canonical.
  std::optional<uint64_t> StorageProofSegment(const uint256& contract_id) const;

  // Digest of the ledger alone; equal across nodes on the same tip.
  uint256 LedgerDigest() const;

  // Digest of the ledger plus every canonical block id.
  uint256 ConsensusDigest() const;

  const chain::ChainParams& GetParams() const { return params_; }

  ChainNotifications& Notifications() { return notifications_; }

  // === Persistence ===

  bool Save(const std::string& filepath) const;

  // Replay a saved file into a manager that holds nothing but genesis.
  chain::LoadResult Load(const std::string& filepath);

  // === Test/Diagnostic Methods ===
  // These methods are public for testing but should not be used in production.

  // Make the known block |id| canonical regardless of weight, with the
  // same abandon-and-restore handling as a reorg.
  ConsensusError TestForkBlockchain(const uint256& id);

  // Direct ledger access, used to inject corruption.
  consensus::LedgerState& TestGetMutableLedger() { return ledger_; }

  bool IsHalted() const { return m_fatal.load(); }

private:
  // Deferred notification events (dispatched after releasing validation lock)
  enum class NotifyType { BlockConnected, BlockDisconnected, ChainTip };
  struct PendingNotification {
    NotifyType type;
    BlockConnectedEvent connected{};
    BlockDisconnectedEvent disconnected{};
    ChainTipEvent tip{};
  };

  ConsensusError AcceptBlockLocked(const chain::Block& block, ValidationState& state,
                                   std::vector<PendingNotification>& events);

  // Make |target| canonical. On a validation failure along the new path the
  // previous chain is restored, the failing subtree purged and false
  // returned with |state| set.
  bool SwitchToTip(chain::CBlockIndex* target, ValidationState& state, std::vector<PendingNotification>& events);

  // Apply |node| on top of the current tip, computing its diffs on first use.
  bool ConnectTip(chain::CBlockIndex* node, ValidationState& state, std::vector<PendingNotification>& events);

  // Revert the current tip using its cached diffs.
  void DisconnectTip(std::vector<PendingNotification>& events);

  // Poison |failed| and drop it with every descendant.
  void PurgeInvalid(chain::CBlockIndex* failed);

  void HoldFutureBlock(const uint256& hash, const chain::Block& block);

  void ThrowIfHalted() const;

  // Record a consistency fault: latch the halt flag and tell observers.
  void OnFatal(const std::string& message);

  void DispatchNotifications(const std::vector<PendingNotification>& events);

  const chain::ChainParams& params_;
  chain::BlockManager block_manager_;
  consensus::LedgerState ledger_;
  ChainNotifications notifications_;

  // Negative cache: blocks that failed full validation
  std::set<uint256> m_dos_blocks;

  // FUTURE_TIMESTAMP blocks waiting for the clock
  std::map<uint256, chain::Block> m_future_blocks;

  std::atomic<bool> m_fatal{false};

  // THREAD SAFETY: guards block_manager_, ledger_, m_dos_blocks,
  // m_future_blocks. Writers hold it exclusively, readers shared.
  mutable std::shared_mutex validation_mutex_;
};

}  // namespace validation
}  // namespace strata
