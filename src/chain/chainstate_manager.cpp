// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/chainstate_manager.hpp"

#include "chain/block_index.hpp"
#include "chain/chain.hpp"
#include "chain/chainparams.hpp"
#include "chain/consistency.hpp"
#include "chain/diff_engine.hpp"
#include "chain/tx_verify.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"
#include "util/serialize.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace strata {
namespace validation {

namespace {

std::string LogBlock(const chain::CBlockIndex* pindex) {
  if (!pindex)
    return "null";
  return fmt::format("{}@{}", pindex->GetBlockHash().ToString().substr(0, 16), pindex->nHeight);
}

}  // namespace

ChainstateManager::ChainstateManager(const chain::ChainParams& params) : params_(params) {
  const chain::Block& genesis = params_.GenesisBlock();
  if (!block_manager_.Initialize(genesis, params_.GetConsensus())) {
    throw std::runtime_error("failed to initialize block tree with genesis");
  }
  chain::CBlockIndex* root = block_manager_.GetTip();
  root->diffs = consensus::ComputeGenesisDiffs(genesis, params_.GetConsensus());
  ledger_.ApplyDiffs(*root->diffs);
  consensus::CheckLedgerConsistency(ledger_, 0);

  LOG_CHAIN_INFO("Chainstate initialized on {} with genesis {}", params_.GetChainTypeString(), LogBlock(root));
}

ConsensusError ChainstateManager::AcceptBlock(const chain::Block& block) {
  ValidationState state;
  return AcceptBlock(block, state);
}

ConsensusError ChainstateManager::AcceptBlock(const chain::Block& block, ValidationState& state) {
  std::vector<PendingNotification> events;
  ConsensusError result;
  {
    std::unique_lock<std::shared_mutex> lock(validation_mutex_);
    ThrowIfHalted();
    try {
      result = AcceptBlockLocked(block, state, events);
    } catch (const consensus::ConsistencyFault& e) {
      lock.unlock();
      OnFatal(e.what());
      throw;
    }
  }
  DispatchNotifications(events);
  return result;
}

ConsensusError ChainstateManager::AcceptBlockLocked(const chain::Block& block, ValidationState& state,
                                                    std::vector<PendingNotification>& events) {
  const uint256 hash = block.GetHash();
  const std::string short_hash = hash.ToString().substr(0, 16);

  // Step 1: Negative cache, before any other work
  if (m_dos_blocks.count(hash)) {
    LOG_CHAIN_DEBUG_RL("AcceptBlock: {} is a known invalid block", short_hash);
    state.Invalid(ConsensusError::DOS_BLOCK, "dos-block", "block previously failed full validation");
    return ConsensusError::DOS_BLOCK;
  }

  // Step 2: Duplicate
  if (block_manager_.LookupBlockIndex(hash)) {
    state.Invalid(ConsensusError::BLOCK_KNOWN, "duplicate");
    return ConsensusError::BLOCK_KNOWN;
  }

  // Step 3: Parent must exist in index
  chain::CBlockIndex* pindexPrev = block_manager_.LookupBlockIndex(block.parent_id);
  if (!pindexPrev) {
    LOG_CHAIN_DEBUG_RL("AcceptBlock: {} has unknown parent {}", short_hash, block.parent_id.ToString().substr(0, 16));
    state.Invalid(ConsensusError::ORPHAN, "prev-blk-not-found", "parent block not found");
    return ConsensusError::ORPHAN;
  }

  // Step 4: Checks against the parent (target, size, timestamps, payouts)
  if (!ContextualCheckBlock(block, hash, *pindexPrev, params_, GetAdjustedTime(), state)) {
    if (state.GetError() == ConsensusError::FUTURE_TIMESTAMP) {
      HoldFutureBlock(hash, block);
    }
    LOG_CHAIN_DEBUG_RL("AcceptBlock: {} rejected: {}", short_hash, state.ToString());
    return state.GetError();
  }
  m_future_blocks.erase(hash);

  // Step 5: Insert into block index
  chain::CBlockIndex* pindex = block_manager_.AddToBlockIndex(block, hash, params_.GetConsensus());
  if (!pindex) {
    throw consensus::ConsistencyFault(fmt::format("failed to index block {} with a known parent", short_hash));
  }

  // Step 6: Fork choice. Equal weight keeps the first-seen chain.
  const chain::CBlockIndex* tip = block_manager_.GetTip();
  if (pindex->nChainWork <= tip->nChainWork) {
    LOG_CHAIN_DEBUG("AcceptBlock: {} stored on side branch (tip {})", LogBlock(pindex), LogBlock(tip));
    state.Invalid(ConsensusError::NON_EXTENDING_BLOCK, "non-extending", "block does not extend the heaviest chain");
    return ConsensusError::NON_EXTENDING_BLOCK;
  }

  if (!SwitchToTip(pindex, state, events)) {
    return state.GetError();
  }
  return ConsensusError::OK;
}

bool ChainstateManager::SwitchToTip(chain::CBlockIndex* target, ValidationState& state,
                                    std::vector<PendingNotification>& events) {
  // PRE: validation_mutex_ is held exclusively by caller
  chain::CBlockIndex* old_tip = block_manager_.GetTip();
  if (old_tip == target) {
    return true;
  }

  const chain::CBlockIndex* fork = chain::LastCommonAncestor(old_tip, target);
  if (!fork) {
    throw consensus::ConsistencyFault(
        fmt::format("no common ancestor between tip {} and {}", LogBlock(old_tip), LogBlock(target)));
  }

  std::vector<PendingNotification> local_events;

  // Disconnect old chain to fork point
  std::vector<chain::CBlockIndex*> reverted;
  while (block_manager_.GetTip() != fork) {
    reverted.push_back(block_manager_.GetTip());
    DisconnectTip(local_events);
  }

  // Build path from fork to target (collected in reverse order)
  std::vector<chain::CBlockIndex*> path;
  for (chain::CBlockIndex* p = target; p != fork; p = p->pprev) {
    path.push_back(p);
  }

  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    if (ConnectTip(*it, state, local_events)) {
      continue;
    }

    // Abandon: unwind the new path, restore the old chain from cached diffs.
    chain::CBlockIndex* failed = *it;
    LOG_CHAIN_WARN("Reorg to {} abandoned: {} failed validation ({})", LogBlock(target), LogBlock(failed),
                   state.ToString());
    std::vector<PendingNotification> discarded;
    while (block_manager_.GetTip() != fork) {
      DisconnectTip(discarded);
    }
    for (auto restore = reverted.rbegin(); restore != reverted.rend(); ++restore) {
      ValidationState restore_state;
      if (!ConnectTip(*restore, restore_state, discarded)) {
        throw consensus::ConsistencyFault(
            fmt::format("could not restore {}: {}", LogBlock(*restore), restore_state.ToString()));
      }
    }
    PurgeInvalid(failed);
    return false;
  }

  const int disconnect_count = old_tip->nHeight - fork->nHeight;
  local_events.push_back(PendingNotification{
      NotifyType::ChainTip, {}, {}, ChainTipEvent{target->GetBlockHash(), target->nHeight, disconnect_count}});
  events.insert(events.end(), local_events.begin(), local_events.end());

  if (disconnect_count > 0) {
    LOG_CHAIN_INFO("REORGANIZE: {} blocks disconnected, {} connected - old tip {}, new tip {}, fork @ {}",
                   disconnect_count, path.size(), LogBlock(old_tip), LogBlock(target), fork->nHeight);
  }
  return true;
}

bool ChainstateManager::ConnectTip(chain::CBlockIndex* node, ValidationState& state,
                                   std::vector<PendingNotification>& events) {
  if (!node->diffs) {
    consensus::BlockDiffs diffs;
    if (!consensus::ComputeBlockDiffs(*node, ledger_, params_.GetConsensus(), diffs, state)) {
      if (state.IsError()) {
        throw consensus::ConsistencyFault(
            fmt::format("internal error validating {}: {}", LogBlock(node), state.ToString()));
      }
      return false;
    }
    node->diffs = std::move(diffs);
  }

  ledger_.ApplyDiffs(*node->diffs);
  block_manager_.SetActiveTip(*node);
  node->status = chain::NodeStatus::CANONICAL;
  consensus::CheckLedgerConsistency(ledger_, static_cast<chain::BlockHeight>(node->nHeight));

  const double log2_work = std::log(std::max(node->nChainWork.getdouble(), 1.0)) / std::log(2.0);
  LOG_CHAIN_DEBUG("UpdateTip: new best={} log2_work={:.6f} date='{}' diffs={}", LogBlock(node), log2_work,
                  util::FormatTime(static_cast<int64_t>(node->GetBlockTime())), node->diffs->size());

  PendingNotification ev{NotifyType::BlockConnected, {}, {}, {}};
  ev.connected = BlockConnectedEvent{node->GetBlockHash(), node->nHeight, node->GetBlockTime()};
  events.push_back(ev);
  return true;
}

void ChainstateManager::DisconnectTip(std::vector<PendingNotification>& events) {
  chain::CBlockIndex* pindexDelete = block_manager_.GetTip();
  if (!pindexDelete->pprev || !pindexDelete->diffs) {
    throw consensus::ConsistencyFault(fmt::format("cannot disconnect {}", LogBlock(pindexDelete)));
  }

  LOG_CHAIN_TRACE("DisconnectTip: disconnecting block {}", LogBlock(pindexDelete));
  ledger_.RevertDiffs(*pindexDelete->diffs);
  block_manager_.SetActiveTip(*pindexDelete->pprev);
  pindexDelete->status = chain::NodeStatus::REVERTED;

  PendingNotification ev{NotifyType::BlockDisconnected, {}, {}, {}};
  ev.disconnected = BlockDisconnectedEvent{pindexDelete->GetBlockHash(), pindexDelete->nHeight};
  events.push_back(ev);
}

void ChainstateManager::PurgeInvalid(chain::CBlockIndex* failed) {
  const uint256 hash = failed->GetBlockHash();
  m_dos_blocks.insert(hash);
  const auto removed = block_manager_.RemoveSubtree(failed);
  LOG_CHAIN_DEBUG("Purged invalid block {} and {} descendants", hash.ToString().substr(0, 16),
                  removed.empty() ? 0 : removed.size() - 1);
}

void ChainstateManager::HoldFutureBlock(const uint256& hash, const chain::Block& block) {
  if (m_future_blocks.count(hash))
    return;
  if (m_future_blocks.size() >= params_.GetConsensus().nMaxFutureBlocks) {
    LOG_CHAIN_WARN_RL("Future block set full ({}); not holding {}", m_future_blocks.size(),
                      hash.ToString().substr(0, 16));
    return;
  }
  m_future_blocks.emplace(hash, block);
}

size_t ChainstateManager::ReconsiderFutureBlocks() {
  std::vector<chain::Block> ready;
  {
    std::shared_lock<std::shared_mutex> lock(validation_mutex_);
    const int64_t limit = GetAdjustedTime() + params_.GetConsensus().nFutureThreshold;
    for (const auto& [hash, block] : m_future_blocks) {
      if (static_cast<int64_t>(block.timestamp) <= limit) {
        ready.push_back(block);
      }
    }
  }
  // Parents carry earlier timestamps than their children.
  std::sort(ready.begin(), ready.end(),
            [](const chain::Block& a, const chain::Block& b) { return a.timestamp < b.timestamp; });

  size_t accepted = 0;
  for (const auto& block : ready) {
    const ConsensusError result = AcceptBlock(block);
    if (result == ConsensusError::OK || result == ConsensusError::NON_EXTENDING_BLOCK) {
      ++accepted;
    }
    if (result != ConsensusError::FUTURE_TIMESTAMP) {
      std::unique_lock<std::shared_mutex> lock(validation_mutex_);
      m_future_blocks.erase(block.GetHash());
    }
  }
  return accepted;
}

size_t ChainstateManager::GetFutureBlockCount() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return m_future_blocks.size();
}

chain::BlockHeight ChainstateManager::CurrentHeight() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return static_cast<chain::BlockHeight>(block_manager_.ActiveChain().Height());
}

uint256 ChainstateManager::CurrentBlockID() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.GetTip()->GetBlockHash();
}

chain::Block ChainstateManager::CurrentBlock() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.GetTip()->block;
}

std::optional<chain::Block> ChainstateManager::BlockAtHeight(chain::BlockHeight height) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const auto& active = block_manager_.ActiveChain();
  if (height > static_cast<chain::BlockHeight>(active.Height()))
    return std::nullopt;
  return active[static_cast<int>(height)]->block;
}

std::optional<chain::Block> ChainstateManager::GetBlock(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(id);
  if (!pindex)
    return std::nullopt;
  return pindex->block;
}

std::optional<chain::BlockHeight> ChainstateManager::HeightOf(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(id);
  if (!pindex)
    return std::nullopt;
  return static_cast<chain::BlockHeight>(pindex->nHeight);
}

bool ChainstateManager::IsKnown(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.LookupBlockIndex(id) != nullptr;
}

bool ChainstateManager::IsDoSBlock(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return m_dos_blocks.count(id) > 0;
}

size_t ChainstateManager::GetBlockCount() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.GetBlockCount();
}

std::optional<arith_uint256> ChainstateManager::ChildTarget(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(id);
  if (!pindex)
    return std::nullopt;
  return pindex->nChildTarget;
}

std::optional<chain::Timestamp> ChainstateManager::EarliestChildTimestamp(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::CBlockIndex* pindex = block_manager_.LookupBlockIndex(id);
  if (!pindex)
    return std::nullopt;
  return pindex->EarliestChildTimestamp(params_.GetConsensus().nMedianTimestampWindow);
}

std::vector<ChainstateManager::ChainTip> ChainstateManager::GetChainTips() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);

  const auto& active_chain = block_manager_.ActiveChain();
  std::vector<ChainTip> tips;
  for (const chain::CBlockIndex* leaf : block_manager_.GetLeaves()) {
    ChainTip tip;
    tip.height = leaf->nHeight;
    tip.hash = leaf->GetBlockHash();
    if (active_chain.Contains(leaf)) {
      tip.branchlen = 0;
      tip.status = ChainTip::Status::ACTIVE;
    } else {
      const chain::CBlockIndex* fork = active_chain.FindFork(leaf);
      tip.branchlen = fork ? (leaf->nHeight - fork->nHeight) : leaf->nHeight;
      tip.status = ChainTip::Status::FORK;
    }
    tips.push_back(tip);
  }

  // Sort by height descending for consistent output
  std::sort(tips.begin(), tips.end(), [](const ChainTip& a, const ChainTip& b) { return a.height > b.height; });
  return tips;
}

std::optional<chain::Currency> ChainstateManager::OutputValue(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::CoinOutput* out = ledger_.GetCoinOutput(id);
  if (!out)
    return std::nullopt;
  return out->value;
}

std::optional<chain::CoinOutput> ChainstateManager::CoinOutput(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::CoinOutput* out = ledger_.GetCoinOutput(id);
  if (!out)
    return std::nullopt;
  return *out;
}

std::optional<chain::FundOutput> ChainstateManager::FundOutput(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::FundOutput* out = ledger_.GetFundOutput(id);
  if (!out)
    return std::nullopt;
  return *out;
}

std::vector<std::pair<uint256, chain::CoinOutput>> ChainstateManager::CoinOutputsFor(
    const chain::UnlockHash& unlock_hash) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  std::vector<std::pair<uint256, chain::CoinOutput>> outputs;
  for (const auto& [id, out] : ledger_.CoinOutputs()) {
    if (out.unlock_hash == unlock_hash) {
      outputs.emplace_back(id, out);
    }
  }
  return outputs;
}

std::vector<std::pair<uint256, chain::CoinOutput>> ChainstateManager::DelayedOutputsAt(
    chain::BlockHeight height) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  std::vector<std::pair<uint256, chain::CoinOutput>> outputs;
  if (const auto* bucket = ledger_.GetDelayedOutputs(height)) {
    outputs.assign(bucket->begin(), bucket->end());
  }
  return outputs;
}

std::optional<FileContractView> ChainstateManager::ContractState(const uint256& id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::FileContract* fc = ledger_.GetFileContract(id);
  if (!fc)
    return std::nullopt;
  return FileContractView{id, *fc};
}

chain::Currency ChainstateManager::FundPool() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return ledger_.GetFundPool();
}

std::optional<uint64_t> ChainstateManager::StorageProofSegment(const uint256& contract_id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::FileContract* fc = ledger_.GetFileContract(contract_id);
  if (!fc || fc->window_start == 0)
    return std::nullopt;
  const auto& active = block_manager_.ActiveChain();
  // The trigger block must already be canonical.
  if (fc->window_start - 1 > static_cast<chain::BlockHeight>(active.Height()))
    return std::nullopt;
  const chain::CBlockIndex* trigger = active[static_cast<int>(fc->window_start - 1)];
  if (!trigger)
    return std::nullopt;
  return consensus::StorageProofSegment(trigger->GetBlockHash(), contract_id, fc->file_size);
}

uint256 ChainstateManager::LedgerDigest() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return ledger_.GetDigest();
}

uint256 ChainstateManager::ConsensusDigest() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  util::Encoder enc;
  enc.WriteUint256(ledger_.GetDigest());
  const auto& active = block_manager_.ActiveChain();
  enc.WriteU64(static_cast<uint64_t>(active.Height() + 1));
  for (int h = 0; h <= active.Height(); ++h) {
    enc.WriteUint256(active[h]->GetBlockHash());
  }
  return Hash(enc.Data());
}

bool ChainstateManager::Save(const std::string& filepath) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.Save(filepath, m_dos_blocks);
}

chain::LoadResult ChainstateManager::Load(const std::string& filepath) {
  {
    std::shared_lock<std::shared_mutex> lock(validation_mutex_);
    if (block_manager_.GetBlockCount() != 1) {
      LOG_CHAIN_ERROR("Load: chainstate already holds {} blocks", block_manager_.GetBlockCount());
      return chain::LoadResult::CORRUPTED;
    }
  }

  chain::BlockFile file;
  const chain::LoadResult read = chain::BlockManager::ReadBlockFile(filepath, block_manager_.GetGenesisHash(), file);
  if (read != chain::LoadResult::SUCCESS) {
    return read;
  }

  for (const auto& block : file.blocks) {
    if (block.parent_id.IsNull())
      continue;
    ValidationState state;
    const ConsensusError result = AcceptBlock(block, state);
    if (result != ConsensusError::OK && result != ConsensusError::NON_EXTENDING_BLOCK) {
      LOG_CHAIN_ERROR("Load: replaying {} failed: {}", block.GetHash().ToString().substr(0, 16), state.ToString());
      return chain::LoadResult::CORRUPTED;
    }
  }

  std::unique_lock<std::shared_mutex> lock(validation_mutex_);
  m_dos_blocks.insert(file.dos_blocks.begin(), file.dos_blocks.end());
  const uint256 tip = block_manager_.GetTip()->GetBlockHash();
  if (tip != file.tip) {
    LOG_CHAIN_ERROR("Load: replay ended on {} but file records tip {}", tip.ToString().substr(0, 16),
                    file.tip.ToString().substr(0, 16));
    return chain::LoadResult::CORRUPTED;
  }

  LOG_CHAIN_INFO("Loaded {} blocks from {}, tip {}", block_manager_.GetBlockCount(), filepath,
                 LogBlock(block_manager_.GetTip()));
  return chain::LoadResult::SUCCESS;
}

ConsensusError ChainstateManager::TestForkBlockchain(const uint256& id) {
  std::vector<PendingNotification> events;
  ValidationState state;
  bool switched;
  {
    std::unique_lock<std::shared_mutex> lock(validation_mutex_);
    ThrowIfHalted();
    chain::CBlockIndex* target = block_manager_.LookupBlockIndex(id);
    if (!target) {
      return ConsensusError::ORPHAN;
    }
    try {
      switched = SwitchToTip(target, state, events);
    } catch (const consensus::ConsistencyFault& e) {
      lock.unlock();
      OnFatal(e.what());
      throw;
    }
  }
  DispatchNotifications(events);
  return switched ? ConsensusError::OK : state.GetError();
}

void ChainstateManager::ThrowIfHalted() const {
  if (m_fatal.load()) {
    throw consensus::ConsistencyFault("chainstate halted after a consistency fault");
  }
}

void ChainstateManager::OnFatal(const std::string& message) {
  m_fatal.store(true);
  LOG_CHAIN_CRITICAL("Consistency fault, chainstate halted: {}", message);
  notifications_.NotifyFatalError(message);
}

void ChainstateManager::DispatchNotifications(const std::vector<PendingNotification>& events) {
  for (const auto& ev : events) {
    switch (ev.type) {
    case NotifyType::BlockConnected:
      notifications_.NotifyBlockConnected(ev.connected);
      break;
    case NotifyType::BlockDisconnected:
      notifications_.NotifyBlockDisconnected(ev.disconnected);
      break;
    case NotifyType::ChainTip:
      notifications_.NotifyChainTip(ev.tip);
      break;
    }
  }
}

}  // namespace validation
}  // namespace strata
