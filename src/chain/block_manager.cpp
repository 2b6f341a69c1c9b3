// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/block_manager.hpp"

#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/serialize.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace strata {
namespace chain {

namespace {

constexpr int BLOCK_FILE_VERSION = 1;

std::string ShortHash(const uint256& hash) {
  return hash.ToString().substr(0, 16);
}

}  // namespace

BlockManager::BlockManager() = default;
BlockManager::~BlockManager() = default;

bool BlockManager::Initialize(const Block& genesis, const ConsensusParams& params) {
  if (m_initialized) {
    LOG_CHAIN_ERROR("BlockManager already initialized");
    return false;
  }
  if (!genesis.parent_id.IsNull()) {
    LOG_CHAIN_ERROR("Genesis block has a parent");
    return false;
  }

  const uint256 hash = genesis.GetHash();
  auto [iter, _] = m_block_index.try_emplace(hash, genesis);
  CBlockIndex* pindex = &iter->second;
  pindex->m_block_hash = hash;
  pindex->nHeight = 0;
  pindex->nChainWork = arith_uint256();
  pindex->nChildTarget = consensus::CalculateChildTarget(*pindex, params);
  pindex->nSequenceId = m_next_sequence_id++;
  pindex->nTimeReceived = util::GetTime();
  pindex->status = NodeStatus::CANONICAL;
  pindex->BuildSkip();

  m_active_chain.SetTip(*pindex);
  m_genesis_hash = hash;
  m_initialized = true;

  LOG_CHAIN_TRACE("BlockManager initialized with genesis: {}", ShortHash(m_genesis_hash));
  return true;
}

CBlockIndex* BlockManager::LookupBlockIndex(const uint256& hash) {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

const CBlockIndex* BlockManager::LookupBlockIndex(const uint256& hash) const {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

CBlockIndex* BlockManager::AddToBlockIndex(const Block& block, const uint256& hash, const ConsensusParams& params) {
  LOG_CHAIN_TRACE("AddToBlockIndex: hash={} parent={}", ShortHash(hash), ShortHash(block.parent_id));

  auto it = m_block_index.find(hash);
  if (it != m_block_index.end()) {
    return &it->second;
  }

  CBlockIndex* pprev = LookupBlockIndex(block.parent_id);
  if (!pprev) {
    LOG_CHAIN_ERROR("AddToBlockIndex: orphan block {} (parent {} not found)", ShortHash(hash),
                    ShortHash(block.parent_id));
    return nullptr;
  }

  auto [iter, _] = m_block_index.try_emplace(hash, block);
  CBlockIndex* pindex = &iter->second;
  pindex->m_block_hash = hash;
  pindex->pprev = pprev;
  pindex->nHeight = pprev->nHeight + 1;
  // Work is credited for the target the block actually had to meet.
  pindex->nChainWork = pprev->nChainWork + GetBlockProof(pprev->nChildTarget);
  pindex->BuildSkip();
  pindex->nChildTarget = consensus::CalculateChildTarget(*pindex, params);
  pindex->nSequenceId = m_next_sequence_id++;
  pindex->nTimeReceived = util::GetTime();

  m_children.insert({pprev, pindex});
  return pindex;
}

std::vector<uint256> BlockManager::RemoveSubtree(CBlockIndex* pindex) {
  std::vector<uint256> removed;
  if (!pindex)
    return removed;
  const uint256 root = pindex->GetBlockHash();

  // Collect depth-first, erase leaves first so no node outlives its parent.
  std::vector<CBlockIndex*> order;
  std::vector<CBlockIndex*> stack{pindex};
  while (!stack.empty()) {
    CBlockIndex* node = stack.back();
    stack.pop_back();
    order.push_back(node);
    auto range = m_children.equal_range(node);
    for (auto child = range.first; child != range.second; ++child) {
      stack.push_back(child->second);
    }
  }

  for (auto node = order.rbegin(); node != order.rend(); ++node) {
    CBlockIndex* victim = *node;
    if (m_active_chain.Contains(victim)) {
      LOG_CHAIN_ERROR("RemoveSubtree: refusing to erase active block {}", ShortHash(victim->GetBlockHash()));
      continue;
    }
    m_children.erase(victim);
    if (victim->pprev) {
      auto range = m_children.equal_range(victim->pprev);
      for (auto child = range.first; child != range.second; ++child) {
        if (child->second == victim) {
          m_children.erase(child);
          break;
        }
      }
    }
    const uint256 hash = victim->GetBlockHash();
    m_block_index.erase(hash);
    removed.push_back(hash);
  }

  LOG_CHAIN_DEBUG("Removed {} blocks rooted at {}", removed.size(), ShortHash(root));
  return removed;
}

std::vector<CBlockIndex*> BlockManager::GetChildren(const CBlockIndex* pindex) const {
  std::vector<CBlockIndex*> children;
  auto range = m_children.equal_range(pindex);
  for (auto it = range.first; it != range.second; ++it) {
    children.push_back(it->second);
  }
  return children;
}

bool BlockManager::HasChildren(const CBlockIndex* pindex) const {
  if (!pindex) {
    return false;
  }
  return m_children.find(pindex) != m_children.end();
}

std::vector<const CBlockIndex*> BlockManager::GetLeaves() const {
  std::vector<const CBlockIndex*> leaves;
  for (const auto& [hash, node] : m_block_index) {
    if (!HasChildren(&node)) {
      leaves.push_back(&node);
    }
  }
  return leaves;
}

bool BlockManager::Save(const std::string& filepath, const std::set<uint256>& dos_blocks) const {
  using json = nlohmann::json;

  try {
    LOG_CHAIN_TRACE("Saving {} blocks to {}", m_block_index.size(), filepath);

    json root;
    root["version"] = BLOCK_FILE_VERSION;
    root["genesis_hash"] = m_genesis_hash.ToString();
    root["tip_hash"] = m_active_chain.Tip() ? m_active_chain.Tip()->GetBlockHash().ToString() : "";

    // First-seen order replays into the same tie-breaks.
    std::vector<const CBlockIndex*> sorted;
    sorted.reserve(m_block_index.size());
    for (const auto& [hash, node] : m_block_index) {
      sorted.push_back(&node);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const CBlockIndex* a, const CBlockIndex* b) { return a->nSequenceId < b->nSequenceId; });

    json blocks = json::array();
    for (const CBlockIndex* node : sorted) {
      json entry;
      entry["hash"] = node->GetBlockHash().ToString();
      entry["height"] = node->nHeight;
      entry["data"] = util::HexStr(node->block.Serialize());
      blocks.push_back(std::move(entry));
    }
    root["blocks"] = std::move(blocks);

    json dos = json::array();
    for (const auto& hash : dos_blocks) {
      dos.push_back(hash.ToString());
    }
    root["dos_blocks"] = std::move(dos);

    if (!util::atomic_write_file(std::filesystem::path(filepath), root.dump(2))) {
      LOG_CHAIN_ERROR("Failed to atomically write blocks to {}", filepath);
      return false;
    }

    LOG_CHAIN_DEBUG("Saved {} blocks to {}", m_block_index.size(), filepath);
    return true;

  } catch (const std::exception& e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

LoadResult BlockManager::ReadBlockFile(const std::string& filepath, const uint256& expected_genesis_hash,
                                       BlockFile& out) {
  using json = nlohmann::json;

  if (!std::filesystem::exists(filepath)) {
    LOG_CHAIN_TRACE("Block file not found: {} (starting fresh)", filepath);
    return LoadResult::FILE_NOT_FOUND;
  }

  try {
    const std::string contents = util::read_file_string(filepath);
    const json root = json::parse(contents);

    if (root.value("version", 0) != BLOCK_FILE_VERSION) {
      LOG_CHAIN_ERROR("Unsupported block file version in {}", filepath);
      return LoadResult::CORRUPTED;
    }

    const auto genesis_hash = uint256::FromHex(root.value("genesis_hash", ""));
    if (!genesis_hash || *genesis_hash != expected_genesis_hash) {
      LOG_CHAIN_ERROR("GENESIS MISMATCH: {} does not belong to genesis {}", filepath, ShortHash(expected_genesis_hash));
      return LoadResult::CORRUPTED;
    }

    const auto tip = uint256::FromHex(root.value("tip_hash", ""));
    if (!tip) {
      LOG_CHAIN_ERROR("Block file {} has no valid tip", filepath);
      return LoadResult::CORRUPTED;
    }

    if (!root.contains("blocks") || !root["blocks"].is_array()) {
      LOG_CHAIN_ERROR("Block file missing 'blocks' array");
      return LoadResult::CORRUPTED;
    }

    BlockFile file;
    file.tip = *tip;
    for (const auto& entry : root["blocks"]) {
      if (!entry.contains("hash") || !entry.contains("data")) {
        LOG_CHAIN_ERROR("Block entry missing required field. File corrupted.");
        return LoadResult::CORRUPTED;
      }
      const auto hash = uint256::FromHex(entry["hash"].get<std::string>());
      const auto bytes = util::TryParseHex(entry["data"].get<std::string>());
      if (!hash || !bytes) {
        LOG_CHAIN_ERROR("Block entry is not valid hex. File corrupted.");
        return LoadResult::CORRUPTED;
      }
      Block block = Block::Deserialize(*bytes);
      const uint256 recomputed = block.GetHash();
      if (recomputed != *hash) {
        LOG_CHAIN_ERROR("CORRUPTION DETECTED: stored hash {} does not match recomputed hash {}", ShortHash(*hash),
                        ShortHash(recomputed));
        return LoadResult::CORRUPTED;
      }
      file.blocks.push_back(std::move(block));
    }

    if (root.contains("dos_blocks")) {
      for (const auto& entry : root["dos_blocks"]) {
        const auto hash = uint256::FromHex(entry.get<std::string>());
        if (!hash) {
          LOG_CHAIN_ERROR("Invalid poisoned block id in {}", filepath);
          return LoadResult::CORRUPTED;
        }
        file.dos_blocks.push_back(*hash);
      }
    }

    out = std::move(file);
    LOG_CHAIN_DEBUG("Read {} blocks from {}", out.blocks.size(), filepath);
    return LoadResult::SUCCESS;

  } catch (const std::exception& e) {
    LOG_CHAIN_ERROR("Exception during block file read: {}", e.what());
    return LoadResult::CORRUPTED;
  }
}

}  // namespace chain
}  // namespace strata
