// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/block_index.hpp"
#include "chain/chain.hpp"
#include "util/uint.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace strata {
namespace chain {

struct ConsensusParams;

// Result of loading a block file from disk
enum class LoadResult {
  SUCCESS,         // Loaded successfully
  FILE_NOT_FOUND,  // File doesn't exist (OK to start fresh)
  CORRUPTED        // File exists but is corrupted/invalid
};

// Contents of a saved block file, in the order the blocks were first seen.
struct BlockFile {
  std::vector<Block> blocks;
  std::vector<uint256> dos_blocks;
  uint256 tip;
};

// BlockManager - Owns every known block node and the active chain
//
// THREAD SAFETY: NO internal synchronization - caller MUST serialize all access.
// BlockManager is a PRIVATE member of ChainstateManager, whose validation
// mutex protects every method.
class BlockManager {
public:
  BlockManager();
  ~BlockManager();

  bool Initialize(const Block& genesis, const ConsensusParams& params);

  // Look up block by hash (returns nullptr if not found)
  CBlockIndex* LookupBlockIndex(const uint256& hash);
  const CBlockIndex* LookupBlockIndex(const uint256& hash) const;

  // Insert a block whose parent is known. Sets parent pointer, height,
  // weight, the target its children must meet and the first-seen sequence
  // number. Returns the existing node if the block is already known and
  // nullptr if the parent is not.
  CBlockIndex* AddToBlockIndex(const Block& block, const uint256& hash, const ConsensusParams& params);

  // Erase |pindex| and every descendant. None of them may be on the active
  // chain. Returns the hashes removed.
  std::vector<uint256> RemoveSubtree(CBlockIndex* pindex);

  std::vector<CBlockIndex*> GetChildren(const CBlockIndex* pindex) const;
  bool HasChildren(const CBlockIndex* pindex) const;

  // Nodes without children.
  std::vector<const CBlockIndex*> GetLeaves() const;

  CChain& ActiveChain() { return m_active_chain; }
  const CChain& ActiveChain() const { return m_active_chain; }

  CBlockIndex* GetTip() { return m_active_chain.Tip(); }
  const CBlockIndex* GetTip() const { return m_active_chain.Tip(); }

  void SetActiveTip(CBlockIndex& block) { m_active_chain.SetTip(block); }

  size_t GetBlockCount() const { return m_block_index.size(); }

  const std::map<uint256, CBlockIndex>& GetBlockIndex() const { return m_block_index; }

  const uint256& GetGenesisHash() const { return m_genesis_hash; }

  // Write every block in first-seen order plus the poisoned ids and the
  // active tip. The file is replaced atomically.
  bool Save(const std::string& filepath, const std::set<uint256>& dos_blocks) const;

  // Parse a file written by Save(). Block bytes are decoded and their ids
  // checked; nothing is validated against consensus rules.
  static LoadResult ReadBlockFile(const std::string& filepath, const uint256& expected_genesis_hash, BlockFile& out);

private:
  // Map of all known blocks: hash -> CBlockIndex (map owns CBlockIndex objects)
  std::map<uint256, CBlockIndex> m_block_index;

  // Parent -> children; multiple children per parent on forks
  std::multimap<const CBlockIndex*, CBlockIndex*> m_children;

  // Active chain (points to CBlockIndex objects owned by m_block_index)
  CChain m_active_chain;

  uint256 m_genesis_hash;
  uint64_t m_next_sequence_id{0};
  bool m_initialized{false};
};

}  // namespace chain
}  // namespace strata
