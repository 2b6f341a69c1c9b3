// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_index.hpp"

#include <vector>

namespace strata {
namespace chain {

// CChain - The current path: genesis to tip, indexed by height.
// Does NOT own the CBlockIndex objects.
class CChain {
private:
  std::vector<CBlockIndex*> vChain;

public:
  CChain() = default;

  CChain(const CChain&) = delete;
  CChain& operator=(const CChain&) = delete;

  CBlockIndex* Genesis() const { return vChain.empty() ? nullptr : vChain.front(); }
  CBlockIndex* Tip() const { return vChain.empty() ? nullptr : vChain.back(); }

  CBlockIndex* operator[](int nHeight) const {
    if (nHeight < 0 || nHeight >= static_cast<int>(vChain.size()))
      return nullptr;
    return vChain[static_cast<size_t>(nHeight)];
  }

  bool Contains(const CBlockIndex* pindex) const {
    if (!pindex)
      return false;
    return (*this)[pindex->nHeight] == pindex;
  }

  // Tip height, -1 when empty
  int Height() const { return static_cast<int>(vChain.size()) - 1; }

  // Rebuilds the path by walking back from |block|. Only the entries that
  // differ from the current path are rewritten.
  void SetTip(CBlockIndex& block);

  void Clear() { vChain.clear(); }

  // Last node shared by this path and the branch ending at |pindex|.
  const CBlockIndex* FindFork(const CBlockIndex* pindex) const;
};

}  // namespace chain
}  // namespace strata
