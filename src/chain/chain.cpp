// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "chain/chain.hpp"

namespace strata {
namespace chain {

void CChain::SetTip(CBlockIndex& block) {
  CBlockIndex* pindex = &block;
  vChain.resize(static_cast<size_t>(pindex->nHeight) + 1);
  while (pindex && vChain[static_cast<size_t>(pindex->nHeight)] != pindex) {
    vChain[static_cast<size_t>(pindex->nHeight)] = pindex;
    pindex = pindex->pprev;
  }
}

const CBlockIndex* CChain::FindFork(const CBlockIndex* pindex) const {
  if (pindex == nullptr)
    return nullptr;
  if (pindex->nHeight > Height())
    pindex = pindex->GetAncestor(Height());
  while (pindex && !Contains(pindex))
    pindex = pindex->pprev;
  return pindex;
}

}  // namespace chain
}  // namespace strata
