// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/uint.hpp"

#include "util/strencodings.hpp"

#include <stdexcept>

template <unsigned int BITS>
base_blob<BITS>::base_blob(std::span<const uint8_t> vch) {
  if (vch.size() != WIDTH) {
    throw std::invalid_argument("base_blob: wrong input length");
  }
  std::copy(vch.begin(), vch.end(), m_data.begin());
}

template <unsigned int BITS>
std::string base_blob<BITS>::GetHex() const {
  return strata::util::HexStr(m_data);
}

template class base_blob<256>;

const uint256 uint256::ZERO{};

std::optional<uint256> uint256::FromHex(std::string_view hex) {
  if (hex.size() != size() * 2)
    return std::nullopt;
  auto bytes = strata::util::TryParseHex(hex);
  if (!bytes)
    return std::nullopt;
  return uint256(*bytes);
}
