// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/strencodings.hpp"

namespace strata {
namespace util {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string HexStr(std::span<const uint8_t> data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> TryParseHex(std::string_view str) {
  if (str.size() % 2 != 0)
    return std::nullopt;
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexDigit(str[i]);
    int lo = HexDigit(str[i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

}  // namespace util
}  // namespace strata
