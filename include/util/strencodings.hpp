// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata {
namespace util {

std::string HexStr(std::span<const uint8_t> data);

// Returns nullopt on odd length or a non-hex character.
std::optional<std::vector<uint8_t>> TryParseHex(std::string_view str);

}  // namespace util
}  // namespace strata
