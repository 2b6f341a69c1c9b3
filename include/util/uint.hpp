// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * Fixed-size opaque byte blob.
 *
 * Bytes are kept in hashing order and printed in that order. When a blob is
 * read as a number (target comparisons, see arith_uint256.hpp) byte 0 is the
 * most significant.
 */
template <unsigned int BITS>
class base_blob {
protected:
  static constexpr size_t WIDTH = BITS / 8;
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  // |vch| must be exactly WIDTH bytes.
  explicit base_blob(std::span<const uint8_t> vch);

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(), [](uint8_t b) { return b == 0; });
  }
  constexpr void SetNull() { m_data.fill(0); }

  friend constexpr bool operator==(const base_blob& a, const base_blob& b) { return a.m_data == b.m_data; }
  friend constexpr std::strong_ordering operator<=>(const base_blob& a, const base_blob& b) {
    return a.m_data <=> b.m_data;
  }

  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }

  constexpr uint8_t* data() { return m_data.data(); }
  constexpr const uint8_t* data() const { return m_data.data(); }
  constexpr uint8_t* begin() { return m_data.data(); }
  constexpr uint8_t* end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t* begin() const { return m_data.data(); }
  constexpr const uint8_t* end() const { return m_data.data() + WIDTH; }
  static constexpr size_t size() { return WIDTH; }
};

class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  explicit uint256(std::span<const uint8_t> vch) : base_blob<256>(vch) {}

  // Parses exactly 64 hex characters.
  static std::optional<uint256> FromHex(std::string_view hex);

  static const uint256 ZERO;
};

// Lets uint256 key std::unordered_map. Ids are hash outputs, so the leading
// bytes are already uniformly distributed.
struct Uint256Hasher {
  size_t operator()(const uint256& id) const {
    size_t out;
    std::memcpy(&out, id.data(), sizeof(out));
    return out;
  }
};
