// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <compare>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

class uint256;

class uint_error : public std::runtime_error {
public:
  explicit uint_error(const std::string& str) : std::runtime_error(str) {}
};

/** Template base class for unsigned big integers. Limbs are little-endian. */
template <unsigned int BITS>
class base_uint {
protected:
  static_assert(BITS / 32 > 0 && BITS % 32 == 0, "Template parameter BITS must be a positive multiple of 32.");
  static constexpr int WIDTH = BITS / 32;
  uint32_t pn[WIDTH];

public:
  base_uint() {
    for (int i = 0; i < WIDTH; i++)
      pn[i] = 0;
  }

  base_uint(const base_uint& b) = default;
  base_uint& operator=(const base_uint& b) = default;

  base_uint(uint64_t b) {
    pn[0] = (unsigned int)b;
    pn[1] = (unsigned int)(b >> 32);
    for (int i = 2; i < WIDTH; i++)
      pn[i] = 0;
  }

  base_uint operator~() const {
    base_uint ret;
    for (int i = 0; i < WIDTH; i++)
      ret.pn[i] = ~pn[i];
    return ret;
  }

  base_uint operator-() const {
    base_uint ret;
    for (int i = 0; i < WIDTH; i++)
      ret.pn[i] = ~pn[i];
    ++ret;
    return ret;
  }

  double getdouble() const;

  base_uint& operator=(uint64_t b) {
    pn[0] = (unsigned int)b;
    pn[1] = (unsigned int)(b >> 32);
    for (int i = 2; i < WIDTH; i++)
      pn[i] = 0;
    return *this;
  }

  base_uint& operator^=(const base_uint& b) {
    for (int i = 0; i < WIDTH; i++)
      pn[i] ^= b.pn[i];
    return *this;
  }

  base_uint& operator&=(const base_uint& b) {
    for (int i = 0; i < WIDTH; i++)
      pn[i] &= b.pn[i];
    return *this;
  }

  base_uint& operator|=(const base_uint& b) {
    for (int i = 0; i < WIDTH; i++)
      pn[i] |= b.pn[i];
    return *this;
  }

  base_uint& operator<<=(unsigned int shift);
  base_uint& operator>>=(unsigned int shift);

  base_uint& operator+=(const base_uint& b) {
    uint64_t carry = 0;
    for (int i = 0; i < WIDTH; i++) {
      uint64_t n = carry + pn[i] + b.pn[i];
      pn[i] = n & 0xffffffff;
      carry = n >> 32;
    }
    return *this;
  }

  base_uint& operator-=(const base_uint& b) {
    *this += -b;
    return *this;
  }

  base_uint& operator+=(uint64_t b64) {
    base_uint b;
    b = b64;
    *this += b;
    return *this;
  }

  base_uint& operator-=(uint64_t b64) {
    base_uint b;
    b = b64;
    *this += -b;
    return *this;
  }

  base_uint& operator*=(uint32_t b32);
  base_uint& operator*=(const base_uint& b);
  // Throws uint_error on division by zero.
  base_uint& operator/=(const base_uint& b);
  base_uint& operator%=(const base_uint& b);

  base_uint& operator++() {
    int i = 0;
    while (i < WIDTH && ++pn[i] == 0)
      i++;
    return *this;
  }

  base_uint& operator--() {
    int i = 0;
    while (i < WIDTH && --pn[i] == std::numeric_limits<uint32_t>::max())
      i++;
    return *this;
  }

  int CompareTo(const base_uint& b) const;
  bool EqualTo(uint64_t b) const;

  friend inline base_uint operator+(const base_uint& a, const base_uint& b) { return base_uint(a) += b; }
  friend inline base_uint operator-(const base_uint& a, const base_uint& b) { return base_uint(a) -= b; }
  friend inline base_uint operator*(const base_uint& a, const base_uint& b) { return base_uint(a) *= b; }
  friend inline base_uint operator/(const base_uint& a, const base_uint& b) { return base_uint(a) /= b; }
  friend inline base_uint operator%(const base_uint& a, const base_uint& b) { return base_uint(a) %= b; }
  friend inline base_uint operator|(const base_uint& a, const base_uint& b) { return base_uint(a) |= b; }
  friend inline base_uint operator&(const base_uint& a, const base_uint& b) { return base_uint(a) &= b; }
  friend inline base_uint operator^(const base_uint& a, const base_uint& b) { return base_uint(a) ^= b; }
  friend inline base_uint operator>>(const base_uint& a, int shift) { return base_uint(a) >>= shift; }
  friend inline base_uint operator<<(const base_uint& a, int shift) { return base_uint(a) <<= shift; }
  friend inline base_uint operator*(const base_uint& a, uint32_t b) { return base_uint(a) *= b; }
  friend inline bool operator==(const base_uint& a, const base_uint& b) {
    return memcmp(a.pn, b.pn, sizeof(a.pn)) == 0;
  }
  friend inline std::strong_ordering operator<=>(const base_uint& a, const base_uint& b) {
    return a.CompareTo(b) <=> 0;
  }
  friend inline bool operator==(const base_uint& a, uint64_t b) { return a.EqualTo(b); }

  // Hex, most significant digit first.
  std::string GetHex() const;
  // Decimal, used for currency amounts in logs.
  std::string ToDecimal() const;
  std::string ToString() const { return ToDecimal(); }

  bool IsZero() const {
    for (int i = 0; i < WIDTH; i++)
      if (pn[i] != 0)
        return false;
    return true;
  }

  unsigned int size() const { return sizeof(pn); }

  // Position of the highest set bit plus one, 0 for zero.
  unsigned int bits() const;

  uint64_t GetLow64() const { return pn[0] | (uint64_t)pn[1] << 32; }
};

/** 256-bit unsigned big integer. */
class arith_uint256 : public base_uint<256> {
public:
  arith_uint256() = default;
  arith_uint256(const base_uint<256>& b) : base_uint<256>(b) {}
  arith_uint256(uint64_t b) : base_uint<256>(b) {}

  friend uint256 ArithToUint256(const arith_uint256&);
  friend arith_uint256 UintToArith256(const uint256&);
};

// Byte 0 of the blob is the most significant byte of the number.
uint256 ArithToUint256(const arith_uint256&);
arith_uint256 UintToArith256(const uint256&);

extern template class base_uint<256>;
