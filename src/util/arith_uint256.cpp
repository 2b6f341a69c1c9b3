// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/arith_uint256.hpp"

#include "util/uint.hpp"

#include <algorithm>
#include <limits>

template <unsigned int BITS>
base_uint<BITS>& base_uint<BITS>::operator<<=(unsigned int shift) {
  base_uint<BITS> a(*this);
  for (int i = 0; i < WIDTH; i++)
    pn[i] = 0;
  int k = shift / 32;
  shift = shift % 32;
  for (int i = 0; i < WIDTH; i++) {
    if (i + k + 1 < WIDTH && shift != 0)
      pn[i + k + 1] |= (a.pn[i] >> (32 - shift));
    if (i + k < WIDTH)
      pn[i + k] |= (a.pn[i] << shift);
  }
  return *this;
}

template <unsigned int BITS>
base_uint<BITS>& base_uint<BITS>::operator>>=(unsigned int shift) {
  base_uint<BITS> a(*this);
  for (int i = 0; i < WIDTH; i++)
    pn[i] = 0;
  int k = shift / 32;
  shift = shift % 32;
  for (int i = 0; i < WIDTH; i++) {
    if (i - k - 1 >= 0 && shift != 0)
      pn[i - k - 1] |= (a.pn[i] << (32 - shift));
    if (i - k >= 0)
      pn[i - k] |= (a.pn[i] >> shift);
  }
  return *this;
}

template <unsigned int BITS>
base_uint<BITS>& base_uint<BITS>::operator*=(uint32_t b32) {
  uint64_t carry = 0;
  for (int i = 0; i < WIDTH; i++) {
    uint64_t n = carry + (uint64_t)b32 * pn[i];
    pn[i] = n & 0xffffffff;
    carry = n >> 32;
  }
  return *this;
}

template <unsigned int BITS>
base_uint<BITS>& base_uint<BITS>::operator*=(const base_uint& b) {
  base_uint<BITS> a;
  for (int j = 0; j < WIDTH; j++) {
    uint64_t carry = 0;
    for (int i = 0; i + j < WIDTH; i++) {
      uint64_t n = carry + a.pn[i + j] + (uint64_t)pn[j] * b.pn[i];
      a.pn[i + j] = n & 0xffffffff;
      carry = n >> 32;
    }
  }
  *this = a;
  return *this;
}

template <unsigned int BITS>
base_uint<BITS>& base_uint<BITS>::operator/=(const base_uint& b) {
  base_uint<BITS> div = b;
  base_uint<BITS> num = *this;
  *this = 0;
  int num_bits = num.bits();
  int div_bits = div.bits();
  if (div_bits == 0)
    throw uint_error("Division by zero");
  if (div_bits > num_bits)
    return *this;
  int shift = num_bits - div_bits;
  div <<= shift;
  while (shift >= 0) {
    if (num >= div) {
      num -= div;
      pn[shift / 32] |= (1U << (shift & 31));
    }
    div >>= 1;
    shift--;
  }
  return *this;
}

template <unsigned int BITS>
base_uint<BITS>& base_uint<BITS>::operator%=(const base_uint& b) {
  base_uint<BITS> quotient = *this;
  quotient /= b;
  *this -= quotient * b;
  return *this;
}

template <unsigned int BITS>
int base_uint<BITS>::CompareTo(const base_uint<BITS>& b) const {
  for (int i = WIDTH - 1; i >= 0; i--) {
    if (pn[i] < b.pn[i])
      return -1;
    if (pn[i] > b.pn[i])
      return 1;
  }
  return 0;
}

template <unsigned int BITS>
bool base_uint<BITS>::EqualTo(uint64_t b) const {
  for (int i = WIDTH - 1; i >= 2; i--) {
    if (pn[i])
      return false;
  }
  if (pn[1] != (b >> 32))
    return false;
  if (pn[0] != (b & 0xfffffffful))
    return false;
  return true;
}

template <unsigned int BITS>
double base_uint<BITS>::getdouble() const {
  double ret = 0.0;
  double fact = 1.0;
  for (int i = 0; i < WIDTH; i++) {
    ret += fact * pn[i];
    fact *= 4294967296.0;
  }
  return ret;
}

template <unsigned int BITS>
std::string base_uint<BITS>::GetHex() const {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(WIDTH * 8);
  for (int i = WIDTH - 1; i >= 0; i--) {
    for (int s = 28; s >= 0; s -= 4) {
      out.push_back(kDigits[(pn[i] >> s) & 0xf]);
    }
  }
  return out;
}

template <unsigned int BITS>
std::string base_uint<BITS>::ToDecimal() const {
  if (IsZero())
    return "0";
  // Repeated division by 10^9 on a scratch copy.
  uint32_t limbs[WIDTH];
  std::copy(pn, pn + WIDTH, limbs);
  std::string out;
  bool nonzero = true;
  while (nonzero) {
    uint64_t rem = 0;
    nonzero = false;
    for (int i = WIDTH - 1; i >= 0; i--) {
      uint64_t cur = (rem << 32) | limbs[i];
      limbs[i] = static_cast<uint32_t>(cur / 1000000000u);
      rem = cur % 1000000000u;
      if (limbs[i] != 0)
        nonzero = true;
    }
    for (int d = 0; d < 9; d++) {
      out.push_back(static_cast<char>('0' + rem % 10));
      rem /= 10;
    }
  }
  while (out.size() > 1 && out.back() == '0')
    out.pop_back();
  std::reverse(out.begin(), out.end());
  return out;
}

template <unsigned int BITS>
unsigned int base_uint<BITS>::bits() const {
  for (int pos = WIDTH - 1; pos >= 0; pos--) {
    if (pn[pos]) {
      for (int nbits = 31; nbits > 0; nbits--) {
        if (pn[pos] & 1U << nbits)
          return 32 * pos + nbits + 1;
      }
      return 32 * pos + 1;
    }
  }
  return 0;
}

template class base_uint<256>;

uint256 ArithToUint256(const arith_uint256& a) {
  uint256 b;
  uint8_t* out = b.data();
  for (int x = 0; x < a.WIDTH; ++x) {
    uint32_t limb = a.pn[a.WIDTH - 1 - x];
    out[4 * x + 0] = static_cast<uint8_t>(limb >> 24);
    out[4 * x + 1] = static_cast<uint8_t>(limb >> 16);
    out[4 * x + 2] = static_cast<uint8_t>(limb >> 8);
    out[4 * x + 3] = static_cast<uint8_t>(limb);
  }
  return b;
}

arith_uint256 UintToArith256(const uint256& a) {
  arith_uint256 b;
  const uint8_t* in = a.data();
  for (int x = 0; x < b.WIDTH; ++x) {
    b.pn[b.WIDTH - 1 - x] = (uint32_t(in[4 * x]) << 24) | (uint32_t(in[4 * x + 1]) << 16) |
                            (uint32_t(in[4 * x + 2]) << 8) | uint32_t(in[4 * x + 3]);
  }
  return b;
}
