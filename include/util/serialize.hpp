// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {
namespace util {

class DeserializeError : public std::runtime_error {
public:
  explicit DeserializeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Canonical consensus encoding.
 *
 * Integers are 8-byte little-endian, variable-length fields carry an 8-byte
 * length prefix, 256-bit ids are written as their 32 raw bytes and 256-bit
 * amounts as 32 big-endian bytes. Every hash that feeds an identifier is
 * taken over this encoding, so it must never change.
 */
class Encoder {
public:
  Encoder& WriteU8(uint8_t v) {
    buf_.push_back(v);
    return *this;
  }
  Encoder& WriteU64(uint64_t v);
  Encoder& WriteBool(bool v) { return WriteU8(v ? 1 : 0); }
  Encoder& WriteRaw(std::span<const uint8_t> data);
  // Length prefix followed by the bytes.
  Encoder& WriteBytes(std::span<const uint8_t> data);
  Encoder& WriteString(const std::string& s);
  Encoder& WriteUint256(const uint256& v) { return WriteRaw(std::span<const uint8_t>(v.data(), v.size())); }
  Encoder& WriteArith(const arith_uint256& v) { return WriteUint256(ArithToUint256(v)); }

  const std::vector<uint8_t>& Data() const { return buf_; }
  std::vector<uint8_t> Release() { return std::move(buf_); }
  size_t Size() const { return buf_.size(); }

private:
  std::vector<uint8_t> buf_;
};

/** Reads the Encoder format. Throws DeserializeError on truncated input. */
class Decoder {
public:
  explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

  uint8_t ReadU8();
  uint64_t ReadU64();
  bool ReadBool();
  std::vector<uint8_t> ReadBytes();
  std::string ReadString();
  uint256 ReadUint256();
  arith_uint256 ReadArith() { return UintToArith256(ReadUint256()); }

  // Reads a length prefix for a sequence whose elements take at least
  // |min_element_size| bytes, rejecting counts the remaining input cannot hold.
  uint64_t ReadLength(size_t min_element_size);

  size_t Remaining() const { return data_.size() - pos_; }
  bool Empty() const { return Remaining() == 0; }

private:
  void Require(size_t n) const;

  std::span<const uint8_t> data_;
  size_t pos_{0};
};

// Sequences of types exposing Encode(Encoder&) and static Decode(Decoder&).
template <typename T>
void EncodeVector(Encoder& enc, const std::vector<T>& items) {
  enc.WriteU64(items.size());
  for (const auto& item : items) {
    item.Encode(enc);
  }
}

template <typename T>
std::vector<T> DecodeVector(Decoder& dec, size_t min_element_size = 1) {
  const uint64_t n = dec.ReadLength(min_element_size);
  std::vector<T> items;
  items.reserve(n);
  for (uint64_t i = 0; i < n; ++i) {
    items.push_back(T::Decode(dec));
  }
  return items;
}

}  // namespace util
}  // namespace strata
