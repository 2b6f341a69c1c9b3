// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/serialize.hpp"

#include <fmt/format.h>

namespace strata {
namespace util {

Encoder& Encoder::WriteU64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
  return *this;
}

Encoder& Encoder::WriteRaw(std::span<const uint8_t> data) {
  buf_.insert(buf_.end(), data.begin(), data.end());
  return *this;
}

Encoder& Encoder::WriteBytes(std::span<const uint8_t> data) {
  WriteU64(data.size());
  return WriteRaw(data);
}

Encoder& Encoder::WriteString(const std::string& s) {
  return WriteBytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

void Decoder::Require(size_t n) const {
  if (Remaining() < n) {
    throw DeserializeError(fmt::format("unexpected end of data: need {} bytes at offset {}, have {}", n, pos_,
                                       Remaining()));
  }
}

uint8_t Decoder::ReadU8() {
  Require(1);
  return data_[pos_++];
}

uint64_t Decoder::ReadU64() {
  Require(8);
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
  }
  pos_ += 8;
  return v;
}

bool Decoder::ReadBool() {
  uint8_t b = ReadU8();
  if (b > 1) {
    throw DeserializeError(fmt::format("invalid boolean byte {}", b));
  }
  return b == 1;
}

uint64_t Decoder::ReadLength(size_t min_element_size) {
  uint64_t n = ReadU64();
  if (min_element_size > 0 && n > Remaining() / min_element_size) {
    throw DeserializeError(fmt::format("length {} exceeds remaining input", n));
  }
  return n;
}

std::vector<uint8_t> Decoder::ReadBytes() {
  uint64_t n = ReadLength(1);
  std::vector<uint8_t> out(data_.begin() + pos_, data_.begin() + pos_ + n);
  pos_ += n;
  return out;
}

std::string Decoder::ReadString() {
  auto bytes = ReadBytes();
  return std::string(bytes.begin(), bytes.end());
}

uint256 Decoder::ReadUint256() {
  Require(uint256::size());
  uint256 v(data_.subspan(pos_, uint256::size()));
  pos_ += uint256::size();
  return v;
}

}  // namespace util
}  // namespace strata
