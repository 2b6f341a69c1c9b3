// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include "util/sha256.hpp"
#include "util/uint.hpp"

#include <span>
#include <vector>

/** Double SHA-256, used for every consensus identifier. */
class CHash256 {
private:
  CSHA256 sha;

public:
  static const size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

  void Finalize(uint256& output) {
    unsigned char buf[CSHA256::OUTPUT_SIZE];
    sha.Finalize(buf);
    sha.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(output.begin());
  }

  CHash256& Write(const unsigned char* data, size_t len) {
    sha.Write(data, len);
    return *this;
  }

  CHash256& Write(std::span<const uint8_t> data) { return Write(data.data(), data.size()); }

  CHash256& Reset() {
    sha.Reset();
    return *this;
  }
};

inline uint256 Hash(std::span<const uint8_t> data) {
  uint256 result;
  CHash256().Write(data).Finalize(result);
  return result;
}

inline uint256 Hash(const std::vector<uint8_t>& data) {
  return Hash(std::span<const uint8_t>(data));
}
