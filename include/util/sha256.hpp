// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

struct evp_md_ctx_st;

/** Incremental SHA-256 backed by OpenSSL's EVP interface. */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();
  CSHA256(const CSHA256&) = delete;
  CSHA256& operator=(const CSHA256&) = delete;

  CSHA256& Write(const unsigned char* data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256& Reset();

private:
  evp_md_ctx_st* ctx_;
};
