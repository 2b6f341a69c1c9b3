// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/sha256.hpp"

#include <stdexcept>

#include <openssl/evp.h>

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ == nullptr) {
    throw std::bad_alloc();
  }
  Reset();
}

CSHA256::~CSHA256() {
  EVP_MD_CTX_free(ctx_);
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_, hash, &out_len) != 1 || out_len != OUTPUT_SIZE) {
    throw std::runtime_error("SHA-256 finalize failed");
  }
}

CSHA256& CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 init failed");
  }
  return *this;
}
