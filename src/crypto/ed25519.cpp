// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "crypto/ed25519.hpp"

#include "util/logging.hpp"

#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace strata {
namespace crypto {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

std::string LastOpenSSLError() {
  char buf[256];
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  return buf;
}

}  // namespace

std::optional<Ed25519KeyPair> GenerateEd25519Key() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    LOG_CRYPTO_ERROR("ed25519 keygen init failed: {}", LastOpenSSLError());
    return std::nullopt;
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    LOG_CRYPTO_ERROR("ed25519 keygen failed: {}", LastOpenSSLError());
    return std::nullopt;
  }
  PkeyPtr pkey(raw);

  Ed25519KeyPair pair;
  pair.public_key.resize(ED25519_PUBLIC_KEY_SIZE);
  pair.private_key.resize(ED25519_PRIVATE_KEY_SIZE);
  size_t pub_len = pair.public_key.size();
  size_t priv_len = pair.private_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), pair.public_key.data(), &pub_len) != 1 ||
      EVP_PKEY_get_raw_private_key(pkey.get(), pair.private_key.data(), &priv_len) != 1) {
    LOG_CRYPTO_ERROR("ed25519 key export failed: {}", LastOpenSSLError());
    return std::nullopt;
  }
  return pair;
}

std::optional<std::vector<uint8_t>> SignEd25519(std::span<const uint8_t> private_key,
                                                std::span<const uint8_t> message) {
  if (private_key.size() != ED25519_PRIVATE_KEY_SIZE) {
    return std::nullopt;
  }
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size()));
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!pkey || !ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    LOG_CRYPTO_ERROR("ed25519 sign init failed: {}", LastOpenSSLError());
    return std::nullopt;
  }
  std::vector<uint8_t> sig(ED25519_SIGNATURE_SIZE);
  size_t sig_len = sig.size();
  if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message.data(), message.size()) != 1 ||
      sig_len != ED25519_SIGNATURE_SIZE) {
    LOG_CRYPTO_ERROR("ed25519 sign failed: {}", LastOpenSSLError());
    return std::nullopt;
  }
  return sig;
}

bool VerifyEd25519(std::span<const uint8_t> public_key, std::span<const uint8_t> message,
                   std::span<const uint8_t> signature) {
  if (public_key.size() != ED25519_PUBLIC_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE) {
    return false;
  }
  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!pkey) {
    LOG_CRYPTO_DEBUG("rejecting malformed ed25519 public key");
    ERR_clear_error();
    return false;
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    LOG_CRYPTO_ERROR("ed25519 verify init failed: {}", LastOpenSSLError());
    return false;
  }
  const bool ok =
      EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
  ERR_clear_error();
  return ok;
}

}  // namespace crypto
}  // namespace strata
