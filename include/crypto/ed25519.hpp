// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace strata {
namespace crypto {

constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

struct Ed25519KeyPair {
  std::vector<uint8_t> public_key;
  std::vector<uint8_t> private_key;
};

// Fresh key pair from the OpenSSL RNG. nullopt if OpenSSL fails.
std::optional<Ed25519KeyPair> GenerateEd25519Key();

std::optional<std::vector<uint8_t>> SignEd25519(std::span<const uint8_t> private_key,
                                                std::span<const uint8_t> message);

// False for malformed keys or signatures as well as for bad signatures.
bool VerifyEd25519(std::span<const uint8_t> public_key, std::span<const uint8_t> message,
                   std::span<const uint8_t> signature);

}  // namespace crypto
}  // namespace strata
