#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "crypto/keccak.hpp"

namespace autopay::crypto {

constexpr std::size_t kPrivateKeySize = 32;
constexpr std::size_t kPublicKeySize = 64;       // uncompressed x || y, no 0x04 prefix
constexpr std::size_t kRecoverableSignatureSize = 65;

using PrivateKey = std::array<std::uint8_t, kPrivateKeySize>;
using PublicKey = std::array<std::uint8_t, kPublicKeySize>;

struct RecoverableSignature {
  std::array<std::uint8_t, 32> r{};
  std::array<std::uint8_t, 32> s{};
  std::uint8_t recovery_id{0};

  // r || s || v with v = 27 + recovery_id, the layout EVM verifiers expect.
  std::array<std::uint8_t, kRecoverableSignatureSize> Serialize() const;
};

// Nonzero and strictly below the group order.
bool IsValidPrivateKey(std::span<const std::uint8_t> key);

std::optional<PublicKey> DerivePublicKey(const PrivateKey& key);

// ECDSA over a 32-byte digest. The signature is normalized to low-s and the
// recovery id is computed so that RecoverPublicKey yields the signer's key.
std::optional<RecoverableSignature> SignDigest(const PrivateKey& key, const Hash256& digest);

std::optional<PublicKey> RecoverPublicKey(const Hash256& digest,
                                          const RecoverableSignature& signature);

}  // namespace autopay::crypto
