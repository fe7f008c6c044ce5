#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "util/argon2_kdf.hpp"

namespace autopay::wallet {

constexpr std::size_t kSecretSaltSize = 16;

// Passphrase-sealed blob: Argon2id(passphrase, salt) keys ChaCha20-Poly1305.
// The caller's associated data (the wallet address) is authenticated but not
// stored, so a blob cannot be replayed under another address.
struct SealedSecret {
  std::vector<std::uint8_t> ciphertext;  // ciphertext || tag
  std::vector<std::uint8_t> salt;
  std::vector<std::uint8_t> nonce;
  util::Argon2idParams kdf{};
};

bool SealSecret(std::span<const std::uint8_t> secret, const std::string& passphrase,
                std::span<const std::uint8_t> associated_data,
                const util::Argon2idParams& params, SealedSecret* out,
                std::string* error = nullptr);

// False on a wrong passphrase, mismatched associated data, tampering or
// out-of-range KDF parameters; the caller cannot tell these apart.
bool OpenSecret(const SealedSecret& sealed, const std::string& passphrase,
                std::span<const std::uint8_t> associated_data,
                std::vector<std::uint8_t>* secret);

}  // namespace autopay::wallet
