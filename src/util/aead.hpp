#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace autopay::util {

constexpr std::size_t kChaCha20Poly1305KeySize = 32;
constexpr std::size_t kChaCha20Poly1305NonceSize = 12;
constexpr std::size_t kChaCha20Poly1305TagSize = 16;

// RFC 8439 AEAD. Returns ciphertext || tag. Throws std::invalid_argument on a
// bad key or nonce length.
std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext);

// Returns false (and leaves `plaintext` empty) when authentication fails;
// unauthenticated bytes are never released.
bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext_and_tag,
                             std::vector<std::uint8_t>* plaintext);

}  // namespace autopay::util
