#include "util/aead.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

#include "util/secure_wipe.hpp"

namespace autopay::util {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool ValidSizes(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
  return key.size() == kChaCha20Poly1305KeySize && nonce.size() == kChaCha20Poly1305NonceSize;
}

bool InitContext(EVP_CIPHER_CTX* ctx, bool encrypt, std::span<const std::uint8_t> key,
                 std::span<const std::uint8_t> nonce) {
  const int enc = encrypt ? 1 : 0;
  if (EVP_CipherInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, enc) != 1) {
    return false;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(kChaCha20Poly1305NonceSize), nullptr) != 1) {
    return false;
  }
  return EVP_CipherInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data(), enc) == 1;
}

bool FeedAad(EVP_CIPHER_CTX* ctx, std::span<const std::uint8_t> aad) {
  if (aad.empty()) {
    return true;
  }
  int out_len = 0;
  return EVP_CipherUpdate(ctx, nullptr, &out_len, aad.data(), static_cast<int>(aad.size())) == 1;
}

}  // namespace

std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext) {
  if (!ValidSizes(key, nonce)) {
    throw std::invalid_argument("invalid key/nonce length");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx || !InitContext(ctx.get(), true, key, nonce) || !FeedAad(ctx.get(), aad)) {
    throw std::runtime_error("chacha20-poly1305 init failed");
  }

  std::vector<std::uint8_t> out(plaintext.size() + kChaCha20Poly1305TagSize);
  int len = 0;
  if (!plaintext.empty() &&
      EVP_CipherUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                       static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("chacha20-poly1305 encrypt failed");
  }
  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), out.data() + len, &tail) != 1) {
    throw std::runtime_error("chacha20-poly1305 finalize failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                          static_cast<int>(kChaCha20Poly1305TagSize),
                          out.data() + plaintext.size()) != 1) {
    throw std::runtime_error("chacha20-poly1305 tag failed");
  }
  return out;
}

bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext_and_tag,
                             std::vector<std::uint8_t>* plaintext) {
  if (!plaintext) {
    return false;
  }
  plaintext->clear();
  if (!ValidSizes(key, nonce) || ciphertext_and_tag.size() < kChaCha20Poly1305TagSize) {
    return false;
  }
  const std::size_t ct_len = ciphertext_and_tag.size() - kChaCha20Poly1305TagSize;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx || !InitContext(ctx.get(), false, key, nonce) || !FeedAad(ctx.get(), aad)) {
    return false;
  }
  std::vector<std::uint8_t> buffer(ct_len);
  int len = 0;
  if (ct_len > 0 &&
      EVP_CipherUpdate(ctx.get(), buffer.data(), &len, ciphertext_and_tag.data(),
                       static_cast<int>(ct_len)) != 1) {
    SecureWipe(buffer);
    return false;
  }
  // The tag buffer argument is non-const in the OpenSSL API.
  std::uint8_t tag[kChaCha20Poly1305TagSize];
  std::copy(ciphertext_and_tag.begin() + static_cast<std::ptrdiff_t>(ct_len),
            ciphertext_and_tag.end(), tag);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                          static_cast<int>(kChaCha20Poly1305TagSize), tag) != 1) {
    SecureWipe(buffer);
    return false;
  }
  // ChaCha20-Poly1305 emits no bytes on finalization; only the tag check runs.
  std::uint8_t final_block[16];
  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), final_block, &tail) != 1) {
    SecureWipe(buffer);
    return false;
  }
  *plaintext = std::move(buffer);
  return true;
}

}  // namespace autopay::util
