#include "wallet/secret_box.hpp"

#include <utility>

#include "util/aead.hpp"
#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace autopay::wallet {

bool SealSecret(std::span<const std::uint8_t> secret, const std::string& passphrase,
                std::span<const std::uint8_t> associated_data,
                const util::Argon2idParams& params, SealedSecret* out, std::string* error) {
  if (!out) {
    return false;
  }
  if (!util::ValidateArgon2idParams(params, error)) {
    return false;
  }
  SealedSecret sealed;
  sealed.kdf = params;
  sealed.salt = util::SecureRandomBytes(kSecretSaltSize);
  sealed.nonce = util::SecureRandomBytes(util::kChaCha20Poly1305NonceSize);

  std::vector<std::uint8_t> key;
  if (!util::DeriveKeyArgon2id(passphrase, sealed.salt, params, &key)) {
    util::SecureWipe(key);
    if (error) {
      *error = "key derivation failed";
    }
    return false;
  }
  sealed.ciphertext = util::ChaCha20Poly1305Encrypt(key, sealed.nonce, associated_data, secret);
  util::SecureWipe(key);
  *out = std::move(sealed);
  return true;
}

bool OpenSecret(const SealedSecret& sealed, const std::string& passphrase,
                std::span<const std::uint8_t> associated_data,
                std::vector<std::uint8_t>* secret) {
  if (!secret) {
    return false;
  }
  secret->clear();
  if (!util::ValidateArgon2idParams(sealed.kdf) ||
      sealed.nonce.size() != util::kChaCha20Poly1305NonceSize || sealed.salt.empty() ||
      sealed.ciphertext.size() < util::kChaCha20Poly1305TagSize) {
    return false;
  }
  std::vector<std::uint8_t> key;
  if (!util::DeriveKeyArgon2id(passphrase, sealed.salt, sealed.kdf, &key)) {
    util::SecureWipe(key);
    return false;
  }
  const bool ok =
      util::ChaCha20Poly1305Decrypt(key, sealed.nonce, associated_data, sealed.ciphertext, secret);
  util::SecureWipe(key);
  return ok;
}

}  // namespace autopay::wallet
