#include <cstdlib>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/aead.hpp"
#include "util/argon2_kdf.hpp"
#include "util/hex.hpp"

int main() {
  try {
    using namespace autopay;

    // RFC 8439 section 2.8.2.
    {
      std::vector<std::uint8_t> key;
      std::vector<std::uint8_t> nonce;
      std::vector<std::uint8_t> aad;
      util::HexDecode("808182838485868788898a8b8c8d8e8f909192939495969798999a9b9c9d9e9f", &key);
      util::HexDecode("070000004041424344454647", &nonce);
      util::HexDecode("50515253c0c1c2c3c4c5c6c7", &aad);
      const std::string text =
          "Ladies and Gentlemen of the class of '99: If I could offer you only one tip for the "
          "future, sunscreen would be it.";
      const std::vector<std::uint8_t> plaintext(text.begin(), text.end());
      const auto sealed = util::ChaCha20Poly1305Encrypt(key, nonce, aad, plaintext);
      const std::string hex = util::HexEncode(sealed);
      if (hex.substr(0, 32) != "d31a8d34648e60db7b86afbc53ef7ec2" ||
          hex.substr(hex.size() - 32) != "1ae10b594f09e26a7e902ecbd0600691") {
        std::cerr << "ChaCha20-Poly1305 vector mismatch\n";
        return EXIT_FAILURE;
      }
      std::vector<std::uint8_t> opened;
      if (!util::ChaCha20Poly1305Decrypt(key, nonce, aad, sealed, &opened) ||
          opened != plaintext) {
        std::cerr << "Decrypt of vector failed\n";
        return EXIT_FAILURE;
      }

      auto tampered = sealed;
      tampered[3] ^= 0x01;
      if (util::ChaCha20Poly1305Decrypt(key, nonce, aad, tampered, &opened) || !opened.empty()) {
        std::cerr << "Tampered ciphertext accepted\n";
        return EXIT_FAILURE;
      }
      auto other_aad = aad;
      other_aad[0] ^= 0x01;
      if (util::ChaCha20Poly1305Decrypt(key, nonce, other_aad, sealed, &opened)) {
        std::cerr << "Wrong associated data accepted\n";
        return EXIT_FAILURE;
      }
      bool threw = false;
      try {
        util::ChaCha20Poly1305Encrypt(std::span(key).subspan(1), nonce, aad, plaintext);
      } catch (const std::invalid_argument&) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "Short key accepted\n";
        return EXIT_FAILURE;
      }
    }

    // Argon2id parameter checks and determinism.
    {
      std::string error;
      if (!util::ValidateArgon2idParams(util::DefaultArgon2idParams(), &error)) {
        std::cerr << "Default parameters rejected: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (util::ValidateArgon2idParams({0, 64, 1}, &error) ||
          util::ValidateArgon2idParams({1, 4, 1}, &error) ||
          util::ValidateArgon2idParams({11, 64, 1}, &error) ||
          util::ValidateArgon2idParams({1, 64, 9}, &error)) {
        std::cerr << "Out-of-range parameters accepted\n";
        return EXIT_FAILURE;
      }
      const std::vector<std::uint8_t> salt(16, 0x5a);
      std::vector<std::uint8_t> a;
      std::vector<std::uint8_t> b;
      std::vector<std::uint8_t> c;
      const util::Argon2idParams fast{1, 64, 1};
      if (!util::DeriveKeyArgon2id("pw1234567", salt, fast, &a) ||
          !util::DeriveKeyArgon2id("pw1234567", salt, fast, &b) ||
          !util::DeriveKeyArgon2id("pw1234568", salt, fast, &c)) {
        std::cerr << "Argon2id derivation failed\n";
        return EXIT_FAILURE;
      }
      if (a.size() != util::kArgon2idKeySize || a != b || a == c) {
        std::cerr << "Argon2id output not deterministic per passphrase\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "aead_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
