#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/eth_address.hpp"
#include "crypto/secp256k1.hpp"
#include "util/hex.hpp"

namespace {

autopay::crypto::PrivateKey KeyFromHex(const std::string& hex) {
  std::vector<std::uint8_t> raw;
  autopay::crypto::PrivateKey key{};
  if (!autopay::util::HexDecode(hex, &raw) || raw.size() != key.size()) {
    throw std::runtime_error("bad test key");
  }
  std::copy(raw.begin(), raw.end(), key.begin());
  return key;
}

}  // namespace

int main() {
  try {
    using namespace autopay;
    const auto key =
        KeyFromHex("0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");

    {
      auto address = crypto::AddressFromPrivateKey(key);
      if (!address ||
          crypto::ToChecksumString(*address) != "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23") {
        std::cerr << "Derived address mismatch\n";
        return EXIT_FAILURE;
      }
    }

    // Range checks: zero and the group order itself are rejected.
    {
      crypto::PrivateKey zero{};
      if (crypto::IsValidPrivateKey(zero)) {
        std::cerr << "Zero key accepted\n";
        return EXIT_FAILURE;
      }
      const auto order =
          KeyFromHex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
      if (crypto::IsValidPrivateKey(order)) {
        std::cerr << "Group order accepted as a key\n";
        return EXIT_FAILURE;
      }
      const auto below =
          KeyFromHex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140");
      if (!crypto::IsValidPrivateKey(below)) {
        std::cerr << "n-1 rejected\n";
        return EXIT_FAILURE;
      }
      if (crypto::SignDigest(zero, crypto::Hash256{}).has_value()) {
        std::cerr << "Signing with the zero key succeeded\n";
        return EXIT_FAILURE;
      }
    }

    // Sign then recover, repeated so both recovery ids are exercised.
    {
      const auto public_key = crypto::DerivePublicKey(key);
      if (!public_key) {
        std::cerr << "Public key derivation failed\n";
        return EXIT_FAILURE;
      }
      for (int i = 0; i < 16; ++i) {
        crypto::Hash256 digest{};
        digest.fill(static_cast<std::uint8_t>(i + 1));
        digest[0] = 0xff;  // above the group order when read as an integer
        auto sig = crypto::SignDigest(key, digest);
        if (!sig) {
          std::cerr << "SignDigest failed\n";
          return EXIT_FAILURE;
        }
        if (sig->s[0] > 0x7f) {
          std::cerr << "Signature is not low-s\n";
          return EXIT_FAILURE;
        }
        const auto serialized = sig->Serialize();
        if (serialized[64] != 27 + sig->recovery_id) {
          std::cerr << "Unexpected v byte\n";
          return EXIT_FAILURE;
        }
        auto recovered = crypto::RecoverPublicKey(digest, *sig);
        if (!recovered || *recovered != *public_key) {
          std::cerr << "Recovered key does not match signer\n";
          return EXIT_FAILURE;
        }
        // A different digest recovers some other key.
        auto other = digest;
        other[31] ^= 0x01;
        auto wrong = crypto::RecoverPublicKey(other, *sig);
        if (wrong && *wrong == *public_key) {
          std::cerr << "Signature recovered signer for a different digest\n";
          return EXIT_FAILURE;
        }
      }
    }

    // Fresh nonce per signature; both still recover the signer, including at
    // the top of the key range.
    {
      crypto::Hash256 digest{};
      digest.fill(0x42);
      const auto first = crypto::SignDigest(key, digest);
      const auto second = crypto::SignDigest(key, digest);
      if (!first || !second || first->r == second->r) {
        std::cerr << "Signatures over one digest reused a nonce\n";
        return EXIT_FAILURE;
      }
      const auto top =
          KeyFromHex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140");
      const auto top_public = crypto::DerivePublicKey(top);
      const auto top_sig = crypto::SignDigest(top, digest);
      if (!top_public || !top_sig || crypto::RecoverPublicKey(digest, *top_sig) != top_public) {
        std::cerr << "Signature with key n-1 does not recover\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "secp256k1_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
