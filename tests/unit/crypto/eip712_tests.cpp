#include <cstdlib>
#include <iostream>

#include "crypto/eip712.hpp"
#include "crypto/secp256k1.hpp"
#include "util/hex.hpp"

int main() {
  try {
    using namespace autopay;

    // Domain of the reference "Ether Mail" example.
    {
      crypto::Eip712Domain domain;
      domain.name = "Ether Mail";
      domain.version = "1";
      domain.chain_id = 1;
      auto contract = crypto::ParseAddress("0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC");
      if (!contract) {
        std::cerr << "Failed to parse verifying contract\n";
        return EXIT_FAILURE;
      }
      domain.verifying_contract = *contract;
      const auto separator = crypto::DomainSeparator(domain);
      if (util::HexEncode(separator) !=
          "f2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f") {
        std::cerr << "Domain separator mismatch: " << util::HexEncode(separator) << "\n";
        return EXIT_FAILURE;
      }
    }

    crypto::TransferWithAuthorization message;
    message.from = *crypto::ParseAddress("0x2c7536E3605D9C16a7a3D7b1898e529396a65c23");
    message.to = *crypto::ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    message.value = "10000";
    message.valid_after = "1748779195";
    message.valid_before = "1748779320";
    message.nonce.fill(0x42);

    // Every field contributes to the struct hash.
    {
      auto base = crypto::StructHash(message);
      if (!base) {
        std::cerr << "StructHash failed\n";
        return EXIT_FAILURE;
      }
      auto changed = message;
      changed.value = "10001";
      auto other = crypto::StructHash(changed);
      if (!other || *other == *base) {
        std::cerr << "Value change did not alter struct hash\n";
        return EXIT_FAILURE;
      }
      changed = message;
      changed.nonce[31] = 0x43;
      other = crypto::StructHash(changed);
      if (!other || *other == *base) {
        std::cerr << "Nonce change did not alter struct hash\n";
        return EXIT_FAILURE;
      }
    }

    // Numeric fields must be uint256 decimals.
    {
      auto bad = message;
      bad.value = "-1";
      if (crypto::StructHash(bad)) {
        std::cerr << "Negative value accepted\n";
        return EXIT_FAILURE;
      }
      bad.value = "0x10";
      if (crypto::StructHash(bad)) {
        std::cerr << "Hex value accepted\n";
        return EXIT_FAILURE;
      }
      // 2^256 does not fit.
      bad.value =
          "115792089237316195423570985008687907853269984665640564039457584007913129639936";
      if (crypto::StructHash(bad)) {
        std::cerr << "Overflowing value accepted\n";
        return EXIT_FAILURE;
      }
      bad.value =
          "115792089237316195423570985008687907853269984665640564039457584007913129639935";
      if (!crypto::StructHash(bad)) {
        std::cerr << "2^256-1 rejected\n";
        return EXIT_FAILURE;
      }
    }

    // The domain binds the digest to one chain.
    {
      crypto::Eip712Domain domain{"USD Coin", "2", 80002, {}};
      auto token = crypto::ParseAddress("0x41E94Eb019C0762f9Bfcf9Fb1E58725BfB0e7582");
      domain.verifying_contract = *token;
      const auto struct_hash = *crypto::StructHash(message);
      const auto amoy = crypto::TypedDataDigest(crypto::DomainSeparator(domain), struct_hash);
      domain.chain_id = 137;
      const auto polygon = crypto::TypedDataDigest(crypto::DomainSeparator(domain), struct_hash);
      if (amoy == polygon) {
        std::cerr << "Chain id not bound into digest\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "eip712_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
