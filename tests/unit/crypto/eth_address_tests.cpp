#include <cstdlib>
#include <iostream>
#include <string>

#include "crypto/eth_address.hpp"

int main() {
  try {
    using namespace autopay;

    const std::string checksummed[] = {
        "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
        "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
        "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
        "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb",
    };
    for (const auto& text : checksummed) {
      auto parsed = crypto::ParseAddress(text);
      if (!parsed) {
        std::cerr << "Valid checksum rejected: " << text << "\n";
        return EXIT_FAILURE;
      }
      if (crypto::ToChecksumString(*parsed) != text) {
        std::cerr << "Checksum rendering mismatch for " << text << "\n";
        return EXIT_FAILURE;
      }
    }

    // Single-case inputs carry no checksum and are accepted.
    {
      auto lower = crypto::ParseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
      auto upper = crypto::ParseAddress("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED");
      if (!lower || !upper || !(*lower == *upper)) {
        std::cerr << "Single-case addresses not accepted\n";
        return EXIT_FAILURE;
      }
    }

    // A flipped case letter breaks the checksum.
    if (crypto::ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD")) {
      std::cerr << "Bad checksum accepted\n";
      return EXIT_FAILURE;
    }

    const std::string malformed[] = {
        "",
        "0x",
        "5aaeb6053f3e94c9b9a09f33669435e7ef1beaed",
        "0x5aaeb6053f3e94c9b9a09f33669435e7ef1bea",
        "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaedaa",
        "0xzzaeb6053f3e94c9b9a09f33669435e7ef1beaed",
    };
    for (const auto& text : malformed) {
      if (crypto::ParseAddress(text)) {
        std::cerr << "Malformed address accepted: '" << text << "'\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "eth_address_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
