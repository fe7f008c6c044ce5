#include <cstdlib>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "crypto/keccak.hpp"
#include "util/hex.hpp"

int main() {
  try {
    using namespace autopay;

    {
      const auto digest = crypto::Keccak256Hash(std::string_view{});
      if (util::HexEncode(digest) !=
          "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470") {
        std::cerr << "keccak256(\"\") mismatch: " << util::HexEncode(digest) << "\n";
        return EXIT_FAILURE;
      }
    }

    // ERC-20 Transfer event topic.
    {
      const auto digest = crypto::Keccak256Hash("Transfer(address,address,uint256)");
      if (util::HexEncode(digest) !=
          "ddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef") {
        std::cerr << "Transfer topic mismatch: " << util::HexEncode(digest) << "\n";
        return EXIT_FAILURE;
      }
    }

    // transfer(address,uint256) selector.
    {
      const auto digest = crypto::Keccak256Hash("transfer(address,uint256)");
      if (util::HexEncode(digest).substr(0, 8) != "a9059cbb") {
        std::cerr << "transfer selector mismatch\n";
        return EXIT_FAILURE;
      }
    }

    // Streaming across the 136-byte rate boundary matches the one-shot hash.
    {
      std::vector<std::uint8_t> data(421);
      for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7 + 3);
      }
      const auto one_shot = crypto::Keccak256Hash(data);
      crypto::Keccak256 hasher;
      std::span<const std::uint8_t> view(data);
      hasher.Update(view.subspan(0, 1));
      hasher.Update(view.subspan(1, 135));
      hasher.Update(view.subspan(136, 136));
      hasher.Update(view.subspan(272));
      if (hasher.Finalize() != one_shot) {
        std::cerr << "Streaming keccak differs from one-shot\n";
        return EXIT_FAILURE;
      }
      // Exactly one block of input forces a full padding block.
      std::vector<std::uint8_t> block(136, 0x61);
      if (crypto::Keccak256Hash(block) == crypto::Keccak256Hash(std::span(block).subspan(0, 135))) {
        std::cerr << "Block-sized input collided with shorter input\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "keccak_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
