#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace autopay::crypto {

using Hash256 = std::array<std::uint8_t, 32>;

// Original Keccak-256 (0x01 domain padding) as used by Ethereum, which is not
// the same function as NIST SHA3-256.
class Keccak256 {
 public:
  Keccak256();

  Keccak256& Update(std::span<const std::uint8_t> data);
  Keccak256& Update(std::string_view data);
  Hash256 Finalize();

 private:
  void AbsorbBlock();

  std::array<std::uint64_t, 25> state_{};
  std::array<std::uint8_t, 136> buffer_{};
  std::size_t buffered_{0};
};

Hash256 Keccak256Hash(std::span<const std::uint8_t> data);
Hash256 Keccak256Hash(std::string_view data);

}  // namespace autopay::crypto
