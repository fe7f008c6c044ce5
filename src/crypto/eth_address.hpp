#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "crypto/secp256k1.hpp"

namespace autopay::crypto {

struct Address {
  std::array<std::uint8_t, 20> bytes{};

  bool operator==(const Address& other) const = default;
};

// keccak256(x || y)[12..32]
Address AddressFromPublicKey(const PublicKey& public_key);
std::optional<Address> AddressFromPrivateKey(const PrivateKey& key);

// Accepts "0x" + 40 hex digits. All-lower and all-upper inputs are taken as
// is; mixed-case inputs must carry a valid EIP-55 checksum.
std::optional<Address> ParseAddress(std::string_view text);

// EIP-55 mixed-case rendering with "0x" prefix.
std::string ToChecksumString(const Address& address);

}  // namespace autopay::crypto
