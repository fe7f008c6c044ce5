#include "crypto/eth_address.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "util/hex.hpp"

namespace autopay::crypto {

Address AddressFromPublicKey(const PublicKey& public_key) {
  const auto hash = Keccak256Hash(public_key);
  Address address;
  std::copy(hash.begin() + 12, hash.end(), address.bytes.begin());
  return address;
}

std::optional<Address> AddressFromPrivateKey(const PrivateKey& key) {
  auto public_key = DerivePublicKey(key);
  if (!public_key) {
    return std::nullopt;
  }
  return AddressFromPublicKey(*public_key);
}

std::optional<Address> ParseAddress(std::string_view text) {
  if (text.size() != 42 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
    return std::nullopt;
  }
  const auto digits = text.substr(2);
  std::vector<std::uint8_t> raw;
  if (!util::HexDecode(digits, &raw) || raw.size() != 20) {
    return std::nullopt;
  }
  Address address;
  std::copy(raw.begin(), raw.end(), address.bytes.begin());

  const bool has_lower = std::any_of(digits.begin(), digits.end(),
                                     [](char c) { return c >= 'a' && c <= 'f'; });
  const bool has_upper = std::any_of(digits.begin(), digits.end(),
                                     [](char c) { return c >= 'A' && c <= 'F'; });
  if (has_lower && has_upper && ToChecksumString(address).substr(2) != digits) {
    return std::nullopt;
  }
  return address;
}

std::string ToChecksumString(const Address& address) {
  const std::string lower = util::HexEncode(address.bytes);
  const auto hash = Keccak256Hash(lower);
  std::string out = "0x";
  out.reserve(42);
  for (std::size_t i = 0; i < lower.size(); ++i) {
    const char c = lower[i];
    const std::uint8_t nibble =
        (i % 2 == 0) ? static_cast<std::uint8_t>(hash[i / 2] >> 4)
                     : static_cast<std::uint8_t>(hash[i / 2] & 0x0f);
    if (c >= 'a' && c <= 'f' && nibble >= 8) {
      out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace autopay::crypto
