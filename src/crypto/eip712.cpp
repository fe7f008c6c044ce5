#include "crypto/eip712.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include "util/decimal.hpp"

namespace autopay::crypto {

namespace {

constexpr std::string_view kDomainType =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";
constexpr std::string_view kTransferType =
    "TransferWithAuthorization(address from,address to,uint256 value,uint256 validAfter,"
    "uint256 validBefore,bytes32 nonce)";

using Word = std::array<std::uint8_t, 32>;

Word EncodeUint64(std::uint64_t value) {
  Word word{};
  for (int i = 0; i < 8; ++i) {
    word[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xff);
  }
  return word;
}

Word EncodeAddress(const Address& address) {
  Word word{};
  std::copy(address.bytes.begin(), address.bytes.end(), word.begin() + 12);
  return word;
}

}  // namespace

Hash256 DomainSeparator(const Eip712Domain& domain) {
  Keccak256 hasher;
  hasher.Update(Keccak256Hash(kDomainType));
  hasher.Update(Keccak256Hash(domain.name));
  hasher.Update(Keccak256Hash(domain.version));
  hasher.Update(EncodeUint64(domain.chain_id));
  hasher.Update(EncodeAddress(domain.verifying_contract));
  return hasher.Finalize();
}

std::optional<Hash256> StructHash(const TransferWithAuthorization& message) {
  Word value{};
  Word valid_after{};
  Word valid_before{};
  if (!util::DecimalToUint256(message.value, &value) ||
      !util::DecimalToUint256(message.valid_after, &valid_after) ||
      !util::DecimalToUint256(message.valid_before, &valid_before)) {
    return std::nullopt;
  }
  Keccak256 hasher;
  hasher.Update(Keccak256Hash(kTransferType));
  hasher.Update(EncodeAddress(message.from));
  hasher.Update(EncodeAddress(message.to));
  hasher.Update(value);
  hasher.Update(valid_after);
  hasher.Update(valid_before);
  hasher.Update(message.nonce);
  return hasher.Finalize();
}

Hash256 TypedDataDigest(const Hash256& domain_separator, const Hash256& struct_hash) {
  static constexpr std::array<std::uint8_t, 2> kPrefix{0x19, 0x01};
  Keccak256 hasher;
  hasher.Update(kPrefix);
  hasher.Update(domain_separator);
  hasher.Update(struct_hash);
  return hasher.Finalize();
}

}  // namespace autopay::crypto
