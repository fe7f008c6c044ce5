#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "crypto/eth_address.hpp"
#include "crypto/keccak.hpp"

namespace autopay::crypto {

struct Eip712Domain {
  std::string name;
  std::string version;
  std::uint64_t chain_id{0};
  Address verifying_contract;
};

// EIP-3009 transferWithAuthorization message. Amounts and timestamps are
// base-10 integer strings so values above 2^64 survive untouched.
struct TransferWithAuthorization {
  Address from;
  Address to;
  std::string value;
  std::string valid_after;
  std::string valid_before;
  Hash256 nonce{};
};

Hash256 DomainSeparator(const Eip712Domain& domain);

// Fails when a numeric field is not a decimal that fits in uint256.
std::optional<Hash256> StructHash(const TransferWithAuthorization& message);

// keccak256(0x19 0x01 || domainSeparator || structHash)
Hash256 TypedDataDigest(const Hash256& domain_separator, const Hash256& struct_hash);

}  // namespace autopay::crypto
