#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace autopay::x402 {

enum class Chain {
  kPolygon,
  kPolygonAmoy,
};

struct TokenInfo {
  const char* symbol;
  const char* name;     // EIP-712 domain name
  const char* version;  // EIP-712 domain version
  const char* address;  // EIP-55
  int decimals;
};

struct ChainInfo {
  Chain chain;
  const char* key;           // settings value: "polygon", "polygonAmoy"
  const char* network_name;  // x402 v1 network name: "polygon", "polygon-amoy"
  std::uint64_t chain_id;
  TokenInfo usdc;
};

std::span<const ChainInfo> AllChains();
const ChainInfo& GetChainInfo(Chain chain);

std::optional<Chain> ChainFromId(std::uint64_t chain_id);
// Accepts the settings key or the network name.
std::optional<Chain> ChainFromKey(std::string_view key);
const char* ChainKey(Chain chain);

// "eip155:137", "polygon-amoy" or a bare decimal chain id.
std::optional<std::uint64_t> ChainIdFromNetworkDescriptor(std::string_view descriptor);

// Known token on a known chain, matched case-insensitively by address.
const TokenInfo* LookupKnownToken(std::uint64_t chain_id, std::string_view token_address);

}  // namespace autopay::x402
