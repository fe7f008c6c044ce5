#include "x402/network.hpp"

#include <array>
#include <charconv>
#include <system_error>

#include "util/strings.hpp"

namespace autopay::x402 {

namespace {

constexpr std::array<ChainInfo, 2> kChains{{
    {Chain::kPolygon, "polygon", "polygon", 137,
     {"USDC", "USD Coin", "2", "0x3c499c542cEF5E3811e1192ce70d8cC03d5c3359", 6}},
    {Chain::kPolygonAmoy, "polygonAmoy", "polygon-amoy", 80002,
     {"USDC", "USD Coin", "2", "0x41E94Eb019C0762f9Bfcf9Fb1E58725BfB0e7582", 6}},
}};

std::optional<std::uint64_t> ParseUint64(std::string_view text) {
  std::uint64_t value = 0;
  const auto* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, value);
  if (text.empty() || result.ec != std::errc() || result.ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::span<const ChainInfo> AllChains() { return kChains; }

const ChainInfo& GetChainInfo(Chain chain) {
  for (const auto& info : kChains) {
    if (info.chain == chain) {
      return info;
    }
  }
  return kChains.front();
}

std::optional<Chain> ChainFromId(std::uint64_t chain_id) {
  for (const auto& info : kChains) {
    if (info.chain_id == chain_id) {
      return info.chain;
    }
  }
  return std::nullopt;
}

std::optional<Chain> ChainFromKey(std::string_view key) {
  for (const auto& info : kChains) {
    if (util::EqualsIgnoreCase(key, info.key) || util::EqualsIgnoreCase(key, info.network_name)) {
      return info.chain;
    }
  }
  return std::nullopt;
}

const char* ChainKey(Chain chain) { return GetChainInfo(chain).key; }

std::optional<std::uint64_t> ChainIdFromNetworkDescriptor(std::string_view descriptor) {
  const std::string trimmed = util::Trim(descriptor);
  std::string_view view(trimmed);
  const auto colon = view.find(':');
  if (colon != std::string_view::npos) {
    return ParseUint64(view.substr(colon + 1));
  }
  if (auto chain = ChainFromKey(view)) {
    return GetChainInfo(*chain).chain_id;
  }
  return ParseUint64(view);
}

const TokenInfo* LookupKnownToken(std::uint64_t chain_id, std::string_view token_address) {
  const auto chain = ChainFromId(chain_id);
  if (!chain) {
    return nullptr;
  }
  const auto& info = GetChainInfo(*chain);
  if (util::EqualsIgnoreCase(token_address, info.usdc.address)) {
    return &info.usdc;
  }
  return nullptr;
}

}  // namespace autopay::x402
