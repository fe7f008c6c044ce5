#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "util/clock.hpp"
#include "x402/network.hpp"

namespace autopay::store {

constexpr std::int64_t kBalanceRefreshIntervalMs = util::kMillisPerHour;

struct BalanceEntry {
  std::string token_balance{"0"};  // display units, e.g. "12.5"
  std::string raw_balance{"0"};    // atomic units
  double usd{0.0};
  double usd_rate{1.0};
  std::int64_t last_fetched_ms{0};
  std::string token_symbol{"USDC"};
  int decimals{6};
  std::optional<std::string> token_address;
};

using BalanceMap = std::map<x402::Chain, BalanceEntry>;

// Placeholder for a chain that has never been fetched.
BalanceEntry DefaultBalance(x402::Chain chain, const std::string& token_symbol);

// Fetch when forced, never fetched, or older than the refresh interval.
bool BalanceNeedsRefresh(const BalanceEntry& entry, bool force, std::int64_t now_ms);

nlohmann::json BalancesToJson(const BalanceMap& balances);
BalanceMap BalancesFromJson(const nlohmann::json& value);

}  // namespace autopay::store
