#include "store/balances.hpp"

#include <utility>

namespace autopay::store {

BalanceEntry DefaultBalance(x402::Chain chain, const std::string& token_symbol) {
  const auto& info = x402::GetChainInfo(chain);
  BalanceEntry entry;
  entry.token_symbol = token_symbol;
  entry.decimals = info.usdc.decimals;
  entry.token_address = info.usdc.address;
  return entry;
}

bool BalanceNeedsRefresh(const BalanceEntry& entry, bool force, std::int64_t now_ms) {
  return force || entry.last_fetched_ms == 0 ||
         now_ms - entry.last_fetched_ms > kBalanceRefreshIntervalMs;
}

nlohmann::json BalancesToJson(const BalanceMap& balances) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [chain, entry] : balances) {
    nlohmann::json item = {
        {"token_balance", entry.token_balance},
        {"raw_balance", entry.raw_balance},
        {"usd", entry.usd},
        {"usd_rate", entry.usd_rate},
        {"last_fetched", entry.last_fetched_ms},
        {"token_symbol", entry.token_symbol},
        {"decimals", entry.decimals},
    };
    if (entry.token_address) item["token_address"] = *entry.token_address;
    out[x402::ChainKey(chain)] = std::move(item);
  }
  return out;
}

BalanceMap BalancesFromJson(const nlohmann::json& value) {
  BalanceMap balances;
  if (!value.is_object()) {
    return balances;
  }
  for (const auto& [key, item] : value.items()) {
    auto chain = x402::ChainFromKey(key);
    if (!chain || !item.is_object()) {
      continue;
    }
    try {
      BalanceEntry entry;
      entry.token_balance = item.value("token_balance", std::string("0"));
      entry.raw_balance = item.value("raw_balance", std::string("0"));
      entry.usd = item.value("usd", 0.0);
      entry.usd_rate = item.value("usd_rate", 1.0);
      entry.last_fetched_ms = item.value("last_fetched", std::int64_t{0});
      entry.token_symbol = item.value("token_symbol", std::string("USDC"));
      entry.decimals = item.value("decimals", 6);
      if (auto address = item.find("token_address"); address != item.end() && address->is_string()) {
        entry.token_address = address->get<std::string>();
      }
      balances[*chain] = std::move(entry);
    } catch (const nlohmann::json::exception&) {
      continue;
    }
  }
  return balances;
}

}  // namespace autopay::store
