#include "store/app_state.hpp"

#include <utility>

namespace autopay::store {

const char* AgentStatusName(AgentStatus status) {
  switch (status) {
    case AgentStatus::kIdle:
      return "idle";
    case AgentStatus::kPaying:
      return "paying";
    case AgentStatus::kVerified:
      return "verified";
  }
  return "idle";
}

nlohmann::json AppStateToJson(const AppState& state) {
  nlohmann::json out = {
      {"settings", policy::SettingsToJson(state.settings)},
      {"wallet", nullptr},
      {"balances", BalancesToJson(state.balances)},
      {"policies", policy::PolicyMapToJson(state.policies)},
      {"history", state.history.ToJson()},
      {"token_cache", state.token_cache.ToJson()},
      {"pending_challenges", state.pending.ToJson()},
      {"status", AgentStatusName(state.status)},
  };
  if (state.wallet) {
    out["wallet"] = wallet::WalletRecordToJson(*state.wallet);
  }
  return out;
}

bool AppStateFromJson(const nlohmann::json& value, AppState* out, bool* dropped_plaintext,
                      std::string* error) {
  if (dropped_plaintext) {
    *dropped_plaintext = false;
  }
  if (!out || !value.is_object()) {
    if (error) {
      *error = "state document is not an object";
    }
    return false;
  }
  AppState state;
  auto section = [&](const char* key) -> const nlohmann::json& {
    static const nlohmann::json kNull;
    auto it = value.find(key);
    return it == value.end() ? kNull : *it;
  };

  state.settings = policy::SettingsFromJson(section("settings"));
  const auto& wallet_json = section("wallet");
  if (wallet_json.is_object()) {
    wallet::WalletRecord record;
    bool had_plaintext = false;
    std::string wallet_error;
    if (!wallet::WalletRecordFromJson(wallet_json, &record, &had_plaintext, &wallet_error)) {
      if (error) {
        *error = "wallet: " + wallet_error;
      }
      return false;
    }
    if (had_plaintext && dropped_plaintext) {
      *dropped_plaintext = true;
    }
    state.wallet = std::move(record);
  }
  state.balances = BalancesFromJson(section("balances"));
  state.policies = policy::PolicyMapFromJson(section("policies"));
  state.history = PaymentHistory::FromJson(section("history"));
  state.token_cache = TokenCache::FromJson(section("token_cache"));
  state.pending = PendingChallengeStore::FromJson(section("pending_challenges"));
  // A restart interrupts any payment in flight.
  state.status = AgentStatus::kIdle;
  *out = std::move(state);
  return true;
}

}  // namespace autopay::store
