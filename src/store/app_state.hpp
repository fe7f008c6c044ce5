#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "policy/settings.hpp"
#include "policy/site_policy.hpp"
#include "store/balances.hpp"
#include "store/history.hpp"
#include "store/pending_challenges.hpp"
#include "store/token_cache.hpp"
#include "wallet/wallet_record.hpp"

namespace autopay::store {

enum class AgentStatus {
  kIdle,
  kPaying,
  kVerified,
};

const char* AgentStatusName(AgentStatus status);

// The single persisted document. Holds no decrypted key material: the wallet
// entry is a WalletRecord, which only knows the sealed form.
struct AppState {
  policy::Settings settings;
  std::optional<wallet::WalletRecord> wallet;
  BalanceMap balances;
  policy::PolicyMap policies;
  PaymentHistory history;
  TokenCache token_cache;
  PendingChallengeStore pending;
  AgentStatus status{AgentStatus::kIdle};
};

nlohmann::json AppStateToJson(const AppState& state);

// Missing keys take defaults and unknown keys are ignored. A wallet entry that
// cannot be read is an error (the sealed key must not be silently dropped).
// `dropped_plaintext` reports a plaintext key that was discarded on load.
bool AppStateFromJson(const nlohmann::json& value, AppState* out, bool* dropped_plaintext,
                      std::string* error = nullptr);

}  // namespace autopay::store
