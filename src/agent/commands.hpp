#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "agent/errors.hpp"
#include "policy/settings.hpp"
#include "policy/site_policy.hpp"
#include "store/balances.hpp"
#include "store/history.hpp"
#include "store/pending_challenges.hpp"
#include "wallet/wallet_manager.hpp"
#include "x402/challenge.hpp"
#include "x402/resolution.hpp"
#include "x402/settlement.hpp"

namespace autopay::agent {

// Requests the orchestrator accepts. The set is closed: adding a command
// means adding a handler, or Orchestrator::Execute does not compile.
struct SubmitChallenge {
  x402::ChallengeDetails challenge;
  std::optional<int> tab_id;
};
struct GetPendingChallenge {
  std::string id;
};
struct ResolvePendingChallenge {
  std::string id;
  bool approve{false};
  bool always_allow{false};
};
struct PollResolution {
  std::string id;
};
struct GetState {};
struct ConfigureWallet {
  std::string secret;
  std::string passphrase;
  std::optional<int> lock_minutes;
  std::optional<std::string> label;
};
struct UnlockWallet {
  std::string passphrase;
  std::optional<int> lock_minutes;
};
struct LockWallet {};
struct ExportWallet {
  std::string passphrase;
};
struct RemoveWallet {};
struct UpdateSettings {
  policy::SettingsPatch patch;
};
struct UpdatePolicy {
  std::string origin;
  policy::SitePolicyPatch patch;
};
struct RemovePolicy {
  std::string origin;
};
struct ResetPolicies {};
struct ClearHistory {};
struct ReportSettlement {
  x402::SettlementNotice notice;
};
struct GetShortLivedToken {
  std::string payment_id;
};
struct RefreshBalance {
  std::optional<x402::Chain> chain;
  bool force{false};
};
struct RefreshAllBalances {};

using Command =
    std::variant<SubmitChallenge, GetPendingChallenge, ResolvePendingChallenge, PollResolution,
                 GetState, ConfigureWallet, UnlockWallet, LockWallet, ExportWallet, RemoveWallet,
                 UpdateSettings, UpdatePolicy, RemovePolicy, ResetPolicies, ClearHistory,
                 ReportSettlement, GetShortLivedToken, RefreshBalance, RefreshAllBalances>;

struct PendingChallengeReply {
  std::optional<store::PendingChallenge> entry;
};

enum class DecisionStatus {
  kSuccess,
  kDenied,
  kLocked,
  kError,
};

const char* DecisionStatusName(DecisionStatus status);

struct DecisionReply {
  DecisionStatus status{DecisionStatus::kError};
  std::optional<std::string> message;
  std::optional<ErrorKind> kind;
};

struct ResolutionReply {
  std::optional<x402::ChallengeResolution> resolution;
};

// Redacted snapshot: never holds key material, sealed or not.
struct StateReply {
  nlohmann::json state;
};

struct WalletReply {
  std::optional<wallet::WalletStatus> wallet;
  std::optional<std::string> error;
  std::optional<ErrorKind> kind;
};

struct ExportReply {
  std::optional<std::string> secret;
  std::optional<std::string> error;
};

struct SettingsReply {
  policy::Settings settings;
  std::optional<std::string> error;
};

struct PoliciesReply {
  policy::PolicyMap policies;
  std::optional<std::string> error;
};

struct HistoryReply {
  std::vector<store::PaymentRecord> history;
};

struct AckReply {
  bool ok{true};
  std::optional<std::string> error;
  std::optional<ErrorKind> kind;
};

struct TokenReply {
  std::optional<std::string> token;
};

struct BalancesReply {
  store::BalanceMap balances;
  std::optional<std::string> error;
};

using Reply = std::variant<x402::ChallengeResolution, PendingChallengeReply, DecisionReply,
                           ResolutionReply, StateReply, WalletReply, ExportReply, SettingsReply,
                           PoliciesReply, HistoryReply, AckReply, TokenReply, BalancesReply>;

}  // namespace autopay::agent
