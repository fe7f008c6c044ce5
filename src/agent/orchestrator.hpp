#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "agent/collaborators.hpp"
#include "agent/commands.hpp"
#include "store/state_store.hpp"
#include "util/argon2_kdf.hpp"
#include "util/clock.hpp"
#include "wallet/wallet_manager.hpp"
#include "x402/authorization.hpp"

namespace autopay::agent {

// Owns the wallet, the policy decision and the pending-challenge lifecycle.
// Every command runs to completion before the next one starts; callers on
// other threads go through MessageBridge, which serializes them.
class Orchestrator {
 public:
  // `store` must already be open. `balances` and `prices` may be null; balance
  // refreshes then fail and prices fall back to the USDC peg.
  Orchestrator(const util::Clock& clock, store::StateStore& store,
               util::Argon2idParams kdf_params, PromptPresenter& prompt,
               BalanceSource* balances = nullptr, PriceSource* prices = nullptr);

  Reply Execute(const Command& command);

  x402::ChallengeResolution Handle(const SubmitChallenge& command);
  PendingChallengeReply Handle(const GetPendingChallenge& command);
  DecisionReply Handle(const ResolvePendingChallenge& command);
  ResolutionReply Handle(const PollResolution& command);
  StateReply Handle(const GetState& command);
  WalletReply Handle(const ConfigureWallet& command);
  WalletReply Handle(const UnlockWallet& command);
  WalletReply Handle(const LockWallet& command);
  ExportReply Handle(const ExportWallet& command);
  WalletReply Handle(const RemoveWallet& command);
  SettingsReply Handle(const UpdateSettings& command);
  PoliciesReply Handle(const UpdatePolicy& command);
  PoliciesReply Handle(const RemovePolicy& command);
  PoliciesReply Handle(const ResetPolicies& command);
  HistoryReply Handle(const ClearHistory& command);
  AckReply Handle(const ReportSettlement& command);
  TokenReply Handle(const GetShortLivedToken& command);
  BalancesReply Handle(const RefreshBalance& command);
  BalancesReply Handle(const RefreshAllBalances& command);

  const wallet::WalletManager& wallet() const { return wallet_; }

 private:
  struct PaymentOutcome {
    bool locked{false};
    x402::ChallengeResolution resolution;
  };

  struct StoredResolution {
    x402::ChallengeResolution resolution;
    std::int64_t stored_at_ms{0};
  };

  PaymentOutcome ProcessPayment(const x402::ChallengeDetails& challenge, bool auto_approved,
                                double amount_usd);
  PaymentOutcome ProcessPaymentWhilePaying(const x402::ChallengeDetails& challenge,
                                           bool auto_approved, double amount_usd);
  // Reads a pending entry from a snapshot; writes only when expired entries were pruned.
  std::optional<store::PendingChallenge> LookupPending(const std::string& id, std::int64_t now);
  void SetStatus(store::AgentStatus status);
  bool Persist(const store::StateStore::Mutator& mutate, std::string* error = nullptr);
  bool PersistWallet(std::string* error);
  WalletReply WalletResult(wallet::WalletError code);
  void StoreResolution(const std::string& id, x402::ChallengeResolution resolution);
  void ClosePrompt(const store::PendingChallenge& entry);
  bool RefreshChain(x402::Chain chain, bool force, std::string* error);
  std::string Today() const;

  const util::Clock& clock_;
  store::StateStore& store_;
  PromptPresenter& prompt_;
  BalanceSource* balances_;
  CachedPriceSource prices_;
  wallet::WalletManager wallet_;
  x402::AuthorizationBuilder builder_;
  std::map<std::string, StoredResolution> resolutions_;
};

}  // namespace autopay::agent
