#include "agent/orchestrator.hpp"

#include <utility>
#include <variant>

#include "policy/policy_engine.hpp"
#include "util/decimal.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::agent {

namespace {

x402::ChallengeResolution ErrorResolution(std::string message,
                                          std::optional<std::string> challenge_id = {}) {
  x402::ChallengeResolution resolution;
  resolution.action = x402::ResolutionAction::kError;
  resolution.message = std::move(message);
  resolution.challenge_id = std::move(challenge_id);
  return resolution;
}

ErrorKind WalletErrorKind(wallet::WalletError code) {
  switch (code) {
    case wallet::WalletError::kInvalidSecret:
      return ErrorKind::kInvalidSecret;
    case wallet::WalletError::kIncorrectPassphrase:
      return ErrorKind::kIncorrectPassphrase;
    case wallet::WalletError::kWalletLocked:
      return ErrorKind::kWalletLocked;
    case wallet::WalletError::kStorageFailure:
      return ErrorKind::kStorageFailure;
    case wallet::WalletError::kNone:
    case wallet::WalletError::kWeakPassphrase:
    case wallet::WalletError::kNotConfigured:
      break;
  }
  return ErrorKind::kInvalidRequest;
}

policy::SitePolicy& PolicyFor(store::AppState& state, const std::string& origin,
                              const std::string& today) {
  auto it = state.policies.find(origin);
  if (it == state.policies.end()) {
    it = state.policies.emplace(origin, policy::DefaultSitePolicy(origin, today)).first;
  }
  policy::ApplyDailyReset(&it->second, today);
  return it->second;
}

}  // namespace

const char* DecisionStatusName(DecisionStatus status) {
  switch (status) {
    case DecisionStatus::kSuccess:
      return "success";
    case DecisionStatus::kDenied:
      return "denied";
    case DecisionStatus::kLocked:
      return "locked";
    case DecisionStatus::kError:
      return "error";
  }
  return "error";
}

Orchestrator::Orchestrator(const util::Clock& clock, store::StateStore& store,
                           util::Argon2idParams kdf_params, PromptPresenter& prompt,
                           BalanceSource* balances, PriceSource* prices)
    : clock_(clock),
      store_(store),
      prompt_(prompt),
      balances_(balances),
      prices_(clock, prices),
      wallet_(clock, kdf_params),
      builder_(clock) {
  wallet_.Load(store_.Snapshot().wallet);
}

Reply Orchestrator::Execute(const Command& command) {
  return std::visit([this](const auto& typed) -> Reply { return Handle(typed); }, command);
}

std::string Orchestrator::Today() const { return util::UtcDateString(clock_.NowMs()); }

bool Orchestrator::Persist(const store::StateStore::Mutator& mutate, std::string* error) {
  std::string local_error;
  if (!store_.Update(mutate, &local_error)) {
    util::LogError("failed to persist agent state: " + local_error);
    if (error) {
      *error = local_error;
    }
    return false;
  }
  return true;
}

std::optional<store::PendingChallenge> Orchestrator::LookupPending(const std::string& id,
                                                                  std::int64_t now) {
  auto state = store_.Snapshot();
  if (state.pending.PruneExpired(now) > 0) {
    Persist([now](store::AppState& updated) { updated.pending.PruneExpired(now); });
  }
  return state.pending.Get(id, now);
}

void Orchestrator::SetStatus(store::AgentStatus status) {
  Persist([status](store::AppState& state) { state.status = status; });
}

void Orchestrator::StoreResolution(const std::string& id, x402::ChallengeResolution resolution) {
  const std::int64_t now = clock_.NowMs();
  for (auto it = resolutions_.begin(); it != resolutions_.end();) {
    if (now - it->second.stored_at_ms > store::kPendingChallengeTtlMs) {
      it = resolutions_.erase(it);
    } else {
      ++it;
    }
  }
  resolutions_[id] = StoredResolution{std::move(resolution), now};
}

void Orchestrator::ClosePrompt(const store::PendingChallenge& entry) {
  if (entry.window_id) {
    prompt_.Close(*entry.window_id);
  }
}

Orchestrator::PaymentOutcome Orchestrator::ProcessPayment(const x402::ChallengeDetails& challenge,
                                                          bool auto_approved,
                                                          double amount_usd) {
  PaymentOutcome outcome;
  if (!wallet_.IsConfigured()) {
    outcome.resolution = ErrorResolution("Wallet not configured", challenge.challenge_id);
    return outcome;
  }
  const wallet::UnlockSession* session = wallet_.ActiveSession();
  if (!session) {
    outcome.locked = true;
    outcome.resolution = ErrorResolution("Wallet locked", challenge.challenge_id);
    return outcome;
  }

  const auto settings = store_.Snapshot().settings;
  x402::PaymentAuthorization authorization;
  std::string error;
  const auto code = builder_.Build(session, settings.chain, challenge, &authorization, &error);
  const std::int64_t now = clock_.NowMs();
  const std::string today = Today();

  store::PaymentRecord record;
  record.id = challenge.challenge_id;
  record.origin = challenge.origin;
  record.endpoint = challenge.endpoint;
  record.amount_usd = amount_usd;
  record.token_symbol = challenge.token_symbol;
  record.timestamp_ms = now;
  record.auto_approved = auto_approved;

  const std::string failure = auto_approved ? "Auto payment failed" : "Payment failed";
  if (code != x402::BuildError::kNone) {
    util::LogWarn("payment for challenge " + challenge.challenge_id + " failed: " + error);
    record.status = store::PaymentStatus::kError;
    record.note = error;
    Persist([&](store::AppState& state) { state.history.Add(record); });
    wallet_.RenewLock();
    outcome.resolution = ErrorResolution(failure, challenge.challenge_id);
    return outcome;
  }

  record.status = store::PaymentStatus::kPending;
  const bool recorded = Persist([&](store::AppState& state) {
    state.history.Add(record);
    state.token_cache.Prune(now);
    policy::RecordSpend(&PolicyFor(state, challenge.origin, today), amount_usd, today);
  });
  wallet_.RenewLock();
  if (!recorded) {
    // Spend counters did not move, so the signed header must not leave.
    outcome.resolution = ErrorResolution(failure, challenge.challenge_id);
    return outcome;
  }

  outcome.resolution.action = x402::ResolutionAction::kRetry;
  outcome.resolution.challenge_id = challenge.challenge_id;
  outcome.resolution.retry_headers = {
      {x402::kPaymentHeader, authorization.header_value},
      {x402::kPaymentIdHeader, authorization.payment_id},
  };
  return outcome;
}

Orchestrator::PaymentOutcome Orchestrator::ProcessPaymentWhilePaying(
    const x402::ChallengeDetails& challenge, bool auto_approved, double amount_usd) {
  SetStatus(store::AgentStatus::kPaying);
  auto outcome = ProcessPayment(challenge, auto_approved, amount_usd);
  Persist([](store::AppState& state) {
    if (state.status == store::AgentStatus::kPaying) {
      state.status = store::AgentStatus::kIdle;
    }
  });
  return outcome;
}

x402::ChallengeResolution Orchestrator::Handle(const SubmitChallenge& command) {
  x402::ChallengeDetails challenge = command.challenge;
  std::string error;
  if (!x402::ValidateChallenge(&challenge, &error)) {
    util::LogWarn("rejected malformed challenge: " + error);
    return ErrorResolution("Invalid challenge: " + error);
  }
  const std::int64_t now = clock_.NowMs();

  if (auto chain = x402::ChainFromId(challenge.chain_id)) {
    if (store_.Snapshot().settings.chain != *chain) {
      const auto selected = *chain;
      if (Persist([selected](store::AppState& state) { state.settings.chain = selected; })) {
        util::LogInfo(std::string("switched active chain to ") + x402::ChainKey(selected));
        if (wallet_.IsConfigured()) {
          std::string refresh_error;
          if (!RefreshChain(selected, true, &refresh_error)) {
            util::LogDebug("balance refresh after chain switch failed: " + refresh_error);
          }
        }
      }
    }
  }

  if (!Persist([&](store::AppState& state) {
        state.pending.Put(challenge, command.tab_id, std::nullopt, now);
      })) {
    return ErrorResolution("Failed to record challenge", challenge.challenge_id);
  }

  const auto state = store_.Snapshot();
  auto site_it = state.policies.find(challenge.origin);
  const policy::SitePolicy* site = site_it == state.policies.end() ? nullptr : &site_it->second;
  const auto decision =
      policy::Decide(state.settings, site, state.history.records(), challenge, now);
  util::LogInfo("challenge " + challenge.challenge_id + " from " + challenge.origin + ": " +
                policy::DecisionReasonName(decision.reason));

  if (decision.decision == policy::Decision::kApprove) {
    auto outcome = ProcessPaymentWhilePaying(challenge, true, decision.amount_usd);
    if (!outcome.locked) {
      return outcome.resolution;
    }
    util::LogInfo("wallet locked; challenge " + challenge.challenge_id + " needs approval");
  }

  if (auto window = prompt_.Show(challenge.challenge_id)) {
    const int window_id = *window;
    Persist([&](store::AppState& state) {
      state.pending.SetWindowId(challenge.challenge_id, window_id, now);
    });
  }
  x402::ChallengeResolution pending;
  pending.action = x402::ResolutionAction::kPending;
  pending.challenge_id = challenge.challenge_id;
  return pending;
}

PendingChallengeReply Orchestrator::Handle(const GetPendingChallenge& command) {
  const std::int64_t now = clock_.NowMs();
  PendingChallengeReply reply;
  reply.entry = LookupPending(command.id, now);
  return reply;
}

DecisionReply Orchestrator::Handle(const ResolvePendingChallenge& command) {
  const std::int64_t now = clock_.NowMs();
  const auto entry = LookupPending(command.id, now);
  if (!entry) {
    return DecisionReply{DecisionStatus::kError, "Challenge not found",
                         ErrorKind::kExpiredChallenge};
  }
  const auto& challenge = entry->challenge;
  const std::string today = Today();

  if (!command.approve) {
    store::PaymentRecord record;
    record.id = challenge.challenge_id;
    record.origin = challenge.origin;
    record.endpoint = challenge.endpoint;
    record.amount_usd = policy::GatingAmountUsd(challenge);
    record.token_symbol = challenge.token_symbol;
    record.timestamp_ms = now;
    record.status = store::PaymentStatus::kDenied;
    if (!Persist([&](store::AppState& state) {
          state.history.Add(record);
          state.pending.Remove(command.id);
          state.status = store::AgentStatus::kIdle;
        })) {
      // Nothing was recorded, so the entry stays open for another decision.
      return DecisionReply{DecisionStatus::kError, "Failed to record denial",
                           ErrorKind::kStorageFailure};
    }
    x402::ChallengeResolution deny;
    deny.action = x402::ResolutionAction::kDeny;
    deny.challenge_id = command.id;
    deny.message = "Payment denied";
    StoreResolution(command.id, std::move(deny));
    ClosePrompt(*entry);
    util::LogInfo("challenge " + command.id + " denied");
    return DecisionReply{DecisionStatus::kDenied, std::nullopt, std::nullopt};
  }

  auto outcome = ProcessPaymentWhilePaying(challenge, false, policy::GatingAmountUsd(challenge));
  if (outcome.locked) {
    // Entry stays so the prompt can retry after an unlock.
    return DecisionReply{DecisionStatus::kLocked, "Wallet locked", ErrorKind::kWalletLocked};
  }
  if (outcome.resolution.action != x402::ResolutionAction::kRetry) {
    const auto message = outcome.resolution.message.value_or("Payment failed");
    StoreResolution(command.id, outcome.resolution);
    Persist([&](store::AppState& state) { state.pending.Remove(command.id); });
    ClosePrompt(*entry);
    return DecisionReply{DecisionStatus::kError, message, ErrorKind::kSigningFailure};
  }

  StoreResolution(command.id, outcome.resolution);
  Persist([&](store::AppState& state) {
    if (command.always_allow) {
      PolicyFor(state, challenge.origin, today).allow_under_threshold = true;
    }
    state.pending.Remove(command.id);
  });
  ClosePrompt(*entry);
  util::LogInfo("challenge " + command.id + " approved");
  return DecisionReply{DecisionStatus::kSuccess, std::nullopt, std::nullopt};
}

ResolutionReply Orchestrator::Handle(const PollResolution& command) {
  ResolutionReply reply;
  auto it = resolutions_.find(command.id);
  if (it != resolutions_.end()) {
    reply.resolution = std::move(it->second.resolution);
    resolutions_.erase(it);
    return reply;
  }
  const std::int64_t now = clock_.NowMs();
  if (LookupPending(command.id, now)) {
    x402::ChallengeResolution pending;
    pending.action = x402::ResolutionAction::kPending;
    pending.challenge_id = command.id;
    reply.resolution = std::move(pending);
  } else {
    reply.resolution = ErrorResolution("Challenge not found", command.id);
  }
  return reply;
}

StateReply Orchestrator::Handle(const GetState&) {
  const auto state = store_.Snapshot();
  nlohmann::json out;
  out["settings"] = policy::SettingsToJson(state.settings);
  out["wallet"] = wallet_.IsConfigured() ? wallet::WalletStatusToJson(wallet_.Status())
                                         : nlohmann::json(nullptr);
  out["balances"] = store::BalancesToJson(state.balances);
  out["policies"] = policy::PolicyMapToJson(state.policies);
  out["history"] = state.history.ToJson();
  out["pending_challenges"] = state.pending.ToJson();
  out["cached_tokens"] = state.token_cache.size();
  out["status"] = store::AgentStatusName(state.status);
  return StateReply{std::move(out)};
}

bool Orchestrator::PersistWallet(std::string* error) {
  auto record = wallet_.PersistedRecord();
  return Persist([&](store::AppState& state) { state.wallet = record; }, error);
}

WalletReply Orchestrator::WalletResult(wallet::WalletError code) {
  WalletReply reply;
  if (code != wallet::WalletError::kNone) {
    reply.error = wallet::WalletErrorMessage(code);
    reply.kind = WalletErrorKind(code);
    return reply;
  }
  reply.wallet = wallet_.Status();
  return reply;
}

WalletReply Orchestrator::Handle(const ConfigureWallet& command) {
  if (command.passphrase.empty()) {
    return WalletReply{std::nullopt, "Passphrase required", ErrorKind::kInvalidRequest};
  }
  const auto previous = wallet_.PersistedRecord();
  const auto code =
      wallet_.Configure(command.secret, command.passphrase, command.lock_minutes, command.label);
  if (code != wallet::WalletError::kNone) {
    return WalletResult(code);
  }
  std::string error;
  if (!PersistWallet(&error)) {
    wallet_.Load(previous);
    return WalletReply{std::nullopt, "Failed to save wallet", ErrorKind::kStorageFailure};
  }
  util::LogInfo("wallet configured for " + wallet_.Status().address);
  return WalletResult(code);
}

WalletReply Orchestrator::Handle(const UnlockWallet& command) {
  if (command.passphrase.empty()) {
    return WalletReply{std::nullopt, "Passphrase required", ErrorKind::kInvalidRequest};
  }
  const auto code = wallet_.Unlock(command.passphrase, command.lock_minutes);
  if (code == wallet::WalletError::kNone && command.lock_minutes) {
    std::string error;
    if (!PersistWallet(&error)) {
      util::LogWarn("lock duration not saved: " + error);
    }
  }
  return WalletResult(code);
}

WalletReply Orchestrator::Handle(const LockWallet&) {
  if (!wallet_.IsConfigured()) {
    return WalletResult(wallet::WalletError::kNotConfigured);
  }
  wallet_.Lock();
  return WalletResult(wallet::WalletError::kNone);
}

ExportReply Orchestrator::Handle(const ExportWallet& command) {
  ExportReply reply;
  if (command.passphrase.empty()) {
    reply.error = "Passphrase required";
    return reply;
  }
  std::string secret;
  const auto code = wallet_.ExportSecret(command.passphrase, &secret);
  if (code != wallet::WalletError::kNone) {
    reply.error = wallet::WalletErrorMessage(code);
    return reply;
  }
  reply.secret = std::move(secret);
  return reply;
}

WalletReply Orchestrator::Handle(const RemoveWallet&) {
  wallet_.Remove();
  std::string error;
  if (!Persist(
          [](store::AppState& state) {
            state.wallet.reset();
            state.balances.clear();
          },
          &error)) {
    return WalletReply{std::nullopt, "Failed to remove wallet", ErrorKind::kStorageFailure};
  }
  util::LogInfo("wallet removed");
  return WalletResult(wallet::WalletError::kNone);
}

SettingsReply Orchestrator::Handle(const UpdateSettings& command) {
  SettingsReply reply;
  std::string error;
  bool valid = true;
  const bool stored = Persist([&](store::AppState& state) {
    valid = policy::ApplySettingsPatch(command.patch, &state.settings, &error);
  });
  if (!valid) {
    reply.error = error;
  } else if (!stored) {
    reply.error = "Failed to save settings";
  }
  reply.settings = store_.Snapshot().settings;
  return reply;
}

PoliciesReply Orchestrator::Handle(const UpdatePolicy& command) {
  PoliciesReply reply;
  const std::string origin = util::Trim(command.origin);
  if (origin.empty()) {
    reply.error = "Origin required";
    reply.policies = store_.Snapshot().policies;
    return reply;
  }
  const std::string today = Today();
  std::string error;
  bool valid = true;
  const bool stored = Persist([&](store::AppState& state) {
    auto updated = state.policies.count(origin) ? state.policies.at(origin)
                                                : policy::DefaultSitePolicy(origin, today);
    valid = policy::ApplySitePolicyPatch(command.patch, &updated, &error);
    if (valid) {
      state.policies[origin] = std::move(updated);
    }
  });
  if (!valid) {
    reply.error = error;
  } else if (!stored) {
    reply.error = "Failed to save policy";
  }
  reply.policies = store_.Snapshot().policies;
  return reply;
}

PoliciesReply Orchestrator::Handle(const RemovePolicy& command) {
  PoliciesReply reply;
  const std::string origin = util::Trim(command.origin);
  if (!Persist([&](store::AppState& state) { state.policies.erase(origin); })) {
    reply.error = "Failed to save policy";
  }
  reply.policies = store_.Snapshot().policies;
  return reply;
}

PoliciesReply Orchestrator::Handle(const ResetPolicies&) {
  PoliciesReply reply;
  if (!Persist([](store::AppState& state) { state.policies.clear(); })) {
    reply.error = "Failed to save policy";
  }
  reply.policies = store_.Snapshot().policies;
  return reply;
}

HistoryReply Orchestrator::Handle(const ClearHistory&) {
  Persist([](store::AppState& state) { state.history.Clear(); });
  return HistoryReply{store_.Snapshot().history.records()};
}

AckReply Orchestrator::Handle(const ReportSettlement& command) {
  const auto& notice = command.notice;
  if (!notice.payment_id || notice.payment_id->empty()) {
    return AckReply{false, "Missing payment id", ErrorKind::kSettlementParseFailure};
  }
  const std::string id = *notice.payment_id;
  const bool success = x402::EffectiveStatus(notice) == x402::SettlementStatus::kSuccess;
  const std::int64_t now = clock_.NowMs();
  bool marked = false;
  std::string error;
  const bool stored = Persist(
      [&](store::AppState& state) {
        marked = state.history.MarkSettlement(id, success, notice.tx_hash, notice.message);
        if (notice.jwt && !notice.jwt->empty()) {
          state.token_cache.Put(id, *notice.jwt, now);
        }
        state.pending.Remove(id);
        state.status = store::AgentStatus::kVerified;
      },
      &error);
  if (!stored) {
    return AckReply{false, "Failed to record settlement", ErrorKind::kStorageFailure};
  }
  util::LogInfo("settlement for " + id + (success ? " succeeded" : " failed") +
                (marked ? "" : " (no pending record)"));
  return AckReply{true, std::nullopt, std::nullopt};
}

TokenReply Orchestrator::Handle(const GetShortLivedToken& command) {
  const std::int64_t now = clock_.NowMs();
  TokenReply reply;
  auto state = store_.Snapshot();
  if (state.token_cache.Prune(now) > 0) {
    Persist([now](store::AppState& updated) { updated.token_cache.Prune(now); });
  }
  reply.token = state.token_cache.Get(command.payment_id, now);
  return reply;
}

bool Orchestrator::RefreshChain(x402::Chain chain, bool force, std::string* error) {
  if (!wallet_.IsConfigured()) {
    *error = "Wallet not configured";
    return false;
  }
  const auto state = store_.Snapshot();
  const std::int64_t now = clock_.NowMs();
  auto it = state.balances.find(chain);
  store::BalanceEntry entry = it != state.balances.end()
                                  ? it->second
                                  : store::DefaultBalance(chain, state.settings.preferred_token);
  if (!store::BalanceNeedsRefresh(entry, force, now)) {
    return true;
  }
  if (!balances_) {
    *error = "No balance source configured";
    return false;
  }
  const auto& info = x402::GetChainInfo(chain);
  const std::string token_address = entry.token_address.value_or(info.usdc.address);
  TokenBalance fetched;
  if (!balances_->FetchBalance(info, token_address, wallet_.Status().address, &fetched, error)) {
    return false;
  }
  if (!util::IsDecimalString(fetched.raw_balance)) {
    *error = "Balance source returned a malformed amount";
    return false;
  }
  const double rate = prices_.QuoteUsd(entry.token_symbol, nullptr).value_or(1.0);
  entry.raw_balance = util::NormalizeDecimal(fetched.raw_balance);
  entry.decimals = fetched.decimals;
  entry.token_balance = util::FormatUnits(entry.raw_balance, fetched.decimals);
  entry.usd_rate = rate;
  entry.usd = util::AtomicToUnits(entry.raw_balance, fetched.decimals) * rate;
  entry.last_fetched_ms = now;
  entry.token_address = token_address;
  return Persist([&](store::AppState& updated) { updated.balances[chain] = entry; }, error);
}

BalancesReply Orchestrator::Handle(const RefreshBalance& command) {
  BalancesReply reply;
  const auto chain = command.chain.value_or(store_.Snapshot().settings.chain);
  std::string error;
  if (!RefreshChain(chain, command.force, &error)) {
    util::LogWarn(std::string("balance refresh for ") + x402::ChainKey(chain) +
                  " failed: " + error);
    reply.error = error;
  }
  reply.balances = store_.Snapshot().balances;
  return reply;
}

BalancesReply Orchestrator::Handle(const RefreshAllBalances&) {
  BalancesReply reply;
  std::size_t failures = 0;
  std::string last_error;
  for (const auto& info : x402::AllChains()) {
    std::string error;
    if (!RefreshChain(info.chain, true, &error)) {
      util::LogWarn(std::string("balance refresh for ") + info.key + " failed: " + error);
      ++failures;
      last_error = error;
    }
  }
  if (failures == x402::AllChains().size()) {
    reply.error = last_error;
  }
  reply.balances = store_.Snapshot().balances;
  return reply;
}

}  // namespace autopay::agent
