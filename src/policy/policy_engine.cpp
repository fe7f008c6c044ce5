#include "policy/policy_engine.hpp"

#include <algorithm>
#include <cmath>

#include "util/clock.hpp"
#include "util/decimal.hpp"
#include "x402/network.hpp"

namespace autopay::policy {

const char* DecisionReasonName(DecisionReason reason) {
  switch (reason) {
    case DecisionReason::kWithinLimits:
      return "within limits";
    case DecisionReason::kSiteDenied:
      return "site policy denies autopay";
    case DecisionReason::kAboveThreshold:
      return "amount above threshold";
    case DecisionReason::kPromptRequired:
      return "prompt required";
    case DecisionReason::kSiteNotAllowed:
      return "site not allowed under threshold";
    case DecisionReason::kLifetimeCapExceeded:
      return "site lifetime cap reached";
    case DecisionReason::kDailyCapExceeded:
      return "daily auto-pay cap reached";
  }
  return "unknown";
}

double SpentInLast24h(std::span<const store::PaymentRecord> history, std::int64_t now_ms) {
  const std::int64_t since = now_ms - util::kMillisPerDay;
  double total = 0.0;
  for (const auto& record : history) {
    if (record.auto_approved && record.status == store::PaymentStatus::kSuccess &&
        record.timestamp_ms >= since) {
      total += record.amount_usd;
    }
  }
  return total;
}

double GatingAmountUsd(const x402::ChallengeDetails& challenge) {
  double advisory = challenge.amount_usd;
  if (!std::isfinite(advisory) || advisory < 0) {
    advisory = 0.0;
  }
  const auto* token = x402::LookupKnownToken(challenge.chain_id, challenge.token_address);
  if (!token) {
    return advisory;
  }
  return std::max(advisory, util::AtomicToUnits(challenge.amount_atomic, token->decimals));
}

PolicyDecision Decide(const Settings& settings, const SitePolicy* policy,
                      std::span<const store::PaymentRecord> history,
                      const x402::ChallengeDetails& challenge, std::int64_t now_ms) {
  PolicyDecision result;
  result.amount_usd = GatingAmountUsd(challenge);
  const double amount = result.amount_usd;

  auto defer = [&](DecisionReason reason) {
    result.decision = Decision::kDefer;
    result.reason = reason;
    return result;
  };

  if (policy && policy->mode == PolicyMode::kDeny) {
    return defer(DecisionReason::kSiteDenied);
  }
  if (amount > settings.threshold_usd) {
    return defer(DecisionReason::kAboveThreshold);
  }
  if (settings.prompt_required) {
    return defer(DecisionReason::kPromptRequired);
  }
  if (policy && !policy->allow_under_threshold) {
    return defer(DecisionReason::kSiteNotAllowed);
  }
  if (policy && policy->cap_usd && *policy->cap_usd > 0 &&
      policy->lifetime_usd + amount > *policy->cap_usd) {
    return defer(DecisionReason::kLifetimeCapExceeded);
  }
  if (settings.daily_auto_cap_usd > 0 &&
      SpentInLast24h(history, now_ms) + amount > settings.daily_auto_cap_usd) {
    return defer(DecisionReason::kDailyCapExceeded);
  }
  result.decision = Decision::kApprove;
  result.reason = DecisionReason::kWithinLimits;
  return result;
}

}  // namespace autopay::policy
