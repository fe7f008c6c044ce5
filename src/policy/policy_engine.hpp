#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "policy/settings.hpp"
#include "policy/site_policy.hpp"
#include "store/history.hpp"
#include "x402/challenge.hpp"

namespace autopay::policy {

enum class Decision {
  kApprove,
  kDefer,
};

// Which rule produced the decision; logged, never shown to the server.
enum class DecisionReason {
  kWithinLimits,
  kSiteDenied,
  kAboveThreshold,
  kPromptRequired,
  kSiteNotAllowed,
  kLifetimeCapExceeded,
  kDailyCapExceeded,
};

const char* DecisionReasonName(DecisionReason reason);

struct PolicyDecision {
  Decision decision{Decision::kDefer};
  DecisionReason reason{DecisionReason::kWithinLimits};
  double amount_usd{0.0};  // the figure the rules were checked against
};

// Sum of auto-approved, successful payments in the 24 hours before `now_ms`.
double SpentInLast24h(std::span<const store::PaymentRecord> history, std::int64_t now_ms);

// USD figure used for gating. For a known token on a known chain this is
// max(advisory, atomic / 10^decimals) so a server cannot understate the price;
// for anything else the advisory value is all there is.
double GatingAmountUsd(const x402::ChallengeDetails& challenge);

// Pure function over the given snapshots. `policy` may be null (no policy
// recorded for the origin). Rules, first match wins:
//   site mode deny, above threshold, prompt required, site policy present
//   without allow_under_threshold, lifetime cap, trailing 24h auto cap.
PolicyDecision Decide(const Settings& settings, const SitePolicy* policy,
                      std::span<const store::PaymentRecord> history,
                      const x402::ChallengeDetails& challenge, std::int64_t now_ms);

}  // namespace autopay::policy
