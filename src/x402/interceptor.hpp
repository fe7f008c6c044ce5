#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "x402/challenge.hpp"
#include "x402/resolution.hpp"
#include "x402/settlement.hpp"

namespace autopay::x402 {

struct ObservedResponse {
  int status{0};
  HeaderMap headers;
  std::optional<std::string> body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Where intercepted challenges go. Implemented over the agent's message
// bridge; an absent reply means the agent could not be reached in time.
class ChallengeSink {
 public:
  virtual ~ChallengeSink() = default;
  virtual std::optional<ChallengeResolution> Submit(const ChallengeDetails& challenge,
                                                    std::optional<int> tab_id) = 0;
  virtual std::optional<ChallengeResolution> PollResolution(const std::string& challenge_id) = 0;
  virtual bool ReportSettlement(const SettlementNotice& notice) = 0;
};

// Re-issues the original request with extra headers. Absent on transport
// failure.
using RetryFunction = std::function<std::optional<ObservedResponse>(const HeaderMap&)>;

enum class InterceptOutcome {
  kPassThrough,
  kRetried,
};

struct InterceptResult {
  InterceptOutcome outcome{InterceptOutcome::kPassThrough};
  ObservedResponse response;
  std::optional<ChallengeResolution> resolution;
};

struct InterceptorOptions {
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds pending_timeout{std::chrono::minutes(10)};
  std::optional<int> tab_id;
};

// Client-side 402 handling. Every failure hands the original response back;
// the interceptor never makes a page worse than it was.
class Interceptor {
 public:
  Interceptor(ChallengeSink& sink, InterceptorOptions options = {});

  InterceptResult Handle(const RequestContext& context, const ObservedResponse& response,
                         const RetryFunction& retry);

 private:
  std::optional<ChallengeResolution> AwaitResolution(const std::string& challenge_id);
  InterceptResult Retry(const ObservedResponse& original, const ChallengeResolution& resolution,
                        const RetryFunction& retry);
  void ProcessSettlement(const ObservedResponse& response, const HeaderMap& sent_headers);

  ChallengeSink& sink_;
  InterceptorOptions options_;
};

}  // namespace autopay::x402
