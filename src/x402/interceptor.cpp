#include "x402/interceptor.hpp"

#include <thread>

#include "util/logging.hpp"
#include "util/strings.hpp"
#include "x402/challenge_parser.hpp"

namespace autopay::x402 {

namespace {

constexpr int kPaymentRequired = 402;

std::optional<std::string> HeaderValue(const HeaderMap& normalized, const char* name) {
  auto it = normalized.find(util::ToLower(name));
  if (it == normalized.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

Interceptor::Interceptor(ChallengeSink& sink, InterceptorOptions options)
    : sink_(sink), options_(options) {}

InterceptResult Interceptor::Handle(const RequestContext& context,
                                    const ObservedResponse& response,
                                    const RetryFunction& retry) {
  InterceptResult passthrough;
  passthrough.response = response;
  if (response.status != kPaymentRequired) {
    return passthrough;
  }

  const HeaderMap headers = NormalizeHeaders(response.headers);
  auto challenge = ParseChallengeHeaders(headers, context);
  if (!challenge && response.body) {
    challenge = ParseChallengeBody(headers, *response.body, context);
  }
  if (!challenge) {
    util::LogDebug("402 from " + context.origin + " carries no usable challenge");
    return passthrough;
  }
  if (IsUpstreamError(*challenge)) {
    util::LogInfo("402 from " + context.origin + " reports an upstream error; passing through");
    return passthrough;
  }

  auto resolution = sink_.Submit(*challenge, options_.tab_id);
  if (!resolution) {
    util::LogWarn("challenge " + challenge->challenge_id + " could not be submitted");
    return passthrough;
  }
  passthrough.resolution = resolution;

  switch (resolution->action) {
    case ResolutionAction::kRetry:
      return Retry(response, *resolution, retry);
    case ResolutionAction::kPending: {
      const std::string id = resolution->challenge_id.value_or(challenge->challenge_id);
      auto decided = AwaitResolution(id);
      if (!decided || decided->action != ResolutionAction::kRetry) {
        passthrough.resolution = decided;
        return passthrough;
      }
      return Retry(response, *decided, retry);
    }
    case ResolutionAction::kDeny:
    case ResolutionAction::kError:
      return passthrough;
  }
  return passthrough;
}

std::optional<ChallengeResolution> Interceptor::AwaitResolution(const std::string& challenge_id) {
  const auto deadline = std::chrono::steady_clock::now() + options_.pending_timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    auto resolution = sink_.PollResolution(challenge_id);
    if (resolution && resolution->action != ResolutionAction::kPending) {
      return resolution;
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }
  util::LogWarn("gave up waiting for a decision on challenge " + challenge_id);
  return std::nullopt;
}

InterceptResult Interceptor::Retry(const ObservedResponse& original,
                                   const ChallengeResolution& resolution,
                                   const RetryFunction& retry) {
  InterceptResult result;
  result.response = original;
  result.resolution = resolution;
  if (!retry) {
    return result;
  }
  HeaderMap sent(resolution.retry_headers.begin(), resolution.retry_headers.end());
  auto retried = retry(sent);
  if (!retried) {
    util::LogWarn("paid retry failed to complete");
    return result;
  }
  result.outcome = InterceptOutcome::kRetried;
  result.response = *retried;
  ProcessSettlement(*retried, NormalizeHeaders(sent));
  return result;
}

void Interceptor::ProcessSettlement(const ObservedResponse& response,
                                    const HeaderMap& sent_headers) {
  if (!response.ok()) {
    return;
  }
  const HeaderMap headers = NormalizeHeaders(response.headers);
  auto notice = BuildSettlementNotice(HeaderValue(sent_headers, kPaymentIdHeader),
                                      HeaderValue(headers, kPaymentResponseHeader));
  if (!notice) {
    return;
  }
  if (!sink_.ReportSettlement(*notice)) {
    util::LogWarn("settlement for " + notice->payment_id.value_or("?") + " was not delivered");
  }
}

}  // namespace autopay::x402
