#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace autopay::x402 {

inline constexpr const char* kPaymentHeader = "X-PAYMENT";
inline constexpr const char* kPaymentIdHeader = "X-PAYMENT-ID";
inline constexpr const char* kPaymentResponseHeader = "X-PAYMENT-RESPONSE";

enum class ResolutionAction {
  kRetry,
  kDeny,
  kError,
  kPending,
};

const char* ResolutionActionName(ResolutionAction action);
std::optional<ResolutionAction> ParseResolutionAction(const std::string& name);

// What the interception side should do with an intercepted 402.
struct ChallengeResolution {
  ResolutionAction action{ResolutionAction::kError};
  std::map<std::string, std::string> retry_headers;
  std::optional<std::string> challenge_id;
  std::optional<std::string> message;
};

nlohmann::json ResolutionToJson(const ChallengeResolution& resolution);
bool ResolutionFromJson(const nlohmann::json& value, ChallengeResolution* out);

}  // namespace autopay::x402
