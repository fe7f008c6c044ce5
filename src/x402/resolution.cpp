#include "x402/resolution.hpp"

namespace autopay::x402 {

const char* ResolutionActionName(ResolutionAction action) {
  switch (action) {
    case ResolutionAction::kRetry:
      return "retry";
    case ResolutionAction::kDeny:
      return "deny";
    case ResolutionAction::kError:
      return "error";
    case ResolutionAction::kPending:
      return "pending";
  }
  return "error";
}

std::optional<ResolutionAction> ParseResolutionAction(const std::string& name) {
  if (name == "retry") return ResolutionAction::kRetry;
  if (name == "deny") return ResolutionAction::kDeny;
  if (name == "error") return ResolutionAction::kError;
  if (name == "pending") return ResolutionAction::kPending;
  return std::nullopt;
}

nlohmann::json ResolutionToJson(const ChallengeResolution& resolution) {
  nlohmann::json out = {{"action", ResolutionActionName(resolution.action)}};
  if (!resolution.retry_headers.empty()) {
    out["retry_headers"] = resolution.retry_headers;
  }
  if (resolution.challenge_id) {
    out["challenge_id"] = *resolution.challenge_id;
  }
  if (resolution.message) {
    out["message"] = *resolution.message;
  }
  return out;
}

bool ResolutionFromJson(const nlohmann::json& value, ChallengeResolution* out) {
  if (!out || !value.is_object()) {
    return false;
  }
  auto action_it = value.find("action");
  if (action_it == value.end() || !action_it->is_string()) {
    return false;
  }
  auto action = ParseResolutionAction(action_it->get<std::string>());
  if (!action) {
    return false;
  }
  ChallengeResolution resolution;
  resolution.action = *action;
  auto headers = value.find("retry_headers");
  if (headers != value.end() && headers->is_object()) {
    for (const auto& [name, header_value] : headers->items()) {
      if (header_value.is_string()) {
        resolution.retry_headers[name] = header_value.get<std::string>();
      }
    }
  }
  auto id = value.find("challenge_id");
  if (id != value.end() && id->is_string()) {
    resolution.challenge_id = id->get<std::string>();
  }
  auto message = value.find("message");
  if (message != value.end() && message->is_string()) {
    resolution.message = message->get<std::string>();
  }
  *out = std::move(resolution);
  return true;
}

}  // namespace autopay::x402
