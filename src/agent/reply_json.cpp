#include "agent/reply_json.hpp"

#include <variant>

namespace autopay::agent {

namespace {

void PutOptional(nlohmann::json& out, const char* key, const std::optional<std::string>& value) {
  if (value) {
    out[key] = *value;
  }
}

void PutKind(nlohmann::json& out, const std::optional<ErrorKind>& kind) {
  if (kind) {
    out["kind"] = ErrorKindName(*kind);
  }
}

nlohmann::json ToJson(const x402::ChallengeResolution& reply) {
  return x402::ResolutionToJson(reply);
}

nlohmann::json ToJson(const PendingChallengeReply& reply) {
  return {{"entry", reply.entry ? store::PendingChallengeToJson(*reply.entry)
                                : nlohmann::json(nullptr)}};
}

nlohmann::json ToJson(const DecisionReply& reply) { return DecisionReplyToJson(reply); }

nlohmann::json ToJson(const ResolutionReply& reply) {
  return {{"resolution", reply.resolution ? x402::ResolutionToJson(*reply.resolution)
                                          : nlohmann::json(nullptr)}};
}

nlohmann::json ToJson(const StateReply& reply) { return reply.state; }

nlohmann::json ToJson(const WalletReply& reply) { return WalletReplyToJson(reply); }

nlohmann::json ToJson(const ExportReply& reply) {
  nlohmann::json out = nlohmann::json::object();
  PutOptional(out, "secret", reply.secret);
  PutOptional(out, "error", reply.error);
  return out;
}

nlohmann::json ToJson(const SettingsReply& reply) {
  nlohmann::json out = {{"settings", policy::SettingsToJson(reply.settings)}};
  PutOptional(out, "error", reply.error);
  return out;
}

nlohmann::json ToJson(const PoliciesReply& reply) {
  nlohmann::json out = {{"policies", policy::PolicyMapToJson(reply.policies)}};
  PutOptional(out, "error", reply.error);
  return out;
}

nlohmann::json ToJson(const HistoryReply& reply) {
  nlohmann::json history = nlohmann::json::array();
  for (const auto& record : reply.history) {
    history.push_back(store::PaymentRecordToJson(record));
  }
  return {{"history", std::move(history)}};
}

nlohmann::json ToJson(const AckReply& reply) {
  nlohmann::json out = {{"ok", reply.ok}};
  PutOptional(out, "error", reply.error);
  PutKind(out, reply.kind);
  return out;
}

nlohmann::json ToJson(const TokenReply& reply) {
  return {{"token", reply.token ? nlohmann::json(*reply.token) : nlohmann::json(nullptr)}};
}

nlohmann::json ToJson(const BalancesReply& reply) {
  nlohmann::json out = {{"balances", store::BalancesToJson(reply.balances)}};
  PutOptional(out, "error", reply.error);
  return out;
}

}  // namespace

nlohmann::json DecisionReplyToJson(const DecisionReply& reply) {
  nlohmann::json out = {{"status", DecisionStatusName(reply.status)}};
  PutOptional(out, "message", reply.message);
  PutKind(out, reply.kind);
  return out;
}

nlohmann::json WalletReplyToJson(const WalletReply& reply) {
  nlohmann::json out = {
      {"wallet", reply.wallet ? wallet::WalletStatusToJson(*reply.wallet)
                              : nlohmann::json(nullptr)}};
  PutOptional(out, "error", reply.error);
  PutKind(out, reply.kind);
  return out;
}

nlohmann::json ReplyToJson(const Reply& reply) {
  return std::visit([](const auto& typed) { return ToJson(typed); }, reply);
}

}  // namespace autopay::agent
