#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace autopay::x402 {

enum class SettlementStatus {
  kSuccess,
  kError,
};

// What the interception side reports after a paid retry.
struct SettlementNotice {
  std::optional<std::string> payment_id;
  std::optional<std::string> tx_hash;
  std::optional<std::string> network;
  std::optional<std::string> jwt;
  std::optional<SettlementStatus> status;
  std::optional<std::string> message;
};

nlohmann::json SettlementNoticeToJson(const SettlementNotice& notice);
bool SettlementNoticeFromJson(const nlohmann::json& value, SettlementNotice* out);

// Fields recovered from an X-PAYMENT-RESPONSE value.
struct DecodedSettlement {
  std::optional<std::string> tx_hash;
  std::optional<std::string> network;
  std::optional<std::string> jwt;
  std::optional<std::string> payment_id;
};

// Tries, in order: a JSON object, base64 of a JSON object, base64 of a compact
// token, a bare compact token (three or more dot-separated segments). Absent
// when none of them applies; the caller then leaves the payment pending.
std::optional<DecodedSettlement> DecodeSettlementHeader(const std::string& value);

// Combines the payment id the retry carried with the decoded header. Absent
// when there is neither.
std::optional<SettlementNotice> BuildSettlementNotice(
    const std::optional<std::string>& payment_id,
    const std::optional<std::string>& settlement_header);

// Status the payment record takes: an explicit status wins, otherwise a
// transaction reference means success and its absence an error.
SettlementStatus EffectiveStatus(const SettlementNotice& notice);

}  // namespace autopay::x402
