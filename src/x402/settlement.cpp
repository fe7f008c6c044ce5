#include "x402/settlement.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "util/base64.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::x402 {

namespace {

std::optional<nlohmann::json> ParseObject(const std::string& text) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

bool LooksLikeBase64(const std::string& text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
  });
}

bool LooksLikeCompactToken(const std::string& text) {
  if (text.empty() || std::count(text.begin(), text.end(), '.') < 2) {
    return false;
  }
  return std::all_of(text.begin(), text.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' ||
           c == '=';
  });
}

std::optional<std::string> StringField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    return std::nullopt;
  }
  if (it->is_string() && !it->get<std::string>().empty()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  return std::nullopt;
}

DecodedSettlement FromObject(const nlohmann::json& object) {
  DecodedSettlement decoded;
  decoded.tx_hash = StringField(object, "transaction");
  if (!decoded.tx_hash) {
    decoded.tx_hash = StringField(object, "txHash");
  }
  decoded.network = StringField(object, "network");
  decoded.jwt = StringField(object, "jwt");
  decoded.payment_id = StringField(object, "paymentId");
  return decoded;
}

}  // namespace

std::optional<DecodedSettlement> DecodeSettlementHeader(const std::string& value) {
  const std::string raw = util::Trim(value);
  if (raw.empty()) {
    return std::nullopt;
  }
  if (auto object = ParseObject(raw)) {
    return FromObject(*object);
  }
  if (LooksLikeBase64(raw)) {
    std::string decoded;
    if (util::Base64DecodeToString(raw, &decoded)) {
      if (auto object = ParseObject(decoded)) {
        return FromObject(*object);
      }
      const std::string token = util::Trim(decoded);
      if (LooksLikeCompactToken(token)) {
        DecodedSettlement result;
        result.jwt = token;
        return result;
      }
    }
  }
  if (LooksLikeCompactToken(raw)) {
    DecodedSettlement result;
    result.jwt = raw;
    return result;
  }
  util::LogDebug("settlement header not recognized");
  return std::nullopt;
}

std::optional<SettlementNotice> BuildSettlementNotice(
    const std::optional<std::string>& payment_id,
    const std::optional<std::string>& settlement_header) {
  std::optional<DecodedSettlement> decoded;
  if (settlement_header) {
    decoded = DecodeSettlementHeader(*settlement_header);
    if (!decoded) {
      return std::nullopt;
    }
  }
  SettlementNotice notice;
  notice.payment_id = payment_id;
  if (decoded) {
    if (!notice.payment_id) {
      notice.payment_id = decoded->payment_id;
    }
    notice.tx_hash = decoded->tx_hash;
    notice.network = decoded->network;
    notice.jwt = decoded->jwt;
  }
  if (!notice.payment_id) {
    return std::nullopt;
  }
  return notice;
}

SettlementStatus EffectiveStatus(const SettlementNotice& notice) {
  if (notice.status) {
    return *notice.status;
  }
  return notice.tx_hash ? SettlementStatus::kSuccess : SettlementStatus::kError;
}

nlohmann::json SettlementNoticeToJson(const SettlementNotice& notice) {
  nlohmann::json out = nlohmann::json::object();
  if (notice.payment_id) out["payment_id"] = *notice.payment_id;
  if (notice.tx_hash) out["tx_hash"] = *notice.tx_hash;
  if (notice.network) out["network"] = *notice.network;
  if (notice.jwt) out["jwt"] = *notice.jwt;
  if (notice.status) {
    out["status"] = *notice.status == SettlementStatus::kSuccess ? "success" : "error";
  }
  if (notice.message) out["message"] = *notice.message;
  return out;
}

bool SettlementNoticeFromJson(const nlohmann::json& value, SettlementNotice* out) {
  if (!out || !value.is_object()) {
    return false;
  }
  SettlementNotice notice;
  notice.payment_id = StringField(value, "payment_id");
  notice.tx_hash = StringField(value, "tx_hash");
  notice.network = StringField(value, "network");
  notice.jwt = StringField(value, "jwt");
  notice.message = StringField(value, "message");
  if (auto status = StringField(value, "status")) {
    if (*status == "success") {
      notice.status = SettlementStatus::kSuccess;
    } else if (*status == "error") {
      notice.status = SettlementStatus::kError;
    } else {
      return false;
    }
  }
  *out = std::move(notice);
  return true;
}

}  // namespace autopay::x402
