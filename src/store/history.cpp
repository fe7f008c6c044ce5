#include "store/history.hpp"

#include <utility>

#include "util/logging.hpp"

namespace autopay::store {

const char* PaymentStatusName(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::kPending:
      return "pending";
    case PaymentStatus::kSuccess:
      return "success";
    case PaymentStatus::kDenied:
      return "denied";
    case PaymentStatus::kError:
      return "error";
  }
  return "error";
}

std::optional<PaymentStatus> ParsePaymentStatus(const std::string& name) {
  if (name == "pending") return PaymentStatus::kPending;
  if (name == "success") return PaymentStatus::kSuccess;
  if (name == "denied") return PaymentStatus::kDenied;
  if (name == "error") return PaymentStatus::kError;
  return std::nullopt;
}

nlohmann::json PaymentRecordToJson(const PaymentRecord& record) {
  nlohmann::json out = {
      {"id", record.id},
      {"origin", record.origin},
      {"endpoint", record.endpoint},
      {"amount_usd", record.amount_usd},
      {"token_symbol", record.token_symbol},
      {"timestamp", record.timestamp_ms},
      {"status", PaymentStatusName(record.status)},
      {"auto_approved", record.auto_approved},
  };
  if (record.tx_reference) out["tx_reference"] = *record.tx_reference;
  if (record.note) out["note"] = *record.note;
  return out;
}

bool PaymentRecordFromJson(const nlohmann::json& value, PaymentRecord* out) {
  if (!out || !value.is_object()) {
    return false;
  }
  try {
    PaymentRecord record;
    record.id = value.at("id").get<std::string>();
    record.origin = value.value("origin", std::string());
    record.endpoint = value.value("endpoint", std::string());
    record.amount_usd = value.value("amount_usd", 0.0);
    record.token_symbol = value.value("token_symbol", std::string("USDC"));
    record.timestamp_ms = value.value("timestamp", std::int64_t{0});
    auto status = ParsePaymentStatus(value.value("status", std::string()));
    if (!status) {
      return false;
    }
    record.status = *status;
    record.auto_approved = value.value("auto_approved", false);
    if (auto it = value.find("tx_reference"); it != value.end() && it->is_string()) {
      record.tx_reference = it->get<std::string>();
    }
    if (auto it = value.find("note"); it != value.end() && it->is_string()) {
      record.note = it->get<std::string>();
    }
    *out = std::move(record);
    return true;
  } catch (const nlohmann::json::exception&) {
    return false;
  }
}

void PaymentHistory::Add(PaymentRecord record) {
  records_.insert(records_.begin(), std::move(record));
  if (records_.size() > kMaxHistoryEntries) {
    records_.resize(kMaxHistoryEntries);
  }
}

bool PaymentHistory::MarkSettlement(const std::string& id, bool success,
                                    const std::optional<std::string>& tx_reference,
                                    const std::optional<std::string>& note) {
  for (auto& record : records_) {
    if (record.id != id) {
      continue;
    }
    if (record.status != PaymentStatus::kPending) {
      util::LogWarn("settlement for " + id + " ignored; payment already " +
                    PaymentStatusName(record.status));
      return false;
    }
    record.status = success ? PaymentStatus::kSuccess : PaymentStatus::kError;
    if (tx_reference) record.tx_reference = tx_reference;
    if (note) record.note = note;
    return true;
  }
  return false;
}

const PaymentRecord* PaymentHistory::Find(const std::string& id) const {
  for (const auto& record : records_) {
    if (record.id == id) {
      return &record;
    }
  }
  return nullptr;
}

nlohmann::json PaymentHistory::ToJson() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& record : records_) {
    out.push_back(PaymentRecordToJson(record));
  }
  return out;
}

PaymentHistory PaymentHistory::FromJson(const nlohmann::json& value) {
  PaymentHistory history;
  if (!value.is_array()) {
    return history;
  }
  for (const auto& entry : value) {
    PaymentRecord record;
    if (PaymentRecordFromJson(entry, &record)) {
      history.records_.push_back(std::move(record));
    }
    if (history.records_.size() == kMaxHistoryEntries) {
      break;
    }
  }
  return history;
}

}  // namespace autopay::store
