#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace autopay::store {

constexpr std::size_t kMaxHistoryEntries = 2000;

enum class PaymentStatus {
  kPending,
  kSuccess,
  kDenied,
  kError,
};

const char* PaymentStatusName(PaymentStatus status);
std::optional<PaymentStatus> ParsePaymentStatus(const std::string& name);

struct PaymentRecord {
  std::string id;
  std::string origin;
  std::string endpoint;
  double amount_usd{0.0};
  std::string token_symbol{"USDC"};
  std::int64_t timestamp_ms{0};
  PaymentStatus status{PaymentStatus::kPending};
  bool auto_approved{false};
  std::optional<std::string> tx_reference;
  std::optional<std::string> note;
};

nlohmann::json PaymentRecordToJson(const PaymentRecord& record);
bool PaymentRecordFromJson(const nlohmann::json& value, PaymentRecord* out);

// Payment log, newest first, capped at kMaxHistoryEntries. Records are only
// appended, and a pending one is settled at most once.
class PaymentHistory {
 public:
  void Add(PaymentRecord record);
  // Moves a pending record to its final status. False when the id is unknown
  // or the record was already settled.
  bool MarkSettlement(const std::string& id, bool success,
                      const std::optional<std::string>& tx_reference,
                      const std::optional<std::string>& note);
  const PaymentRecord* Find(const std::string& id) const;
  void Clear() { records_.clear(); }

  const std::vector<PaymentRecord>& records() const { return records_; }
  std::size_t size() const { return records_.size(); }

  nlohmann::json ToJson() const;
  // Entries that fail to parse are skipped.
  static PaymentHistory FromJson(const nlohmann::json& value);

 private:
  std::vector<PaymentRecord> records_;
};

}  // namespace autopay::store
