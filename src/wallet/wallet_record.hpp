#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "wallet/secret_box.hpp"

namespace autopay::wallet {

constexpr int kDefaultLockMinutes = 15;
constexpr int kMinLockMinutes = 1;
constexpr int kMaxLockMinutes = 24 * 60;

int ClampLockMinutes(int minutes);

// Persisted wallet. Holds only the sealed form of the key; the decrypted key
// lives in UnlockSession, which has no serializer.
struct WalletRecord {
  std::string address;  // EIP-55 checksum form
  std::optional<SealedSecret> sealed;
  int lock_duration_minutes{kDefaultLockMinutes};
  std::int64_t locked_until_ms{0};
  std::optional<std::string> label;
};

nlohmann::json WalletRecordToJson(const WalletRecord& record);

// Reads a persisted record. Unknown keys are ignored. A plaintext key field
// (left by an older or foreign writer) is never loaded; `had_plaintext` tells
// the caller to rewrite the document without it.
bool WalletRecordFromJson(const nlohmann::json& value, WalletRecord* out, bool* had_plaintext,
                          std::string* error = nullptr);

}  // namespace autopay::wallet
