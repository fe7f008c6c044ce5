#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "crypto/eth_address.hpp"
#include "crypto/secp256k1.hpp"
#include "util/argon2_kdf.hpp"
#include "util/clock.hpp"
#include "wallet/wallet_record.hpp"

namespace autopay::wallet {

enum class WalletError {
  kNone = 0,
  kInvalidSecret,
  kWeakPassphrase,
  kIncorrectPassphrase,
  kNotConfigured,
  kWalletLocked,
  kStorageFailure,
};

const char* WalletErrorMessage(WalletError error);

constexpr std::size_t kMinPassphraseLength = 8;

// Decrypted key held in memory for a bounded window. Only WalletManager
// creates one; nothing serializes it. The key is wiped on destruction.
class UnlockSession {
 public:
  UnlockSession(const crypto::PrivateKey& key, const crypto::Address& address,
                std::int64_t expires_at_ms);
  ~UnlockSession();

  UnlockSession(const UnlockSession&) = delete;
  UnlockSession& operator=(const UnlockSession&) = delete;

  const crypto::PrivateKey& key() const { return key_; }
  const crypto::Address& address() const { return address_; }
  std::int64_t expires_at_ms() const { return expires_at_ms_; }
  void ExtendTo(std::int64_t expires_at_ms) { expires_at_ms_ = expires_at_ms; }

 private:
  crypto::PrivateKey key_{};
  crypto::Address address_;
  std::int64_t expires_at_ms_{0};
};

// Redacted wallet view for replies and the state snapshot.
struct WalletStatus {
  bool configured{false};
  std::string address;
  bool unlocked{false};
  std::int64_t locked_until_ms{0};
  int lock_duration_minutes{kDefaultLockMinutes};
  std::optional<std::string> label;
};

nlohmann::json WalletStatusToJson(const WalletStatus& status);

// Unconfigured -> Locked -> Unlocked(until T) -> Locked.
//
// Not thread-safe; the orchestrator serializes access.
class WalletManager {
 public:
  WalletManager(const util::Clock& clock, util::Argon2idParams kdf_params);

  // Installs a record read from persisted state. Always starts locked.
  void Load(std::optional<WalletRecord> record);

  WalletError Configure(const std::string& secret_hex, const std::string& passphrase,
                        std::optional<int> lock_minutes = std::nullopt,
                        std::optional<std::string> label = std::nullopt);
  WalletError Unlock(const std::string& passphrase, std::optional<int> lock_minutes = std::nullopt);
  void Lock();
  // Requires the passphrase on every call; the lock state is left alone.
  WalletError ExportSecret(const std::string& passphrase, std::string* secret_hex) const;
  void Remove();

  // Null when locked. An expired session is destroyed here.
  const UnlockSession* ActiveSession();
  // Slides the unlock window to now + lock duration. False when locked.
  bool RenewLock();

  bool IsConfigured() const { return record_.has_value(); }
  WalletStatus Status() const;
  // The record as it may be written to disk (locked_until always 0).
  std::optional<WalletRecord> PersistedRecord() const;

 private:
  bool Decrypt(const std::string& passphrase, crypto::PrivateKey* key) const;
  void ExpireIfDue();

  const util::Clock& clock_;
  util::Argon2idParams kdf_params_;
  std::optional<WalletRecord> record_;
  std::unique_ptr<UnlockSession> session_;
};

}  // namespace autopay::wallet
