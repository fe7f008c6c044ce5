#include "wallet/wallet_manager.hpp"

#include <algorithm>
#include <vector>

#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"
#include "util/strings.hpp"

namespace autopay::wallet {

namespace {

std::span<const std::uint8_t> AddressBytes(const std::string& address) {
  return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(address.data()),
                                       address.size());
}

bool ParsePrivateKeyHex(const std::string& text, crypto::PrivateKey* key) {
  std::string trimmed = util::Trim(text);
  std::vector<std::uint8_t> raw;
  const bool ok = util::HexDecode(trimmed, &raw) && raw.size() == key->size() &&
                  crypto::IsValidPrivateKey(raw);
  if (ok) {
    std::copy(raw.begin(), raw.end(), key->begin());
  }
  util::SecureWipe(raw);
  util::SecureWipe(trimmed);
  return ok;
}

}  // namespace

const char* WalletErrorMessage(WalletError error) {
  switch (error) {
    case WalletError::kNone:
      return "";
    case WalletError::kInvalidSecret:
      return "Invalid private key";
    case WalletError::kWeakPassphrase:
      return "Passphrase must be at least 8 characters";
    case WalletError::kIncorrectPassphrase:
      return "Incorrect passphrase";
    case WalletError::kNotConfigured:
      return "Wallet not configured";
    case WalletError::kWalletLocked:
      return "Wallet locked";
    case WalletError::kStorageFailure:
      return "Failed to encrypt wallet";
  }
  return "Unknown wallet error";
}

UnlockSession::UnlockSession(const crypto::PrivateKey& key, const crypto::Address& address,
                             std::int64_t expires_at_ms)
    : key_(key), address_(address), expires_at_ms_(expires_at_ms) {}

UnlockSession::~UnlockSession() { util::SecureWipe(key_); }

WalletManager::WalletManager(const util::Clock& clock, util::Argon2idParams kdf_params)
    : clock_(clock), kdf_params_(kdf_params) {}

void WalletManager::Load(std::optional<WalletRecord> record) {
  session_.reset();
  record_ = std::move(record);
  if (record_) {
    record_->locked_until_ms = 0;
  }
}

WalletError WalletManager::Configure(const std::string& secret_hex, const std::string& passphrase,
                                     std::optional<int> lock_minutes,
                                     std::optional<std::string> label) {
  crypto::PrivateKey key{};
  if (!ParsePrivateKeyHex(secret_hex, &key)) {
    return WalletError::kInvalidSecret;
  }
  auto address = crypto::AddressFromPrivateKey(key);
  if (!address) {
    util::SecureWipe(key);
    return WalletError::kInvalidSecret;
  }
  if (passphrase.size() < kMinPassphraseLength) {
    util::SecureWipe(key);
    return WalletError::kWeakPassphrase;
  }

  WalletRecord record;
  record.address = crypto::ToChecksumString(*address);
  SealedSecret sealed;
  std::string error;
  if (!SealSecret(key, passphrase, AddressBytes(record.address), kdf_params_, &sealed, &error)) {
    util::SecureWipe(key);
    util::LogError("wallet: sealing failed: " + error);
    return WalletError::kStorageFailure;
  }
  record.sealed = std::move(sealed);
  record.lock_duration_minutes = ClampLockMinutes(lock_minutes.value_or(kDefaultLockMinutes));
  record.locked_until_ms =
      clock_.NowMs() + static_cast<std::int64_t>(record.lock_duration_minutes) * util::kMillisPerMinute;
  if (label) {
    record.label = std::move(label);
  } else if (record_ && record_->label) {
    record.label = record_->label;
  }

  session_ = std::make_unique<UnlockSession>(key, *address, record.locked_until_ms);
  util::SecureWipe(key);
  record_ = std::move(record);
  util::LogInfo("wallet: configured " + record_->address);
  return WalletError::kNone;
}

bool WalletManager::Decrypt(const std::string& passphrase, crypto::PrivateKey* key) const {
  if (!record_ || !record_->sealed) {
    return false;
  }
  std::vector<std::uint8_t> plaintext;
  bool ok = OpenSecret(*record_->sealed, passphrase, AddressBytes(record_->address), &plaintext) &&
            plaintext.size() == key->size();
  if (ok) {
    std::copy(plaintext.begin(), plaintext.end(), key->begin());
    // The record could pair a valid blob with a foreign address.
    auto derived = crypto::AddressFromPrivateKey(*key);
    ok = derived && crypto::ToChecksumString(*derived) == record_->address;
    if (!ok) {
      util::SecureWipe(*key);
    }
  }
  util::SecureWipe(plaintext);
  return ok;
}

WalletError WalletManager::Unlock(const std::string& passphrase, std::optional<int> lock_minutes) {
  if (!record_ || !record_->sealed) {
    return WalletError::kNotConfigured;
  }
  crypto::PrivateKey key{};
  if (!Decrypt(passphrase, &key)) {
    util::LogWarn("wallet: unlock rejected");
    return WalletError::kIncorrectPassphrase;
  }
  auto address = crypto::AddressFromPrivateKey(key);
  if (lock_minutes) {
    record_->lock_duration_minutes = ClampLockMinutes(*lock_minutes);
  }
  record_->locked_until_ms = clock_.NowMs() + static_cast<std::int64_t>(
                                                  record_->lock_duration_minutes) *
                                                  util::kMillisPerMinute;
  session_ = std::make_unique<UnlockSession>(key, *address, record_->locked_until_ms);
  util::SecureWipe(key);
  util::LogInfo("wallet: unlocked for " + std::to_string(record_->lock_duration_minutes) +
                " minutes");
  return WalletError::kNone;
}

void WalletManager::Lock() {
  session_.reset();
  if (record_) {
    record_->locked_until_ms = 0;
  }
}

WalletError WalletManager::ExportSecret(const std::string& passphrase,
                                        std::string* secret_hex) const {
  if (!record_ || !record_->sealed) {
    return WalletError::kNotConfigured;
  }
  crypto::PrivateKey key{};
  if (!Decrypt(passphrase, &key)) {
    return WalletError::kIncorrectPassphrase;
  }
  if (secret_hex) {
    *secret_hex = util::HexEncodePrefixed(key);
  }
  util::SecureWipe(key);
  return WalletError::kNone;
}

void WalletManager::Remove() {
  session_.reset();
  if (record_ && record_->sealed) {
    util::SecureWipe(record_->sealed->ciphertext);
    util::SecureWipe(record_->sealed->salt);
    util::SecureWipe(record_->sealed->nonce);
  }
  record_.reset();
  util::LogInfo("wallet: removed");
}

void WalletManager::ExpireIfDue() {
  if (session_ && clock_.NowMs() >= session_->expires_at_ms()) {
    Lock();
  }
}

const UnlockSession* WalletManager::ActiveSession() {
  ExpireIfDue();
  return session_.get();
}

bool WalletManager::RenewLock() {
  ExpireIfDue();
  if (!session_ || !record_) {
    return false;
  }
  record_->locked_until_ms = clock_.NowMs() + static_cast<std::int64_t>(
                                                  record_->lock_duration_minutes) *
                                                  util::kMillisPerMinute;
  session_->ExtendTo(record_->locked_until_ms);
  return true;
}

nlohmann::json WalletStatusToJson(const WalletStatus& status) {
  nlohmann::json out = {
      {"configured", status.configured},
      {"address", status.address},
      {"unlocked", status.unlocked},
      {"locked_until", status.locked_until_ms},
      {"lock_duration_minutes", status.lock_duration_minutes},
  };
  out["label"] = status.label ? nlohmann::json(*status.label) : nlohmann::json(nullptr);
  return out;
}

WalletStatus WalletManager::Status() const {
  WalletStatus status;
  if (!record_) {
    return status;
  }
  status.configured = record_->sealed.has_value();
  status.address = record_->address;
  status.lock_duration_minutes = record_->lock_duration_minutes;
  status.label = record_->label;
  const bool live = session_ && clock_.NowMs() < session_->expires_at_ms();
  status.unlocked = live;
  status.locked_until_ms = live ? session_->expires_at_ms() : 0;
  return status;
}

std::optional<WalletRecord> WalletManager::PersistedRecord() const {
  if (!record_) {
    return std::nullopt;
  }
  WalletRecord persisted = *record_;
  persisted.locked_until_ms = 0;
  return persisted;
}

}  // namespace autopay::wallet
