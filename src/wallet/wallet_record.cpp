#include "wallet/wallet_record.hpp"

#include <algorithm>

#include "crypto/eth_address.hpp"
#include "util/base64.hpp"

namespace autopay::wallet {

namespace {

constexpr const char* kPlaintextKeys[] = {"private_key", "privateKey", "secret", "decrypted_secret",
                                          "decryptedSecret"};

bool ReadBase64(const nlohmann::json& obj, const char* key, std::vector<std::uint8_t>* out) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return false;
  }
  return util::Base64Decode(it->get<std::string>(), out) && !out->empty();
}

}  // namespace

int ClampLockMinutes(int minutes) {
  return std::clamp(minutes, kMinLockMinutes, kMaxLockMinutes);
}

nlohmann::json WalletRecordToJson(const WalletRecord& record) {
  nlohmann::json out = nlohmann::json::object();
  out["address"] = record.address;
  if (record.sealed) {
    out["encrypted_secret"] = util::Base64Encode(record.sealed->ciphertext);
    out["encryption_salt"] = util::Base64Encode(record.sealed->salt);
    out["encryption_iv"] = util::Base64Encode(record.sealed->nonce);
    out["kdf"] = {{"t_cost", record.sealed->kdf.t_cost},
                  {"m_cost_kib", record.sealed->kdf.m_cost_kib},
                  {"parallelism", record.sealed->kdf.parallelism}};
  }
  out["lock_duration_minutes"] = record.lock_duration_minutes;
  out["locked_until"] = record.locked_until_ms;
  if (record.label) {
    out["label"] = *record.label;
  }
  return out;
}

bool WalletRecordFromJson(const nlohmann::json& value, WalletRecord* out, bool* had_plaintext,
                          std::string* error) {
  if (had_plaintext) {
    *had_plaintext = false;
  }
  if (!out || !value.is_object()) {
    if (error) {
      *error = "wallet record is not an object";
    }
    return false;
  }
  for (const char* key : kPlaintextKeys) {
    if (value.contains(key) && had_plaintext) {
      *had_plaintext = true;
    }
  }

  WalletRecord record;
  const auto address = value.value("address", std::string());
  auto parsed = crypto::ParseAddress(address);
  if (!parsed) {
    if (error) {
      *error = "wallet record has an invalid address";
    }
    return false;
  }
  record.address = crypto::ToChecksumString(*parsed);

  SealedSecret sealed;
  if (ReadBase64(value, "encrypted_secret", &sealed.ciphertext) &&
      ReadBase64(value, "encryption_salt", &sealed.salt) &&
      ReadBase64(value, "encryption_iv", &sealed.nonce)) {
    sealed.kdf = util::DefaultArgon2idParams();
    auto kdf = value.find("kdf");
    if (kdf != value.end() && kdf->is_object()) {
      sealed.kdf.t_cost = kdf->value("t_cost", sealed.kdf.t_cost);
      sealed.kdf.m_cost_kib = kdf->value("m_cost_kib", sealed.kdf.m_cost_kib);
      sealed.kdf.parallelism = kdf->value("parallelism", sealed.kdf.parallelism);
    }
    record.sealed = std::move(sealed);
  }

  auto minutes = value.find("lock_duration_minutes");
  if (minutes != value.end() && minutes->is_number_integer()) {
    record.lock_duration_minutes = ClampLockMinutes(minutes->get<int>());
  }
  // A process restart always starts locked.
  record.locked_until_ms = 0;
  auto label = value.find("label");
  if (label != value.end() && label->is_string()) {
    record.label = label->get<std::string>();
  }
  *out = std::move(record);
  return true;
}

}  // namespace autopay::wallet
