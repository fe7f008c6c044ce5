#include "x402/challenge.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <utility>

#include "crypto/eth_address.hpp"
#include "util/decimal.hpp"
#include "util/strings.hpp"

namespace autopay::x402 {

namespace {

template <typename T>
std::optional<T> OptionalField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

// Integers only. Floats and values outside T are malformed.
template <typename T>
bool ReadIntegerField(const nlohmann::json& obj, const char* key, std::optional<T>* out) {
  out->reset();
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    if (!std::in_range<T>(value)) {
      return false;
    }
    *out = static_cast<T>(value);
    return true;
  }
  if (it->is_number_integer()) {
    const auto value = it->get<std::int64_t>();
    if (!std::in_range<T>(value)) {
      return false;
    }
    *out = static_cast<T>(value);
    return true;
  }
  return false;
}

bool NormalizeAddress(std::string* address) {
  auto parsed = crypto::ParseAddress(util::Trim(*address));
  if (!parsed) {
    return false;
  }
  *address = crypto::ToChecksumString(*parsed);
  return true;
}

}  // namespace

HeaderMap NormalizeHeaders(const HeaderMap& headers) {
  HeaderMap out;
  for (const auto& [name, value] : headers) {
    out[util::ToLower(util::Trim(name))] = value;
  }
  return out;
}

bool ValidateChallenge(ChallengeDetails* challenge, std::string* error) {
  const auto fail = [&](const char* what) {
    if (error) {
      *error = what;
    }
    return false;
  };
  if (!challenge) {
    return fail("missing challenge");
  }
  if (challenge->challenge_id.empty()) {
    return fail("challenge id is empty");
  }
  if (challenge->seller.empty() || !NormalizeAddress(&challenge->seller)) {
    return fail("invalid seller address");
  }
  if (challenge->token_address.empty() || !NormalizeAddress(&challenge->token_address)) {
    return fail("invalid token address");
  }
  const std::string atomic = util::Trim(challenge->amount_atomic);
  if (!util::IsDecimalString(atomic)) {
    return fail("atomic amount is not a base-10 integer");
  }
  challenge->amount_atomic = util::NormalizeDecimal(atomic);
  if (challenge->chain_id == 0) {
    return fail("chain id missing");
  }
  if (!std::isfinite(challenge->amount_usd) || challenge->amount_usd < 0) {
    return fail("invalid USD amount");
  }
  if (challenge->token_decimals && (*challenge->token_decimals < 0 || *challenge->token_decimals > 36)) {
    return fail("invalid token decimals");
  }
  return true;
}

nlohmann::json ChallengeToJson(const ChallengeDetails& challenge) {
  nlohmann::json out = {
      {"challenge_id", challenge.challenge_id},
      {"origin", challenge.origin},
      {"endpoint", challenge.endpoint},
      {"method", challenge.method},
      {"amount_usd", challenge.amount_usd},
      {"token_symbol", challenge.token_symbol},
      {"chain_id", challenge.chain_id},
      {"token_address", challenge.token_address},
      {"seller", challenge.seller},
      {"amount_atomic", challenge.amount_atomic},
      {"raw_headers", challenge.raw_headers},
  };
  if (challenge.network) out["network"] = *challenge.network;
  if (challenge.token_name) out["token_name"] = *challenge.token_name;
  if (challenge.token_version) out["token_version"] = *challenge.token_version;
  if (challenge.token_decimals) out["token_decimals"] = *challenge.token_decimals;
  if (challenge.protocol_version) out["protocol_version"] = *challenge.protocol_version;
  if (challenge.raw_challenge) out["raw_challenge"] = *challenge.raw_challenge;
  return out;
}

bool ChallengeFromJson(const nlohmann::json& value, ChallengeDetails* out, std::string* error) {
  if (!out || !value.is_object()) {
    if (error) {
      *error = "challenge is not an object";
    }
    return false;
  }
  ChallengeDetails challenge;
  try {
    challenge.challenge_id = value.value("challenge_id", std::string());
    challenge.origin = value.value("origin", std::string());
    challenge.endpoint = value.value("endpoint", std::string());
    challenge.method = value.value("method", std::string("GET"));
    challenge.amount_usd = value.value("amount_usd", 0.0);
    challenge.token_symbol = value.value("token_symbol", std::string("USDC"));
    std::optional<std::uint64_t> chain_id;
    if (!ReadIntegerField(value, "chain_id", &chain_id)) {
      if (error) {
        *error = "chain_id must be an unsigned integer";
      }
      return false;
    }
    challenge.chain_id = chain_id.value_or(0);
    challenge.token_address = value.value("token_address", std::string());
    challenge.seller = value.value("seller", std::string());
    challenge.amount_atomic = value.value("amount_atomic", std::string());
    challenge.network = OptionalField<std::string>(value, "network");
    challenge.token_name = OptionalField<std::string>(value, "token_name");
    challenge.token_version = OptionalField<std::string>(value, "token_version");
    if (!ReadIntegerField(value, "token_decimals", &challenge.token_decimals) ||
        !ReadIntegerField(value, "protocol_version", &challenge.protocol_version)) {
      if (error) {
        *error = "token_decimals and protocol_version must be integers";
      }
      return false;
    }
    auto headers = value.find("raw_headers");
    if (headers != value.end() && headers->is_object()) {
      for (const auto& [name, header_value] : headers->items()) {
        if (header_value.is_string()) {
          challenge.raw_headers[util::ToLower(name)] = header_value.get<std::string>();
        }
      }
    }
    auto raw = value.find("raw_challenge");
    if (raw != value.end() && !raw->is_null()) {
      challenge.raw_challenge = *raw;
    }
  } catch (const nlohmann::json::exception& ex) {
    if (error) {
      *error = std::string("malformed challenge: ") + ex.what();
    }
    return false;
  }
  if (!ValidateChallenge(&challenge, error)) {
    return false;
  }
  *out = std::move(challenge);
  return true;
}

}  // namespace autopay::x402
