#include "x402/authorization.hpp"

#include <utility>

#include "crypto/eip712.hpp"
#include "crypto/secp256k1.hpp"
#include "util/base64.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::x402 {

namespace {

constexpr const char* kDefaultTokenName = "USD Coin";
constexpr const char* kDefaultTokenVersion = "2";

std::optional<std::string> NonEmptyString(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string value = util::Trim(it->get<std::string>());
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> VersionHint(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    return it->get<int>();
  }
  if (it->is_string()) {
    const std::string text = util::Trim(it->get<std::string>());
    if (text == "1") return 1;
    if (text == "2") return 2;
  }
  return std::nullopt;
}

const nlohmann::json* FirstExactAccept(const nlohmann::json& raw) {
  if (!raw.is_object()) {
    return nullptr;
  }
  auto accepts = raw.find("accepts");
  if (accepts == raw.end() || !accepts->is_array()) {
    return nullptr;
  }
  for (const auto& entry : *accepts) {
    if (entry.is_object() && NonEmptyString(entry, "scheme") == std::optional<std::string>("exact")) {
      return &entry;
    }
  }
  return nullptr;
}

}  // namespace

NetworkSelection ResolveNetwork(const ChallengeDetails& challenge, Chain configured_chain) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  const nlohmann::json& raw = challenge.raw_challenge ? *challenge.raw_challenge : kEmpty;
  const nlohmann::json* accept = FirstExactAccept(raw);

  NetworkSelection selection;
  if (challenge.network && !util::Trim(*challenge.network).empty()) {
    selection.descriptor = util::Trim(*challenge.network);
  } else if (auto from_accept = accept ? NonEmptyString(*accept, "network") : std::nullopt) {
    selection.descriptor = *from_accept;
  } else if (auto from_raw = NonEmptyString(raw, "network")) {
    selection.descriptor = *from_raw;
  } else if (challenge.chain_id > 0) {
    selection.descriptor = "eip155:" + std::to_string(challenge.chain_id);
  } else {
    selection.descriptor = GetChainInfo(configured_chain).network_name;
  }

  std::optional<int> hint = challenge.protocol_version;
  if (!hint) hint = VersionHint(raw, "x402Version");
  if (!hint && accept) hint = VersionHint(*accept, "x402Version");
  if (!hint) hint = VersionHint(raw, "version");

  if (hint && (*hint == 1 || *hint == 2)) {
    selection.protocol_version = *hint;
  } else {
    selection.protocol_version = selection.descriptor.find(':') != std::string::npos ? 2 : 1;
  }
  return selection;
}

AuthorizationBuilder::AuthorizationBuilder(const util::Clock& clock) : clock_(clock) {}

BuildError AuthorizationBuilder::Build(const wallet::UnlockSession* session,
                                       Chain configured_chain,
                                       const ChallengeDetails& challenge,
                                       PaymentAuthorization* out, std::string* error) const {
  auto fail = [&](BuildError code, const std::string& message) {
    if (error) {
      *error = message;
    }
    return code;
  };
  if (!session) {
    return fail(BuildError::kWalletLocked, "Wallet locked");
  }
  if (!out) {
    return fail(BuildError::kSigningFailure, "no output");
  }

  auto token = crypto::ParseAddress(challenge.token_address);
  auto seller = crypto::ParseAddress(challenge.seller);
  if (!token || !seller) {
    return fail(BuildError::kSigningFailure, "challenge carries an invalid address");
  }
  if (challenge.chain_id == 0) {
    return fail(BuildError::kSigningFailure, "challenge has no chain id");
  }

  const std::int64_t now_s = clock_.NowMs() / util::kMillisPerSecond;

  crypto::TransferWithAuthorization message;
  message.from = session->address();
  message.to = *seller;
  message.value = challenge.amount_atomic;
  message.valid_after = std::to_string(now_s - kValidAfterSkewSeconds);
  message.valid_before = std::to_string(now_s + kValidForSeconds);
  std::string rng_error;
  if (!util::FillSecureRandomBytes(message.nonce, &rng_error)) {
    return fail(BuildError::kSigningFailure, "nonce generation failed: " + rng_error);
  }

  crypto::Eip712Domain domain;
  domain.name = challenge.token_name.value_or(kDefaultTokenName);
  domain.version = challenge.token_version.value_or(kDefaultTokenVersion);
  domain.chain_id = challenge.chain_id;
  domain.verifying_contract = *token;

  auto struct_hash = crypto::StructHash(message);
  if (!struct_hash) {
    return fail(BuildError::kSigningFailure, "amount does not fit in uint256");
  }
  const auto digest = crypto::TypedDataDigest(crypto::DomainSeparator(domain), *struct_hash);
  auto signature = crypto::SignDigest(session->key(), digest);
  if (!signature) {
    return fail(BuildError::kSigningFailure, "signing failed");
  }

  PaymentAuthorization result;
  result.payment_id = challenge.challenge_id;
  result.network = ResolveNetwork(challenge, configured_chain);
  result.signature = util::HexEncodePrefixed(signature->Serialize());
  result.authorization = {
      {"from", crypto::ToChecksumString(message.from)},
      {"to", crypto::ToChecksumString(message.to)},
      {"value", message.value},
      {"validAfter", message.valid_after},
      {"validBefore", message.valid_before},
      {"nonce", util::HexEncodePrefixed(message.nonce)},
  };
  const nlohmann::json envelope = {
      {"x402Version", result.network.protocol_version},
      {"scheme", "exact"},
      {"network", result.network.descriptor},
      {"payload", {{"authorization", result.authorization}, {"signature", result.signature}}},
  };
  result.header_value = util::Base64Encode(envelope.dump());
  util::LogInfo("signed authorization for challenge " + challenge.challenge_id + " on " +
                result.network.descriptor);
  *out = std::move(result);
  return BuildError::kNone;
}

}  // namespace autopay::x402
