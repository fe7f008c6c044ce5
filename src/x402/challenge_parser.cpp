#include "x402/challenge_parser.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>

#include "util/base64.hpp"
#include "util/csprng.hpp"
#include "util/decimal.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"
#include "x402/network.hpp"

namespace autopay::x402 {

namespace {

constexpr const char* kChallengeHeader = "x-payment-challenge";
constexpr const char* kIdHeader = "x-402-id";
constexpr std::uint64_t kDefaultChainId = 137;
constexpr int kDefaultDecimals = 6;

using Params = std::map<std::string, std::string>;

std::optional<std::string> FindHeader(const HeaderMap& headers, const char* name) {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

template <typename... Names>
std::optional<std::string> FirstOf(const std::map<std::string, std::string>& values,
                                   Names... names) {
  for (const char* name : {names...}) {
    auto it = values.find(name);
    if (it != values.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::string Upper(std::string_view text) {
  std::string out(util::Trim(text));
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::optional<double> ParseNumber(const std::string& text) {
  const std::string trimmed = util::Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double value = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> JsonNumber(const nlohmann::json& value) {
  if (value.is_number()) {
    const double number = value.get<double>();
    return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
  }
  if (value.is_string()) {
    return ParseNumber(value.get<std::string>());
  }
  return std::nullopt;
}

constexpr double kMaxChainId = 9.0e15;
constexpr double kMaxTokenDecimals = 36;

// Whole, positive and small enough to convert exactly.
std::optional<std::uint64_t> ChainIdFromNumber(double number) {
  if (!std::isfinite(number) || number <= 0 || number > kMaxChainId ||
      std::floor(number) != number) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(number);
}

std::optional<int> DecimalsFromNumber(double number) {
  if (!std::isfinite(number) || number < 0 || number > kMaxTokenDecimals ||
      std::floor(number) != number) {
    return std::nullopt;
  }
  return static_cast<int>(number);
}

// Decimal, "0x" hex or a JSON integer, normalized to base-10 digits.
std::optional<std::string> AtomicFromText(const std::string& text) {
  const std::string trimmed = util::Trim(text);
  if (trimmed.size() > 2 && trimmed[0] == '0' && (trimmed[1] == 'x' || trimmed[1] == 'X')) {
    return util::HexToDecimal(trimmed);
  }
  if (util::IsDecimalString(trimmed)) {
    return util::NormalizeDecimal(trimmed);
  }
  return std::nullopt;
}

std::optional<std::string> AtomicFromJson(const nlohmann::json& value) {
  if (value.is_string()) {
    return AtomicFromText(value.get<std::string>());
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<std::uint64_t>());
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return std::to_string(value.get<std::int64_t>());
  }
  if (value.is_number_float()) {
    const double number = value.get<double>();
    if (std::isfinite(number) && number >= 0 && number < 9.0e15 && std::floor(number) == number) {
      return std::to_string(static_cast<std::uint64_t>(number));
    }
  }
  return std::nullopt;
}

std::optional<std::uint64_t> ChainIdFromText(const std::string& text) {
  if (auto id = ChainIdFromNetworkDescriptor(text)) {
    return id;
  }
  if (auto number = ParseNumber(text)) {
    return ChainIdFromNumber(*number);
  }
  return std::nullopt;
}

std::optional<std::string> JsonString(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

const nlohmann::json* JsonField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::optional<int> JsonProtocolVersion(const nlohmann::json& obj) {
  for (const char* key : {"x402Version", "version"}) {
    const auto* field = JsonField(obj, key);
    if (field && field->is_number_integer()) {
      const auto version = field->get<std::int64_t>();
      if (version >= 0 && version <= 255) {
        return static_cast<int>(version);
      }
    }
  }
  return std::nullopt;
}

// Common tail of every attempt: the advisory USD estimate and the invariant
// checks. Logs and drops records that fail validation.
std::optional<ChallengeDetails> Finish(ChallengeDetails challenge, std::optional<double> amount_usd,
                                       const char* source) {
  if (amount_usd && *amount_usd >= 0) {
    challenge.amount_usd = *amount_usd;
  } else {
    int decimals = kDefaultDecimals;
    if (challenge.token_decimals) {
      decimals = *challenge.token_decimals;
    } else if (const auto* token = LookupKnownToken(challenge.chain_id, challenge.token_address)) {
      decimals = token->decimals;
    }
    challenge.amount_usd = util::AtomicToUnits(challenge.amount_atomic, decimals);
  }
  std::string error;
  if (!ValidateChallenge(&challenge, &error)) {
    util::LogDebug(std::string("x402: ") + source + " challenge rejected: " + error);
    return std::nullopt;
  }
  return challenge;
}

ChallengeDetails Base(const HeaderMap& headers, const RequestContext& context,
                      const std::string& fallback_id) {
  ChallengeDetails challenge;
  challenge.challenge_id = fallback_id;
  challenge.origin = context.origin;
  challenge.endpoint = context.endpoint;
  challenge.method = context.method;
  challenge.raw_headers = headers;
  return challenge;
}

std::optional<ChallengeDetails> FromJsonChallenge(const std::string& text, const HeaderMap& headers,
                                                  const RequestContext& context,
                                                  const std::string& fallback_id) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  ChallengeDetails challenge = Base(headers, context, fallback_id);

  const nlohmann::json* amount = nullptr;
  for (const char* key : {"amount", "amountAtomic", "maxAmountRequired"}) {
    if ((amount = JsonField(parsed, key)) != nullptr) {
      break;
    }
  }
  if (!amount) {
    return std::nullopt;
  }
  auto atomic = AtomicFromJson(*amount);
  if (!atomic) {
    return std::nullopt;
  }
  challenge.amount_atomic = *atomic;

  challenge.network = JsonString(parsed, "network");
  if (const auto* chain = JsonField(parsed, "chainId")) {
    if (chain->is_string()) {
      challenge.chain_id = ChainIdFromText(chain->get<std::string>()).value_or(0);
    } else if (auto number = JsonNumber(*chain)) {
      challenge.chain_id = ChainIdFromNumber(*number).value_or(0);
    }
  } else if (challenge.network) {
    challenge.chain_id = ChainIdFromNetworkDescriptor(*challenge.network).value_or(0);
  }
  if (challenge.chain_id == 0) {
    return std::nullopt;
  }

  challenge.seller = JsonString(parsed, "seller").value_or("");
  challenge.token_address = JsonString(parsed, "tokenAddress").value_or("");
  if (auto token = JsonString(parsed, "token"); token && !token->empty()) {
    challenge.token_symbol = Upper(*token);
  }
  challenge.token_name = JsonString(parsed, "tokenName");
  challenge.token_version = JsonString(parsed, "tokenVersion");
  if (const auto* decimals = JsonField(parsed, "tokenDecimals");
      decimals && decimals->is_number()) {
    challenge.token_decimals = DecimalsFromNumber(decimals->get<double>());
    if (!challenge.token_decimals) {
      return std::nullopt;
    }
  }
  challenge.protocol_version = JsonProtocolVersion(parsed);
  if (auto id = JsonString(parsed, "id"); id && !id->empty()) {
    challenge.challenge_id = *id;
  }
  std::optional<double> amount_usd;
  if (const auto* usd = JsonField(parsed, "amountUsd")) {
    amount_usd = JsonNumber(*usd);
  }
  challenge.raw_challenge = std::move(parsed);
  return Finish(std::move(challenge), amount_usd, "json");
}

bool LooksLikeBase64(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  for (unsigned char c : text) {
    if (!std::isalnum(c) && c != '+' && c != '/' && c != '=') {
      return false;
    }
  }
  return true;
}

// The value itself first, then its base64 decoding.
std::optional<ChallengeDetails> FromChallengeValue(const std::string& value,
                                                   const HeaderMap& headers,
                                                   const RequestContext& context,
                                                   const std::string& fallback_id) {
  const std::string trimmed = util::Trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  if (auto challenge = FromJsonChallenge(trimmed, headers, context, fallback_id)) {
    return challenge;
  }
  std::string decoded;
  if (LooksLikeBase64(trimmed) && util::Base64DecodeToString(trimmed, &decoded)) {
    return FromJsonChallenge(decoded, headers, context, fallback_id);
  }
  return std::nullopt;
}

// `key=value` or `key="value"` pairs separated by commas.
Params ParseAuthParams(std::string_view text) {
  Params params;
  std::size_t pos = 0;
  const auto is_key_char = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  };
  while (pos < text.size()) {
    while (pos < text.size() && (text[pos] == ',' || std::isspace(static_cast<unsigned char>(text[pos])))) {
      ++pos;
    }
    const std::size_t key_start = pos;
    while (pos < text.size() && is_key_char(text[pos])) {
      ++pos;
    }
    if (pos == key_start || pos >= text.size() || text[pos] != '=') {
      // Not a parameter; skip to the next separator.
      while (pos < text.size() && text[pos] != ',') {
        ++pos;
      }
      continue;
    }
    const std::string key(text.substr(key_start, pos - key_start));
    ++pos;  // '='
    std::string value;
    if (pos < text.size() && text[pos] == '"') {
      const auto close = text.find('"', pos + 1);
      if (close == std::string_view::npos) {
        value = std::string(text.substr(pos + 1));
        pos = text.size();
      } else {
        value = std::string(text.substr(pos + 1, close - pos - 1));
        pos = close + 1;
      }
    } else {
      const auto comma = text.find(',', pos);
      const auto end = comma == std::string_view::npos ? text.size() : comma;
      value = util::Trim(text.substr(pos, end - pos));
      pos = end;
    }
    params.emplace(key, std::move(value));
  }
  return params;
}

std::optional<ChallengeDetails> FromAuthenticateHeader(const std::string& header,
                                                       const HeaderMap& headers,
                                                       const RequestContext& context,
                                                       const std::string& fallback_id) {
  const std::string trimmed = util::Trim(header);
  const auto space = trimmed.find_first_of(" \t");
  if (space == std::string::npos) {
    return std::nullopt;
  }
  const std::string scheme = util::ToLower(trimmed.substr(0, space));
  if (scheme != "x402" && scheme != "x-402") {
    return std::nullopt;
  }
  const Params params = ParseAuthParams(std::string_view(trimmed).substr(space + 1));

  if (auto nested = FirstOf(params, "challenge", "payload"); nested && !nested->empty()) {
    if (auto challenge = FromChallengeValue(*nested, headers, context, fallback_id)) {
      return challenge;
    }
  }

  auto seller = FirstOf(params, "seller", "to");
  auto token_address = FirstOf(params, "tokenAddress", "token_address", "contract");
  auto atomic_text = FirstOf(params, "amountAtomic", "amount_atomic", "amount");
  if (!seller || !token_address || !atomic_text) {
    return std::nullopt;
  }
  auto atomic = AtomicFromText(*atomic_text);
  if (!atomic) {
    return std::nullopt;
  }

  ChallengeDetails challenge = Base(headers, context, fallback_id);
  challenge.seller = *seller;
  challenge.token_address = *token_address;
  challenge.amount_atomic = *atomic;
  challenge.token_symbol = Upper(FirstOf(params, "token", "tokenSymbol", "token_symbol").value_or("USDC"));
  challenge.chain_id = kDefaultChainId;
  if (auto chain = FirstOf(params, "chainId", "chain_id", "chain")) {
    challenge.chain_id = ChainIdFromText(*chain).value_or(kDefaultChainId);
  }
  if (auto id = FirstOf(params, "id"); id && !id->empty()) {
    challenge.challenge_id = *id;
  }
  std::optional<double> amount_usd;
  if (auto usd = FirstOf(params, "amountUsd", "amount_usd", "price", "cost")) {
    amount_usd = ParseNumber(*usd);
  }
  challenge.raw_challenge = nlohmann::json(params);
  return Finish(std::move(challenge), amount_usd, "www-authenticate");
}

std::optional<ChallengeDetails> FromLegacyHeaders(const HeaderMap& headers,
                                                  const RequestContext& context,
                                                  const std::string& fallback_id) {
  auto seller = FirstOf(headers, "x-402-address", "x-payment-seller");
  auto token_address = FirstOf(headers, "x-402-token-address", "x-payment-token-address");
  auto atomic_text = FirstOf(headers, "x-402-amount-atomic", "x-payment-amount");
  if (!seller || !token_address || !atomic_text) {
    return std::nullopt;
  }
  auto atomic = AtomicFromText(*atomic_text);
  if (!atomic) {
    return std::nullopt;
  }
  ChallengeDetails challenge = Base(headers, context, fallback_id);
  challenge.seller = *seller;
  challenge.token_address = *token_address;
  challenge.amount_atomic = *atomic;
  if (auto token = FirstOf(headers, "x-402-token", "x-payment-token")) {
    challenge.token_symbol = Upper(*token);
  }
  challenge.chain_id = kDefaultChainId;
  if (auto chain = FirstOf(headers, "x-402-chain", "x-payment-chain")) {
    challenge.chain_id = ChainIdFromText(*chain).value_or(kDefaultChainId);
  }
  std::optional<double> amount_usd;
  if (auto usd = FirstOf(headers, "x-402-amount", "x-payment-amount-usd")) {
    amount_usd = ParseNumber(*usd);
  }
  return Finish(std::move(challenge), amount_usd, "legacy header");
}

std::string FallbackId(const HeaderMap& headers) {
  auto id = FindHeader(headers, kIdHeader);
  if (id) {
    const std::string trimmed = util::Trim(*id);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  return util::RandomUuid();
}

}  // namespace

std::optional<ChallengeDetails> ParseChallengeHeaders(const HeaderMap& raw_headers,
                                                      const RequestContext& context) {
  const HeaderMap headers = NormalizeHeaders(raw_headers);
  const std::string fallback_id = FallbackId(headers);

  if (auto value = FindHeader(headers, kChallengeHeader)) {
    if (auto challenge = FromChallengeValue(*value, headers, context, fallback_id)) {
      return challenge;
    }
  }
  if (auto value = FindHeader(headers, "www-authenticate")) {
    if (auto challenge = FromAuthenticateHeader(*value, headers, context, fallback_id)) {
      return challenge;
    }
  }
  return FromLegacyHeaders(headers, context, fallback_id);
}

std::optional<ChallengeDetails> ParseChallengeBody(const HeaderMap& raw_headers,
                                                   const std::string& body,
                                                   const RequestContext& context) {
  const HeaderMap headers = NormalizeHeaders(raw_headers);
  const auto content_type = FindHeader(headers, "content-type").value_or("");
  if (util::ToLower(content_type).find("application/json") == std::string::npos) {
    return std::nullopt;
  }
  auto record = nlohmann::json::parse(body, nullptr, false);
  if (record.is_discarded() || !record.is_object()) {
    util::LogDebug("x402: 402 body is not a JSON object");
    return std::nullopt;
  }
  const auto* accepts = JsonField(record, "accepts");
  if (!accepts || !accepts->is_array()) {
    return std::nullopt;
  }
  const nlohmann::json* exact = nullptr;
  for (const auto& entry : *accepts) {
    if (entry.is_object() && JsonString(entry, "scheme").value_or("") == "exact") {
      exact = &entry;
      break;
    }
  }
  if (!exact) {
    util::LogDebug("x402: accepts array has no exact scheme");
    return std::nullopt;
  }

  const nlohmann::json* amount = JsonField(*exact, "maxAmountRequired");
  if (!amount) {
    amount = JsonField(*exact, "amount");
  }
  auto atomic = amount ? AtomicFromJson(*amount) : std::nullopt;
  if (!atomic) {
    return std::nullopt;
  }

  const nlohmann::json empty = nlohmann::json::object();
  const auto* extra_field = JsonField(*exact, "extra");
  const nlohmann::json& extra = (extra_field && extra_field->is_object()) ? *extra_field : empty;

  ChallengeDetails challenge = Base(headers, context, FallbackId(headers));
  challenge.amount_atomic = *atomic;
  challenge.token_address = JsonString(*exact, "asset").value_or("");
  challenge.seller =
      JsonString(*exact, "payTo").value_or(JsonString(extra, "recipientAddress").value_or(""));

  int decimals = kDefaultDecimals;
  if (const auto* value = JsonField(extra, "decimals")) {
    auto number = JsonNumber(*value);
    auto parsed = number ? DecimalsFromNumber(*number) : std::nullopt;
    if (!parsed) {
      util::LogDebug("x402: body challenge rejected: invalid decimals");
      return std::nullopt;
    }
    decimals = *parsed;
  }
  challenge.token_decimals = decimals;
  challenge.token_name = JsonString(extra, "name");
  challenge.token_version = JsonString(extra, "version");
  if (auto symbol = JsonString(extra, "symbol"); symbol && !symbol->empty()) {
    challenge.token_symbol = Upper(*symbol);
  }

  challenge.network = JsonString(*exact, "network");
  challenge.chain_id =
      ChainIdFromText(challenge.network.value_or("eip155:137")).value_or(kDefaultChainId);
  challenge.protocol_version = JsonProtocolVersion(record);
  if (!challenge.protocol_version) {
    challenge.protocol_version = JsonProtocolVersion(*exact);
  }
  if (auto id = JsonString(record, "id"); id && !id->empty()) {
    challenge.challenge_id = *id;
  }

  std::optional<double> amount_usd;
  const std::array<const nlohmann::json*, 3> usd_sources{&record, exact, &extra};
  for (const nlohmann::json* source : usd_sources) {
    if (const auto* usd = JsonField(*source, "amountUsd")) {
      amount_usd = JsonNumber(*usd);
      break;
    }
  }
  challenge.raw_challenge = std::move(record);
  return Finish(std::move(challenge), amount_usd, "body");
}

std::optional<ChallengeDetails> ParseChallenge(const HeaderMap& headers,
                                               const std::optional<std::string>& body,
                                               const RequestContext& context) {
  if (auto challenge = ParseChallengeHeaders(headers, context)) {
    return challenge;
  }
  if (body) {
    return ParseChallengeBody(headers, *body, context);
  }
  return std::nullopt;
}

bool IsUpstreamError(const ChallengeDetails& challenge) {
  if (!challenge.raw_challenge || !challenge.raw_challenge->is_object()) {
    return false;
  }
  const auto& raw = *challenge.raw_challenge;
  if (!JsonString(raw, "error")) {
    return false;
  }
  const auto* accepts = JsonField(raw, "accepts");
  return !(accepts && accepts->is_array() && !accepts->empty());
}

}  // namespace autopay::x402
