#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace autopay::x402 {

// Response headers keyed by lower-case name.
using HeaderMap = std::map<std::string, std::string>;

HeaderMap NormalizeHeaders(const HeaderMap& headers);

struct RequestContext {
  std::string origin;    // scheme://host[:port]
  std::string endpoint;  // path
  std::string method;
};

// Canonical payment challenge. Built once by the parser and passed by const
// reference afterwards.
struct ChallengeDetails {
  std::string challenge_id;
  std::string origin;
  std::string endpoint;
  std::string method;
  double amount_usd{0.0};  // advisory; never signed
  std::string token_symbol{"USDC"};
  std::uint64_t chain_id{0};
  std::optional<std::string> network;
  std::string token_address;  // EIP-55
  std::string seller;         // EIP-55
  std::string amount_atomic;  // base-10 integer
  std::optional<std::string> token_name;
  std::optional<std::string> token_version;
  std::optional<int> token_decimals;
  std::optional<int> protocol_version;
  HeaderMap raw_headers;
  std::optional<nlohmann::json> raw_challenge;
};

nlohmann::json ChallengeToJson(const ChallengeDetails& challenge);

// Rebuilds a challenge that crossed a process or message boundary and
// re-checks every structural invariant (addresses, atomic amount, chain id).
bool ChallengeFromJson(const nlohmann::json& value, ChallengeDetails* out,
                       std::string* error = nullptr);

// Normalizes addresses to checksum form and the atomic amount to canonical
// decimal. False when any of them is unusable.
bool ValidateChallenge(ChallengeDetails* challenge, std::string* error = nullptr);

}  // namespace autopay::x402
