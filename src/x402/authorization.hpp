#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "util/clock.hpp"
#include "wallet/wallet_manager.hpp"
#include "x402/challenge.hpp"
#include "x402/network.hpp"

namespace autopay::x402 {

constexpr std::int64_t kValidAfterSkewSeconds = 5;
constexpr std::int64_t kValidForSeconds = 120;

enum class BuildError {
  kNone = 0,
  kWalletLocked,
  kSigningFailure,
};

struct NetworkSelection {
  std::string descriptor;
  int protocol_version{1};
};

// Descriptor precedence: challenge "network", the raw document's first
// "exact" accepts entry, the raw document's "network", "eip155:<chain_id>",
// then the configured chain's name. A 1 or 2 version hint wins; otherwise
// CAIP-2 style descriptors ("ns:id") imply version 2.
NetworkSelection ResolveNetwork(const ChallengeDetails& challenge, Chain configured_chain);

struct PaymentAuthorization {
  std::string payment_id;
  std::string header_value;  // base64 JSON for X-PAYMENT
  NetworkSelection network;
  nlohmann::json authorization;
  std::string signature;
};

// Signs an EIP-3009 TransferWithAuthorization for the challenge and wraps it
// in the X-PAYMENT envelope. The session must be live; the manager hands out
// null once it expires.
class AuthorizationBuilder {
 public:
  explicit AuthorizationBuilder(const util::Clock& clock);

  BuildError Build(const wallet::UnlockSession* session, Chain configured_chain,
                   const ChallengeDetails& challenge, PaymentAuthorization* out,
                   std::string* error = nullptr) const;

 private:
  const util::Clock& clock_;
};

}  // namespace autopay::x402
