#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "x402/interceptor.hpp"

namespace autopay::rpc {

struct ClientOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{0};
  std::string rpc_user;
  std::string rpc_password;
  int timeout_ms{15000};
};

// One-shot JSON-RPC over HTTP/1.1, one connection per call.
class RpcClient {
 public:
  explicit RpcClient(ClientOptions options);

  // Full response object ({result} or {error}). Throws std::runtime_error on
  // transport failure or a body that is not JSON.
  nlohmann::json CallRaw(const std::string& method,
                         const nlohmann::json& params = nlohmann::json::object());

  // The "result" member. Throws std::runtime_error carrying the RPC error
  // message when the server reported one.
  nlohmann::json Call(const std::string& method,
                      const nlohmann::json& params = nlohmann::json::object());

 private:
  std::string BuildHttpRequest(const std::string& body) const;

  ClientOptions options_;
  std::uint64_t next_id_{0};
};

// ChallengeSink that talks to a running autopayd.
class RpcChallengeSink final : public x402::ChallengeSink {
 public:
  explicit RpcChallengeSink(RpcClient& client) : client_(client) {}

  std::optional<x402::ChallengeResolution> Submit(const x402::ChallengeDetails& challenge,
                                                  std::optional<int> tab_id) override;
  std::optional<x402::ChallengeResolution> PollResolution(
      const std::string& challenge_id) override;
  bool ReportSettlement(const x402::SettlementNotice& notice) override;

 private:
  RpcClient& client_;
};

}  // namespace autopay::rpc
