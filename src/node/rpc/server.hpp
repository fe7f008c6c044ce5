#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "agent/commands.hpp"
#include "agent/message_bridge.hpp"

namespace autopay::rpc {

// JSON-RPC 2.0 method table over the agent. Method names are lower case;
// params are always a named object. Every call becomes one agent command
// sent through the message bridge, so requests never touch agent state
// concurrently.
class RpcServer {
 public:
  using ShutdownHook = std::function<void()>;

  explicit RpcServer(agent::MessageBridge& bridge, ShutdownHook shutdown = {});

  nlohmann::json Handle(const nlohmann::json& request);

 private:
  nlohmann::json Dispatch(agent::Command command);

  nlohmann::json HandleSubmitChallenge(const nlohmann::json& params);
  nlohmann::json HandleGetPendingChallenge(const nlohmann::json& params);
  nlohmann::json HandleResolvePendingChallenge(const nlohmann::json& params);
  nlohmann::json HandlePollResolution(const nlohmann::json& params);
  nlohmann::json HandleConfigureWallet(const nlohmann::json& params);
  nlohmann::json HandleUnlockWallet(const nlohmann::json& params);
  nlohmann::json HandleExportWallet(const nlohmann::json& params);
  nlohmann::json HandleUpdateSettings(const nlohmann::json& params);
  nlohmann::json HandleUpdatePolicy(const nlohmann::json& params);
  nlohmann::json HandleRemovePolicy(const nlohmann::json& params);
  nlohmann::json HandleReportSettlement(const nlohmann::json& params);
  nlohmann::json HandleGetShortLivedToken(const nlohmann::json& params);
  nlohmann::json HandleRefreshBalance(const nlohmann::json& params);
  nlohmann::json HandleStop();

  agent::MessageBridge& bridge_;
  ShutdownHook shutdown_;
};

}  // namespace autopay::rpc
