#include "rpc/server.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "agent/reply_json.hpp"
#include "policy/settings.hpp"
#include "policy/site_policy.hpp"
#include "util/logging.hpp"
#include "x402/challenge.hpp"
#include "x402/network.hpp"
#include "x402/settlement.hpp"

namespace autopay::rpc {

namespace {

constexpr int kInvalidParams = -32602;
constexpr int kAgentUnavailable = -32002;

struct RpcError : public std::runtime_error {
  int code;
  RpcError(int c, const std::string& msg) : std::runtime_error(msg), code(c) {}
};

[[noreturn]] void ThrowRpcError(int code, const std::string& msg) { throw RpcError(code, msg); }

std::string RequireString(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    ThrowRpcError(kInvalidParams, std::string(key) + " parameter required");
  }
  return it->get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    ThrowRpcError(kInvalidParams, std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<int> OptionalInt(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    ThrowRpcError(kInvalidParams, std::string(key) + " must be an integer");
  }
  return it->get<int>();
}

bool OptionalBool(const nlohmann::json& params, const char* key, bool fallback) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    ThrowRpcError(kInvalidParams, std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

}  // namespace

RpcServer::RpcServer(agent::MessageBridge& bridge, ShutdownHook shutdown)
    : bridge_(bridge), shutdown_(std::move(shutdown)) {}

nlohmann::json RpcServer::Handle(const nlohmann::json& request) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = request.is_object() && request.contains("id") ? request.at("id")
                                                                 : nlohmann::json(nullptr);
  try {
    if (!request.is_object()) {
      ThrowRpcError(-32600, "invalid request");
    }
    const auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
      ThrowRpcError(-32600, "invalid request");
    }
    const auto method = method_it->get<std::string>();
    const nlohmann::json params =
        request.contains("params") ? request.at("params") : nlohmann::json::object();
    if (!params.is_object()) {
      ThrowRpcError(kInvalidParams, "params must be an object");
    }
    util::LogDebug("RPC " + method);

    if (method == "submitchallenge") {
      response["result"] = HandleSubmitChallenge(params);
    } else if (method == "getpendingchallenge") {
      response["result"] = HandleGetPendingChallenge(params);
    } else if (method == "resolvependingchallenge") {
      response["result"] = HandleResolvePendingChallenge(params);
    } else if (method == "pollresolution") {
      response["result"] = HandlePollResolution(params);
    } else if (method == "getstate") {
      response["result"] = Dispatch(agent::GetState{});
    } else if (method == "configurewallet") {
      response["result"] = HandleConfigureWallet(params);
    } else if (method == "unlockwallet") {
      response["result"] = HandleUnlockWallet(params);
    } else if (method == "lockwallet") {
      response["result"] = Dispatch(agent::LockWallet{});
    } else if (method == "exportwallet") {
      response["result"] = HandleExportWallet(params);
    } else if (method == "removewallet") {
      response["result"] = Dispatch(agent::RemoveWallet{});
    } else if (method == "updatesettings") {
      response["result"] = HandleUpdateSettings(params);
    } else if (method == "updatepolicy") {
      response["result"] = HandleUpdatePolicy(params);
    } else if (method == "removepolicy") {
      response["result"] = HandleRemovePolicy(params);
    } else if (method == "resetpolicies") {
      response["result"] = Dispatch(agent::ResetPolicies{});
    } else if (method == "clearhistory") {
      response["result"] = Dispatch(agent::ClearHistory{});
    } else if (method == "reportsettlement") {
      response["result"] = HandleReportSettlement(params);
    } else if (method == "getshortlivedtoken") {
      response["result"] = HandleGetShortLivedToken(params);
    } else if (method == "refreshbalance") {
      response["result"] = HandleRefreshBalance(params);
    } else if (method == "refreshallbalances") {
      response["result"] = Dispatch(agent::RefreshAllBalances{});
    } else if (method == "stop") {
      response["result"] = HandleStop();
    } else {
      response["error"] = {{"code", -32601}, {"message", "unknown method"}};
    }
  } catch (const RpcError& ex) {
    response["error"] = {{"code", ex.code}, {"message", ex.what()}};
  } catch (const nlohmann::json::exception&) {
    response["error"] = {{"code", kInvalidParams}, {"message", "invalid params"}};
  } catch (const std::exception& ex) {
    response["error"] = {{"code", -32603}, {"message", ex.what()}};
  }
  return response;
}

nlohmann::json RpcServer::Dispatch(agent::Command command) {
  std::string error;
  auto reply = bridge_.Send(std::move(command), &error);
  if (!reply) {
    ThrowRpcError(kAgentUnavailable, error);
  }
  return agent::ReplyToJson(*reply);
}

nlohmann::json RpcServer::HandleSubmitChallenge(const nlohmann::json& params) {
  auto it = params.find("challenge");
  if (it == params.end()) {
    ThrowRpcError(kInvalidParams, "challenge parameter required");
  }
  agent::SubmitChallenge command;
  std::string error;
  if (!x402::ChallengeFromJson(*it, &command.challenge, &error)) {
    ThrowRpcError(kInvalidParams, "invalid challenge: " + error);
  }
  command.tab_id = OptionalInt(params, "tab_id");
  return Dispatch(std::move(command));
}

nlohmann::json RpcServer::HandleGetPendingChallenge(const nlohmann::json& params) {
  return Dispatch(agent::GetPendingChallenge{RequireString(params, "id")});
}

nlohmann::json RpcServer::HandleResolvePendingChallenge(const nlohmann::json& params) {
  auto approve = params.find("approve");
  if (approve == params.end() || !approve->is_boolean()) {
    ThrowRpcError(kInvalidParams, "approve parameter required");
  }
  return Dispatch(agent::ResolvePendingChallenge{RequireString(params, "id"),
                                                 approve->get<bool>(),
                                                 OptionalBool(params, "always_allow", false)});
}

nlohmann::json RpcServer::HandlePollResolution(const nlohmann::json& params) {
  return Dispatch(agent::PollResolution{RequireString(params, "id")});
}

nlohmann::json RpcServer::HandleConfigureWallet(const nlohmann::json& params) {
  return Dispatch(agent::ConfigureWallet{RequireString(params, "secret"),
                                         RequireString(params, "passphrase"),
                                         OptionalInt(params, "lock_minutes"),
                                         OptionalString(params, "label")});
}

nlohmann::json RpcServer::HandleUnlockWallet(const nlohmann::json& params) {
  return Dispatch(agent::UnlockWallet{RequireString(params, "passphrase"),
                                      OptionalInt(params, "lock_minutes")});
}

nlohmann::json RpcServer::HandleExportWallet(const nlohmann::json& params) {
  return Dispatch(agent::ExportWallet{RequireString(params, "passphrase")});
}

nlohmann::json RpcServer::HandleUpdateSettings(const nlohmann::json& params) {
  agent::UpdateSettings command;
  std::string error;
  if (!policy::SettingsPatchFromJson(params, &command.patch, &error)) {
    ThrowRpcError(kInvalidParams, error);
  }
  return Dispatch(std::move(command));
}

nlohmann::json RpcServer::HandleUpdatePolicy(const nlohmann::json& params) {
  agent::UpdatePolicy command;
  command.origin = RequireString(params, "origin");
  std::string error;
  if (!policy::SitePolicyPatchFromJson(params, &command.patch, &error)) {
    ThrowRpcError(kInvalidParams, error);
  }
  return Dispatch(std::move(command));
}

nlohmann::json RpcServer::HandleRemovePolicy(const nlohmann::json& params) {
  return Dispatch(agent::RemovePolicy{RequireString(params, "origin")});
}

nlohmann::json RpcServer::HandleReportSettlement(const nlohmann::json& params) {
  agent::ReportSettlement command;
  if (!x402::SettlementNoticeFromJson(params, &command.notice)) {
    ThrowRpcError(kInvalidParams, "invalid settlement notice");
  }
  return Dispatch(std::move(command));
}

nlohmann::json RpcServer::HandleGetShortLivedToken(const nlohmann::json& params) {
  return Dispatch(agent::GetShortLivedToken{RequireString(params, "payment_id")});
}

nlohmann::json RpcServer::HandleRefreshBalance(const nlohmann::json& params) {
  agent::RefreshBalance command;
  if (auto key = OptionalString(params, "chain")) {
    command.chain = x402::ChainFromKey(*key);
    if (!command.chain) {
      ThrowRpcError(kInvalidParams, "unknown chain " + *key);
    }
  }
  command.force = OptionalBool(params, "force", false);
  return Dispatch(std::move(command));
}

nlohmann::json RpcServer::HandleStop() {
  if (!shutdown_) {
    ThrowRpcError(-32601, "stop not supported");
  }
  util::LogInfo("shutdown requested over RPC");
  shutdown_();
  return "autopayd stopping";
}

}  // namespace autopay::rpc
