#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "agent/collaborators.hpp"
#include "agent/message_bridge.hpp"
#include "agent/orchestrator.hpp"
#include "rpc/client.hpp"
#include "rpc/http_server.hpp"
#include "rpc/server.hpp"
#include "store/state_store.hpp"
#include "tests/unit/util/fast_kdf.hpp"
#include "tests/unit/util/manual_clock.hpp"
#include "util/base64.hpp"
#include "x402/interceptor.hpp"

using namespace autopay;
using namespace std::chrono_literals;

namespace {

constexpr const char* kSecret = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
constexpr const char* kAddress = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";
constexpr const char* kSeller = "0x1111111111111111111111111111111111111111";
constexpr const char* kUsdcAmoy = "0x41E94Eb019C0762f9Bfcf9Fb1E58725BfB0e7582";

class SilentPresenter final : public agent::PromptPresenter {
 public:
  std::optional<int> Show(const std::string&) override { return std::nullopt; }
  void Close(int) override {}
};

int ErrorCode(const nlohmann::json& response) {
  if (!response.contains("error") || !response["error"].is_object()) {
    return 0;
  }
  return response["error"].value("code", 0);
}

nlohmann::json Request(const std::string& method, nlohmann::json params = nlohmann::json::object()) {
  return {{"jsonrpc", "2.0"}, {"id", 7}, {"method", method}, {"params", std::move(params)}};
}

}  // namespace

int main() {
  try {
    test::ManualClock clock(test::kTestEpochMs);
    store::MemoryStateStore store;
    std::string error;
    if (!store.Open(&error)) {
      std::cerr << "Failed to open state: " << error << "\n";
      return EXIT_FAILURE;
    }
    SilentPresenter presenter;
    agent::Orchestrator orchestrator(clock, store, test::FastKdfParams(), presenter);
    agent::MessageBridge bridge(orchestrator);
    bridge.Start();

    std::atomic<bool> stop_requested{false};
    rpc::RpcServer server(bridge, [&]() { stop_requested.store(true); });

    // Dispatcher errors, without HTTP in the way.
    {
      auto response = server.Handle(Request("nosuchmethod"));
      if (ErrorCode(response) != -32601 || response["id"] != 7) {
        std::cerr << "Unknown method not rejected: " << response.dump() << "\n";
        return EXIT_FAILURE;
      }
      response = server.Handle(nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}});
      if (ErrorCode(response) != -32600) {
        std::cerr << "Request without method not rejected\n";
        return EXIT_FAILURE;
      }
      response = server.Handle(Request("configurewallet", {{"secret", kSecret}}));
      if (ErrorCode(response) != -32602) {
        std::cerr << "Missing passphrase not reported as invalid params\n";
        return EXIT_FAILURE;
      }
      response = server.Handle(Request("refreshbalance", {{"chain", "mainnet"}}));
      if (ErrorCode(response) != -32602) {
        std::cerr << "Unknown chain not reported as invalid params\n";
        return EXIT_FAILURE;
      }
      response = server.Handle(Request("submitchallenge", {{"challenge", {{"seller", "nope"}}}}));
      if (ErrorCode(response) != -32602) {
        std::cerr << "Malformed challenge not reported as invalid params\n";
        return EXIT_FAILURE;
      }
    }

    rpc::HttpServer::Options http_opts;
    http_opts.port = 0;
    http_opts.rpc_user = "user";
    http_opts.rpc_password = "pass";
    http_opts.socket_timeout_ms = 2000;
    rpc::HttpServer http(http_opts,
                         [&server](const nlohmann::json& request) { return server.Handle(request); });
    http.Start();

    rpc::ClientOptions client_opts;
    client_opts.port = http.bound_port();
    client_opts.rpc_user = "user";
    client_opts.rpc_password = "wrong";
    {
      rpc::RpcClient bad_client(client_opts);
      const auto response = bad_client.CallRaw("getstate");
      if (ErrorCode(response) != -32651) {
        std::cerr << "Wrong RPC password accepted: " << response.dump() << "\n";
        return EXIT_FAILURE;
      }
    }
    client_opts.rpc_password = "pass";
    rpc::RpcClient client(client_opts);

    const auto wallet = client.Call("configurewallet", {{"secret", kSecret},
                                                        {"passphrase", "pw1234567"},
                                                        {"lock_minutes", 15},
                                                        {"label", "rpc test"}});
    if (!wallet.contains("wallet") || wallet["wallet"].value("address", "") != kAddress ||
        !wallet["wallet"].value("unlocked", false)) {
      std::cerr << "configurewallet returned " << wallet.dump() << "\n";
      return EXIT_FAILURE;
    }

    // A 402 captured by a client process, resolved through the daemon.
    {
      rpc::RpcChallengeSink sink(client);
      x402::InterceptorOptions options;
      options.poll_interval = 5ms;
      options.pending_timeout = 2000ms;
      x402::Interceptor interceptor(sink, options);

      x402::ObservedResponse challenge;
      challenge.status = 402;
      challenge.headers["X-Payment-Challenge"] = util::Base64Encode(nlohmann::json{
          {"id", "rpc-1"},
          {"amount", "10000"},
          {"amountUsd", 0.01},
          {"chainId", 80002},
          {"seller", kSeller},
          {"tokenAddress", kUsdcAmoy},
      }.dump());

      bool saw_payment_header = false;
      auto retry = [&](const x402::HeaderMap& headers) -> std::optional<x402::ObservedResponse> {
        saw_payment_header = headers.count("X-PAYMENT") == 1 && headers.count("X-PAYMENT-ID") == 1;
        x402::ObservedResponse ok;
        ok.status = 200;
        ok.headers["X-PAYMENT-RESPONSE"] =
            util::Base64Encode(nlohmann::json{{"transaction", "0xabc123"}}.dump());
        return ok;
      };
      const auto result = interceptor.Handle({"https://shop.example", "/item", "GET"}, challenge,
                                             retry);
      if (result.outcome != x402::InterceptOutcome::kRetried || !saw_payment_header) {
        std::cerr << "Challenge was not paid through the RPC sink\n";
        return EXIT_FAILURE;
      }
    }

    const auto state = client.Call("getstate");
    const std::string dumped = state.dump();
    if (dumped.find("4c0883a69102937d") != std::string::npos) {
      std::cerr << "getstate leaked the private key\n";
      return EXIT_FAILURE;
    }
    bool settled = false;
    for (const auto& record : state.at("history")) {
      if (record.value("status", "") == "success" &&
          record.value("tx_reference", "") == "0xabc123") {
        settled = true;
      }
    }
    if (!settled || state.value("status", "") != "verified") {
      std::cerr << "Settlement not recorded: " << dumped << "\n";
      return EXIT_FAILURE;
    }

    const auto settings = client.Call("updatesettings", {{"threshold_usd", 0.5}});
    if (settings.at("settings").value("threshold_usd", 0.0) != 0.5) {
      std::cerr << "updatesettings did not apply\n";
      return EXIT_FAILURE;
    }

    const auto locked = client.Call("lockwallet");
    if (locked.at("wallet").value("unlocked", true)) {
      std::cerr << "lockwallet left the wallet unlocked\n";
      return EXIT_FAILURE;
    }
    const auto bad_unlock = client.Call("unlockwallet", {{"passphrase", "not-the-one"}});
    if (bad_unlock.value("kind", "") != "incorrect_passphrase") {
      std::cerr << "Wrong passphrase not reported: " << bad_unlock.dump() << "\n";
      return EXIT_FAILURE;
    }

    const auto stopped = client.Call("stop");
    if (!stop_requested.load() || !stopped.is_string()) {
      std::cerr << "stop did not reach the shutdown hook\n";
      return EXIT_FAILURE;
    }

    bridge.Disconnect();
    const auto orphaned = client.CallRaw("getstate");
    if (ErrorCode(orphaned) != -32002) {
      std::cerr << "Disconnected agent not reported: " << orphaned.dump() << "\n";
      return EXIT_FAILURE;
    }
    http.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "rpc_server_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
