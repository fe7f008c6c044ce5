#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "agent/collaborators.hpp"
#include "agent/message_bridge.hpp"
#include "agent/orchestrator.hpp"
#include "config/daemon_options.hpp"
#include "config/rpc_cookie.hpp"
#include "rpc/http_server.hpp"
#include "rpc/server.hpp"
#include "store/state_store.hpp"
#include "util/clock.hpp"
#include "util/logging.hpp"

namespace {

using autopay::config::DaemonOptions;

std::atomic<bool> g_shutdown_requested{false};

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

void ConfigureLogging(const DaemonOptions& opts) {
  auto& logger = autopay::util::GlobalLogger();
  logger.SetStderrEcho(true);
  if (opts.debug_log_path.empty()) {
    return;
  }
  std::uintmax_t max_bytes = 0;
  if (opts.log_max_size_mb > 0) {
    max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
  }
  logger.Configure(autopay::util::ParseLogLevelString(opts.log_level), max_bytes,
                   opts.log_max_files);
  logger.Enable(opts.debug_log_path);
}

// Falls back to a generated cookie when no password is configured; explicit
// credentials are mirrored into the cookie so local tooling can find them.
bool PrepareRpcCredentials(DaemonOptions* opts) {
  if (!opts->rpc_require_auth) {
    autopay::util::LogWarn("RPC authentication disabled");
    return true;
  }
  const bool has_user = !opts->rpc_user.empty();
  const bool has_pass = !opts->rpc_password.empty();
  if (has_pass && !has_user) {
    std::cerr << "[autopayd] fatal: rpcpassword requires rpcuser\n";
    return false;
  }
  autopay::config::RpcCredentials credentials{opts->rpc_user, opts->rpc_password};
  if (!has_pass) {
    credentials.user = autopay::config::kCookieUser;
    credentials.password = autopay::config::GenerateCookiePassword();
  }
  const auto cookie_path = autopay::config::CookiePath(*opts);
  std::string error;
  if (!autopay::config::WriteRpcCookie(cookie_path, credentials, &error)) {
    if (!has_pass) {
      std::cerr << "[autopayd] fatal: unable to write RPC cookie: " << error << "\n";
      return false;
    }
    std::cerr << "[autopayd] warn: unable to write RPC cookie: " << error << "\n";
  } else {
    autopay::util::LogInfo("RPC auth cookie written to " + cookie_path.string());
  }
  opts->rpc_user = credentials.user;
  opts->rpc_password = credentials.password;
  return true;
}

int Run(DaemonOptions opts) {
  ConfigureLogging(opts);
  InstallSignalHandlers();
  if (!PrepareRpcCredentials(&opts)) {
    return EXIT_FAILURE;
  }

  const auto state_path = autopay::config::StatePath(opts);
  autopay::util::LogInfo("autopayd starting, state=" + state_path.string() + ", rpc=" +
                         opts.rpc_bind + ":" + std::to_string(opts.rpc_port));

  autopay::store::FileStateStore store(state_path);
  std::string error;
  if (!store.Open(&error)) {
    std::cerr << "[autopayd] fatal: unable to open state " << state_path.string() << ": " << error
              << "\n";
    return EXIT_FAILURE;
  }

  autopay::agent::LoggingPromptPresenter presenter(opts.prompt_url);
  autopay::agent::Orchestrator orchestrator(autopay::util::DefaultClock(), store, opts.argon2,
                                            presenter);
  autopay::agent::MessageBridge bridge(orchestrator);
  bridge.Start();

  autopay::rpc::RpcServer rpc_server(bridge, []() { g_shutdown_requested.store(true); });

  autopay::rpc::HttpServer::Options http_opts;
  http_opts.bind_address = opts.rpc_bind;
  http_opts.port = opts.rpc_port;
  http_opts.rpc_user = opts.rpc_user;
  http_opts.rpc_password = opts.rpc_password;
  http_opts.require_auth = opts.rpc_require_auth;
  http_opts.allowed_hosts = opts.rpc_allow;
  autopay::rpc::HttpServer http_server(
      http_opts, [&rpc_server](const nlohmann::json& request) { return rpc_server.Handle(request); });
  http_server.Start();
  std::cout << "[autopayd] listening on " << opts.rpc_bind << ":" << http_server.bound_port()
            << "\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  autopay::util::LogInfo("Shutdown requested");
  http_server.Stop();
  bridge.Disconnect();
  autopay::util::LogInfo("autopayd stopped");
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto opts = autopay::config::ParseDaemonOptions(args);
    if (opts.show_help) {
      std::cout << autopay::config::DaemonUsage();
      return EXIT_SUCCESS;
    }
    return Run(std::move(opts));
  } catch (const std::exception& ex) {
    std::cerr << "[autopayd] fatal: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
