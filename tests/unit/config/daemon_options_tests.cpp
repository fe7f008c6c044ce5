#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config/daemon_options.hpp"
#include "config/rpc_cookie.hpp"

using namespace autopay;

namespace {

config::EnvLookup FakeEnvironment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    auto it = values.find(std::string(name));
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

bool Throws(const std::vector<std::string>& args, const config::EnvLookup& env,
            std::string* message = nullptr) {
  try {
    config::ParseDaemonOptions(args, env);
  } catch (const std::runtime_error& ex) {
    if (message) {
      *message = ex.what();
    }
    return true;
  }
  return false;
}

}  // namespace

int main() {
  try {
    std::error_code ec;
    const auto dir = std::filesystem::temp_directory_path() / "autopay-options-test";
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    const auto no_env = FakeEnvironment({});

    {
      const auto opts = config::ParseDaemonOptions({"--no-conf"}, no_env);
      if (opts.rpc_port != config::kDefaultRpcPort || opts.rpc_bind != "127.0.0.1" ||
          !opts.rpc_require_auth || opts.log_level != "info") {
        std::cerr << "Unexpected defaults\n";
        return EXIT_FAILURE;
      }
      if (config::StatePath(opts) != std::filesystem::path("data") / "autopay-state.json" ||
          config::CookiePath(opts) != std::filesystem::path("data") / "rpc.cookie") {
        std::cerr << "Unexpected default paths\n";
        return EXIT_FAILURE;
      }
    }

    const auto conf = dir / "autopay.conf";
    {
      std::ofstream out(conf);
      out << "# autopay daemon\n"
          << "datadir = " << (dir / "from-conf").string() << "\n"
          << "rpc-port=19000\n"
          << "rpcuser=conf-user\n"
          << "loglevel=debug   # trailing comment\n"
          << "argon2_t_cost=4\n"
          << "somethingelse=1\n";
    }

    // Precedence: file < environment < flags.
    {
      const auto env = FakeEnvironment({{"AUTOPAY_RPC_USER", "env-user"},
                                        {"AUTOPAY_LOG_LEVEL", "warn"}});
      const auto opts = config::ParseDaemonOptions(
          {"--conf", conf.string(), "--rpc-port=19001", "--prompt-url", "http://127.0.0.1/p"},
          env);
      if (opts.data_dir != (dir / "from-conf").string() || opts.rpc_port != 19001 ||
          opts.rpc_user != "env-user" || opts.log_level != "warn" || opts.argon2.t_cost != 4 ||
          opts.prompt_url != "http://127.0.0.1/p") {
        std::cerr << "Option precedence broken\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto bad_conf = dir / "bad.conf";
      {
        std::ofstream out(bad_conf);
        out << "rpcport=19000\n"
            << "rpcport=seventy\n";
      }
      std::string message;
      if (!Throws({"--conf", bad_conf.string()}, no_env, &message) ||
          message.find("bad.conf:2:") == std::string::npos) {
        std::cerr << "Config error lacks file:line prefix: " << message << "\n";
        return EXIT_FAILURE;
      }
    }

    if (!Throws({"--no-conf", "--rpc-port", "70000"}, no_env) ||
        !Throws({"--no-conf", "--frobnicate", "1"}, no_env) ||
        !Throws({"--no-conf", "--log-level", "chatty"}, no_env) ||
        !Throws({"--no-conf", "--argon2-t-cost", "0"}, no_env) ||
        !Throws({"--no-conf", "--rpc-port"}, no_env)) {
      std::cerr << "Invalid options accepted\n";
      return EXIT_FAILURE;
    }

    // Exposing the endpoint needs both auth and an allowlist.
    if (!Throws({"--no-conf", "--rpc-bind", "0.0.0.0", "--no-rpc-auth"}, no_env) ||
        !Throws({"--no-conf", "--rpc-bind", "0.0.0.0"}, no_env)) {
      std::cerr << "Unsafe remote bind accepted\n";
      return EXIT_FAILURE;
    }
    {
      const auto opts = config::ParseDaemonOptions(
          {"--no-conf", "--rpc-bind", "0.0.0.0", "--rpc-allow-ip", "10.0.0.5"}, no_env);
      if (opts.rpc_allow.size() != 1 || opts.rpc_allow.front() != "10.0.0.5") {
        std::cerr << "rpcallowip not collected\n";
        return EXIT_FAILURE;
      }
    }

    if (!config::ParseDaemonOptions({"--help"}, no_env).show_help) {
      std::cerr << "--help not recognised\n";
      return EXIT_FAILURE;
    }

    {
      const auto cookie_path = dir / "cookie-dir" / "rpc.cookie";
      std::optional<config::RpcCredentials> read;
      std::string error;
      if (!config::ReadRpcCookie(cookie_path, &read, &error) || read) {
        std::cerr << "Missing cookie should read as absent\n";
        return EXIT_FAILURE;
      }
      const config::RpcCredentials written{config::kCookieUser, config::GenerateCookiePassword()};
      if (written.password.size() != 48) {
        std::cerr << "Cookie password has unexpected length\n";
        return EXIT_FAILURE;
      }
      if (!config::WriteRpcCookie(cookie_path, written, &error)) {
        std::cerr << "WriteRpcCookie failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      using std::filesystem::perms;
      const auto mode = std::filesystem::status(cookie_path).permissions();
      if ((mode & (perms::group_all | perms::others_all)) != perms::none) {
        std::cerr << "Cookie readable by other users\n";
        return EXIT_FAILURE;
      }
      if (!config::ReadRpcCookie(cookie_path, &read, &error) || !read ||
          read->user != written.user || read->password != written.password) {
        std::cerr << "Cookie round trip failed\n";
        return EXIT_FAILURE;
      }
      {
        std::ofstream out(cookie_path, std::ios::trunc);
        out << "no-separator\n";
      }
      if (config::ReadRpcCookie(cookie_path, &read, &error)) {
        std::cerr << "Malformed cookie accepted\n";
        return EXIT_FAILURE;
      }
    }

    std::filesystem::remove_all(dir, ec);
  } catch (const std::exception& ex) {
    std::cerr << "daemon_options_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
