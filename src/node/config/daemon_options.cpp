#include "config/daemon_options.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::config {

namespace {

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::uint64_t ParseUnsigned(const std::string& value, std::uint64_t max, const char* name) {
  if (value.empty() || value.size() > 20) {
    throw std::runtime_error(std::string("invalid value for ") + name + ": '" + value + "'");
  }
  std::uint64_t parsed = 0;
  for (char c : value) {
    if (c < '0' || c > '9') {
      throw std::runtime_error(std::string("invalid value for ") + name + ": '" + value + "'");
    }
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (parsed > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
      throw std::runtime_error(std::string(name) + " out of range");
    }
    parsed = parsed * 10 + digit;
  }
  if (parsed > max) {
    throw std::runtime_error(std::string(name) + " out of range");
  }
  return parsed;
}

bool IsLoopbackBind(const std::string& address) {
  return address == "127.0.0.1" || address == "::1" || address == "localhost" ||
         address.rfind("127.", 0) == 0;
}

void Validate(const DaemonOptions& opts) {
  std::string error;
  if (!util::ValidateArgon2idParams(opts.argon2, &error)) {
    throw std::runtime_error("invalid argon2 parameters: " + error);
  }
  util::ParseLogLevelString(opts.log_level);
  if (!IsLoopbackBind(opts.rpc_bind)) {
    if (!opts.rpc_require_auth) {
      throw std::runtime_error("refusing unauthenticated RPC on non-loopback address " +
                               opts.rpc_bind);
    }
    if (opts.rpc_allow.empty()) {
      throw std::runtime_error("non-loopback rpcbind requires at least one rpcallowip");
    }
  }
}

}  // namespace

std::optional<std::string> ProcessEnvironment(std::string_view name) {
  const std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

bool ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       DaemonOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "datadir") {
    opts->data_dir = value;
  } else if (key == "statefile") {
    opts->state_file = value;
  } else if (key == "rpcbind") {
    opts->rpc_bind = value;
  } else if (key == "rpcport") {
    opts->rpc_port = static_cast<std::uint16_t>(ParseUnsigned(value, 65535, "rpcport"));
  } else if (key == "rpcuser") {
    opts->rpc_user = value;
  } else if (key == "rpcpassword" || key == "rpcpass") {
    opts->rpc_password = value;
  } else if (key == "rpcauth" || key == "rpcrequireauth") {
    opts->rpc_require_auth = util::ParseBool(value);
  } else if (key == "rpcallowip") {
    opts->rpc_allow.push_back(value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = static_cast<std::size_t>(ParseUnsigned(value, 1u << 20, "logmaxsizemb"));
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(ParseUnsigned(value, 1000, "logmaxfiles"));
  } else if (key == "argon2tcost") {
    opts->argon2.t_cost = static_cast<std::uint32_t>(
        ParseUnsigned(value, std::numeric_limits<std::uint32_t>::max(), "argon2tcost"));
  } else if (key == "argon2mcostkib") {
    opts->argon2.m_cost_kib = static_cast<std::uint32_t>(
        ParseUnsigned(value, std::numeric_limits<std::uint32_t>::max(), "argon2mcostkib"));
  } else if (key == "argon2parallelism") {
    opts->argon2.parallelism = static_cast<std::uint32_t>(
        ParseUnsigned(value, std::numeric_limits<std::uint32_t>::max(), "argon2parallelism"));
  } else if (key == "prompturl") {
    opts->prompt_url = value;
  } else if (key == "config" || key == "conf") {
    opts->config_path = value;
  } else {
    return false;
  }
  return true;
}

void LoadConfigFile(const std::filesystem::path& path, DaemonOptions* opts) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = util::Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = util::Trim(line.substr(0, eq_pos));
      value = util::Trim(line.substr(eq_pos + 1));
    }
    try {
      if (key.empty()) {
        throw std::runtime_error("missing key");
      }
      if (!ApplyConfigOption(key, value, opts)) {
        std::cerr << "[autopayd] warn: unknown config key '" << key << "'\n";
      }
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(const EnvLookup& env, DaemonOptions* opts) {
  if (auto value = env("AUTOPAY_DATA_DIR")) {
    opts->data_dir = std::move(*value);
  }
  if (auto value = env("AUTOPAY_RPC_USER")) {
    opts->rpc_user = std::move(*value);
  }
  if (auto value = env("AUTOPAY_RPC_PASS")) {
    opts->rpc_password = std::move(*value);
  }
  if (auto value = env("AUTOPAY_LOG_LEVEL")) {
    opts->log_level = std::move(*value);
  }
}

DaemonOptions ParseDaemonOptions(const std::vector<std::string>& argv, const EnvLookup& env) {
  std::vector<std::string> args;
  args.reserve(argv.size());
  for (const auto& token : argv) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for " + args[idx]);
    }
    return args[++idx];
  };

  DaemonOptions opts;
  // The config file location must be known before anything else is applied.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      opts.show_help = true;
      return opts;
    }
    if (args[i] == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (args[i] == "--no-conf") {
      opts.disable_config_file = true;
    }
  }
  if (!opts.disable_config_file) {
    LoadConfigFile(opts.config_path.empty() ? std::filesystem::path(kDefaultConfigFile)
                                            : std::filesystem::path(opts.config_path),
                   &opts);
  }
  ApplyEnvironmentOverrides(env, &opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--conf") {
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else if (arg == "--no-rpc-auth") {
      opts.rpc_require_auth = false;
    } else if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
      const std::string value = ensure_value(i);
      if (!ApplyConfigOption(arg.substr(2), value, &opts)) {
        throw std::runtime_error("unknown option: " + arg);
      }
    } else {
      throw std::runtime_error("unexpected argument: " + arg);
    }
  }
  Validate(opts);
  return opts;
}

std::string DaemonUsage() {
  std::ostringstream out;
  out << "Usage: autopayd [options]\n"
      << "Options:\n"
      << "  --data-dir <path>            Data directory (default: data)\n"
      << "  --state-file <path>          Persisted state document (default: <data>/"
      << kDefaultStateFile << ")\n"
      << "  --rpc-bind <addr>            RPC bind address (default: 127.0.0.1)\n"
      << "  --rpc-port <port>            RPC port (default: " << kDefaultRpcPort << ")\n"
      << "  --rpc-user <name>            RPC basic auth user\n"
      << "  --rpc-pass <secret>          RPC basic auth password (prefer AUTOPAY_RPC_PASS)\n"
      << "  --rpc-allow-ip <addr>        Allow a client address (repeatable). Default: loopback only\n"
      << "  --rpc-auth <0|1>             Require HTTP basic auth (default: 1)\n"
      << "  --no-rpc-auth                Same as --rpc-auth 0 (loopback binds only)\n"
      << "  --prompt-url <url>           Approval page announced for pending challenges\n"
      << "  --argon2-t-cost <n>          Argon2id iterations for new wallets\n"
      << "  --argon2-m-cost-kib <n>      Argon2id memory in KiB for new wallets\n"
      << "  --argon2-parallelism <n>     Argon2id lanes for new wallets\n"
      << "  --debug-log <path>           Append structured logs to the given file\n"
      << "  --log-level <lvl>            debug, info, warn, error (default: info)\n"
      << "  --log-max-size-mb <mb>       Rotate the log after about <mb> megabytes (0=disable)\n"
      << "  --log-max-files <n>          Rotated log files to keep (default: 0)\n"
      << "  --conf <path>                Load options from the given file (default: ./"
      << kDefaultConfigFile << ")\n"
      << "  --no-conf                    Do not load a config file\n";
  return out.str();
}

std::filesystem::path StatePath(const DaemonOptions& opts) {
  if (!opts.state_file.empty()) {
    return std::filesystem::path(opts.state_file);
  }
  return std::filesystem::path(opts.data_dir) / kDefaultStateFile;
}

std::filesystem::path CookiePath(const DaemonOptions& opts) {
  return std::filesystem::path(opts.data_dir) / "rpc.cookie";
}

}  // namespace autopay::config
