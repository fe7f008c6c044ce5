#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/argon2_kdf.hpp"

namespace autopay::config {

constexpr std::uint16_t kDefaultRpcPort = 18402;
constexpr const char* kDefaultConfigFile = "autopay.conf";
constexpr const char* kDefaultStateFile = "autopay-state.json";

struct DaemonOptions {
  std::string data_dir{"data"};
  std::string state_file;  // empty -> <data_dir>/autopay-state.json
  std::string rpc_bind{"127.0.0.1"};
  std::uint16_t rpc_port{kDefaultRpcPort};
  std::string rpc_user;
  std::string rpc_password;
  bool rpc_require_auth{true};
  std::vector<std::string> rpc_allow;
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  util::Argon2idParams argon2{util::DefaultArgon2idParams()};
  std::string prompt_url;
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};
};

// Returns the value of an environment variable, or nullopt when unset or
// empty. Injected so tests do not touch the process environment.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

std::optional<std::string> ProcessEnvironment(std::string_view name);

// Applies one key=value pair. Keys are matched case-insensitively with '-'
// and '_' ignored. Returns false for an unknown key; throws
// std::runtime_error for a malformed value.
bool ApplyConfigOption(const std::string& key, const std::string& value, DaemonOptions* opts);

// Reads autopay.conf style files. A missing file is not an error; parse
// failures throw std::runtime_error prefixed with "<file>:<line>: ".
void LoadConfigFile(const std::filesystem::path& path, DaemonOptions* opts);

// AUTOPAY_DATA_DIR, AUTOPAY_RPC_USER, AUTOPAY_RPC_PASS, AUTOPAY_LOG_LEVEL.
void ApplyEnvironmentOverrides(const EnvLookup& env, DaemonOptions* opts);

// Defaults < config file < environment < command line. Throws
// std::runtime_error on any invalid input.
DaemonOptions ParseDaemonOptions(const std::vector<std::string>& args,
                                 const EnvLookup& env = ProcessEnvironment);

std::string DaemonUsage();

std::filesystem::path StatePath(const DaemonOptions& opts);
std::filesystem::path CookiePath(const DaemonOptions& opts);

}  // namespace autopay::config
