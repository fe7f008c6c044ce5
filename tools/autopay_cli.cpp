#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <termios.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "config/daemon_options.hpp"
#include "config/rpc_cookie.hpp"
#include "rpc/client.hpp"
#include "util/strings.hpp"
#include "x402/challenge.hpp"
#include "x402/interceptor.hpp"
#include "x402/resolution.hpp"
#include "x402/settlement.hpp"

namespace {

struct CliOptions {
  std::string rpc_host{"127.0.0.1"};
  std::uint16_t rpc_port{autopay::config::kDefaultRpcPort};
  std::string data_dir;
  std::string rpc_user;
  std::string rpc_pass;
  int timeout_ms{15000};
  bool raw{false};
  std::vector<std::string> args;
};

bool HasFlag(const std::vector<std::string>& args, std::string_view flag) {
  for (const auto& arg : args) {
    if (arg == flag) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& args,
                                                   std::string_view prefix) {
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind(prefix, 0) == 0) {
      return arg.substr(prefix.size());
    }
  }
  return std::nullopt;
}

// Positional arguments after the command, skipping --options.
std::vector<std::string> Positionals(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].rfind("--", 0) != 0) {
      out.push_back(args[i]);
    }
  }
  return out;
}

std::string TrimTrailingNewlines(std::string input) {
  while (!input.empty() && (input.back() == '\n' || input.back() == '\r')) {
    input.pop_back();
  }
  return input;
}

std::string ReadFileContents(const std::string& path, std::string_view label) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("unable to read " + std::string(label) + " file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string ReadFirstLineFromFile(const std::string& path, std::string_view label) {
  std::istringstream in(ReadFileContents(path, label));
  std::string line;
  std::getline(in, line);
  return TrimTrailingNewlines(std::move(line));
}

std::string ReadLineFromStdin(std::string_view label) {
  std::string line;
  if (!std::getline(std::cin, line)) {
    throw std::runtime_error("failed to read " + std::string(label) + " from stdin");
  }
  return TrimTrailingNewlines(std::move(line));
}

std::string PromptHidden(std::string_view prompt) {
  if (isatty(fileno(stdin)) == 0) {
    throw std::runtime_error("stdin is not interactive; use -stdin or -file options");
  }
  std::cerr << prompt;
  std::string line;
  termios original{};
  bool have_termios = false;
  if (tcgetattr(STDIN_FILENO, &original) == 0) {
    have_termios = true;
    termios updated = original;
    updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
  }
  std::getline(std::cin, line);
  if (have_termios) {
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
    std::cerr << "\n";
  }
  return TrimTrailingNewlines(std::move(line));
}

// --<name>=<value> (warned), --<name>-stdin, --<name>-file=<path>, or a
// hidden prompt. Exactly one source may be given.
std::string ReadSecretFromArgs(const std::vector<std::string>& args, const std::string& name,
                               const std::string& label) {
  const std::string insecure_prefix = "--" + name + "=";
  const std::string stdin_flag = "--" + name + "-stdin";
  const std::string file_prefix = "--" + name + "-file=";
  std::optional<std::string> value;
  int sources = 0;

  if (auto insecure = FindPrefixedOptionValue(args, insecure_prefix)) {
    ++sources;
    value = std::move(*insecure);
    std::cerr << "warning: " << insecure_prefix
              << "... exposes secrets via process listings/shell history; prefer " << stdin_flag
              << " or " << file_prefix << "<path>\n";
  }
  if (HasFlag(args, stdin_flag)) {
    ++sources;
    value = ReadLineFromStdin(label);
  }
  if (auto file = FindPrefixedOptionValue(args, file_prefix)) {
    ++sources;
    value = ReadFirstLineFromFile(*file, label);
  }
  if (sources > 1) {
    throw std::runtime_error("specify only one of " + insecure_prefix + "..., " + stdin_flag +
                             ", or " + file_prefix + "<path>");
  }
  if (!value) {
    value = PromptHidden("Enter " + label + ": ");
  }
  if (value->empty()) {
    throw std::runtime_error(label + " must not be empty");
  }
  return *value;
}

int ParseIntOption(const std::string& value, const char* name) {
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::exception&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != value.size()) {
    throw std::runtime_error(std::string("invalid value for ") + name + ": " + value);
  }
  return parsed;
}

double ParseNumberOption(const std::string& value, const char* name) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != value.size()) {
    throw std::runtime_error(std::string("invalid value for ") + name + ": " + value);
  }
  return parsed;
}

void PrintUsage() {
  std::cout
      << "Usage: autopay-cli [options] <command> [params]\n"
      << "Commands:\n"
      << "  getstate\n"
      << "  submitchallenge --challenge-file=<path> [--tab-id=N]\n"
      << "  getpendingchallenge <id>\n"
      << "  approve <id> [--always-allow]\n"
      << "  deny <id>\n"
      << "  pollresolution <id>\n"
      << "  configurewallet [--secret-stdin|--secret-file=<path>]\n"
      << "                  [--passphrase-stdin|--passphrase-file=<path>]\n"
      << "                  [--lock-minutes=N] [--label=<text>]\n"
      << "  unlockwallet [--passphrase-stdin|--passphrase-file=<path>] [--lock-minutes=N]\n"
      << "  lockwallet\n"
      << "  exportwallet [--passphrase-stdin|--passphrase-file=<path>]\n"
      << "  removewallet --yes\n"
      << "  updatesettings [--threshold-usd=N] [--daily-cap-usd=N] [--preferred-token=<sym>]\n"
      << "                 [--prompt-required=<0|1>] [--chain=polygon|polygon-amoy]\n"
      << "  updatepolicy <origin> [--mode=ask|deny] [--allow-under-threshold=<0|1>]\n"
      << "               [--cap-usd=N|none]\n"
      << "  removepolicy <origin>\n"
      << "  resetpolicies\n"
      << "  clearhistory\n"
      << "  reportsettlement --payment-id=<id> [--header=<X-PAYMENT-RESPONSE value>]\n"
      << "  getshortlivedtoken <payment_id>\n"
      << "  refreshbalance [--chain=polygon|polygon-amoy] [--force]\n"
      << "  refreshallbalances\n"
      << "  handle402 --response-file=<path> --url=<url> [--method=GET] [--tab-id=N]\n"
      << "            [--retry-response-file=<path>] [--poll-ms=N]\n"
      << "  stop\n"
      << "Options:\n"
      << "  --rpc-host <host>   RPC host (default 127.0.0.1)\n"
      << "  --rpc-port <port>   RPC port (default " << autopay::config::kDefaultRpcPort << ")\n"
      << "  --data-dir <path>   Data directory for rpc.cookie lookup (default AUTOPAY_DATA_DIR or data)\n"
      << "  --rpc-user <user>   RPC basic auth user\n"
      << "  --rpc-pass <pass>   RPC basic auth password\n"
      << "  --timeout-ms <n>    Socket timeout (default 15000)\n"
      << "  --raw               Print the raw JSON-RPC response\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--rpc-host") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-host");
      opts.rpc_host = argv[i];
    } else if (arg == "--rpc-port") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-port");
      const int port = ParseIntOption(argv[i], "--rpc-port");
      if (port <= 0 || port > 65535) {
        throw std::runtime_error("--rpc-port out of range");
      }
      opts.rpc_port = static_cast<std::uint16_t>(port);
    } else if (arg == "--data-dir") {
      if (++i >= argc) throw std::runtime_error("missing value for --data-dir");
      opts.data_dir = argv[i];
    } else if (arg == "--rpc-user") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-user");
      opts.rpc_user = argv[i];
    } else if (arg == "--rpc-pass") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-pass");
      opts.rpc_pass = argv[i];
    } else if (arg == "--timeout-ms") {
      if (++i >= argc) throw std::runtime_error("missing value for --timeout-ms");
      opts.timeout_ms = ParseIntOption(argv[i], "--timeout-ms");
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  if (opts.data_dir.empty()) {
    opts.data_dir = autopay::config::ProcessEnvironment("AUTOPAY_DATA_DIR").value_or("data");
  }
  return opts;
}

autopay::rpc::ClientOptions ResolveClientOptions(const CliOptions& opts) {
  autopay::rpc::ClientOptions client;
  client.host = opts.rpc_host;
  client.port = opts.rpc_port;
  client.timeout_ms = opts.timeout_ms;
  if (!opts.rpc_user.empty() || !opts.rpc_pass.empty()) {
    if (opts.rpc_user.empty() || opts.rpc_pass.empty()) {
      throw std::runtime_error("--rpc-user and --rpc-pass must be set together");
    }
    client.rpc_user = opts.rpc_user;
    client.rpc_password = opts.rpc_pass;
    return client;
  }
  const auto cookie_path = std::filesystem::path(opts.data_dir) / "rpc.cookie";
  std::optional<autopay::config::RpcCredentials> cookie;
  std::string error;
  if (!autopay::config::ReadRpcCookie(cookie_path, &cookie, &error)) {
    throw std::runtime_error(error + " (run autopay-cli as the daemon user or pass "
                                     "--rpc-user/--rpc-pass)");
  }
  if (cookie) {
    client.rpc_user = cookie->user;
    client.rpc_password = cookie->password;
  }
  return client;
}

std::string RequirePositional(const std::vector<std::string>& args, const std::string& what) {
  const auto positionals = Positionals(args);
  if (positionals.empty()) {
    throw std::runtime_error(args.front() + " requires <" + what + ">");
  }
  return positionals.front();
}

void MaybeLockMinutes(const std::vector<std::string>& args, nlohmann::json* params) {
  if (auto value = FindPrefixedOptionValue(args, "--lock-minutes=")) {
    (*params)["lock_minutes"] = ParseIntOption(*value, "--lock-minutes");
  }
}

// Maps a CLI command to a JSON-RPC method and params.
std::pair<std::string, nlohmann::json> BuildRequest(const CliOptions& opts) {
  if (opts.args.empty()) {
    throw std::runtime_error("missing command");
  }
  const auto& args = opts.args;
  const std::string command = args.front();
  nlohmann::json params = nlohmann::json::object();

  if (command == "getstate" || command == "lockwallet" || command == "resetpolicies" ||
      command == "clearhistory" || command == "refreshallbalances" || command == "stop") {
    // no params
  } else if (command == "submitchallenge") {
    const auto path = FindPrefixedOptionValue(args, "--challenge-file=");
    if (!path) {
      throw std::runtime_error("submitchallenge requires --challenge-file=<path>");
    }
    params["challenge"] = nlohmann::json::parse(ReadFileContents(*path, "challenge"));
    if (auto tab = FindPrefixedOptionValue(args, "--tab-id=")) {
      params["tab_id"] = ParseIntOption(*tab, "--tab-id");
    }
  } else if (command == "getpendingchallenge" || command == "pollresolution") {
    params["id"] = RequirePositional(args, "id");
  } else if (command == "approve" || command == "deny") {
    params["id"] = RequirePositional(args, "id");
    params["approve"] = command == "approve";
    params["always_allow"] = command == "approve" && HasFlag(args, "--always-allow");
    return {"resolvependingchallenge", params};
  } else if (command == "configurewallet") {
    if (HasFlag(args, "--secret-stdin") && HasFlag(args, "--passphrase-stdin")) {
      // Both on stdin: secret first, then passphrase, one per line.
      params["secret"] = ReadLineFromStdin("private key");
      params["passphrase"] = ReadLineFromStdin("passphrase");
    } else {
      params["secret"] = ReadSecretFromArgs(args, "secret", "private key");
      params["passphrase"] = ReadSecretFromArgs(args, "passphrase", "passphrase");
    }
    MaybeLockMinutes(args, &params);
    if (auto label = FindPrefixedOptionValue(args, "--label=")) {
      params["label"] = *label;
    }
  } else if (command == "unlockwallet") {
    params["passphrase"] = ReadSecretFromArgs(args, "passphrase", "passphrase");
    MaybeLockMinutes(args, &params);
  } else if (command == "exportwallet") {
    params["passphrase"] = ReadSecretFromArgs(args, "passphrase", "passphrase");
  } else if (command == "removewallet") {
    if (!HasFlag(args, "--yes")) {
      throw std::runtime_error("removewallet deletes the encrypted key; pass --yes to confirm");
    }
  } else if (command == "updatesettings") {
    if (auto v = FindPrefixedOptionValue(args, "--threshold-usd=")) {
      params["threshold_usd"] = ParseNumberOption(*v, "--threshold-usd");
    }
    if (auto v = FindPrefixedOptionValue(args, "--daily-cap-usd=")) {
      params["daily_auto_cap_usd"] = ParseNumberOption(*v, "--daily-cap-usd");
    }
    if (auto v = FindPrefixedOptionValue(args, "--preferred-token=")) {
      params["preferred_token"] = *v;
    }
    if (auto v = FindPrefixedOptionValue(args, "--prompt-required=")) {
      params["prompt_required"] = autopay::util::ParseBool(*v);
    }
    if (auto v = FindPrefixedOptionValue(args, "--chain=")) {
      params["chain"] = *v;
    }
  } else if (command == "updatepolicy") {
    params["origin"] = RequirePositional(args, "origin");
    if (auto v = FindPrefixedOptionValue(args, "--mode=")) {
      params["mode"] = *v;
    }
    if (auto v = FindPrefixedOptionValue(args, "--allow-under-threshold=")) {
      params["allow_under_threshold"] = autopay::util::ParseBool(*v);
    }
    if (auto v = FindPrefixedOptionValue(args, "--cap-usd=")) {
      if (*v == "none") {
        params["cap_usd"] = nullptr;
      } else {
        params["cap_usd"] = ParseNumberOption(*v, "--cap-usd");
      }
    }
  } else if (command == "removepolicy") {
    params["origin"] = RequirePositional(args, "origin");
  } else if (command == "reportsettlement") {
    const auto payment_id = FindPrefixedOptionValue(args, "--payment-id=");
    const auto notice =
        autopay::x402::BuildSettlementNotice(payment_id, FindPrefixedOptionValue(args, "--header="));
    if (!notice) {
      throw std::runtime_error("reportsettlement requires --payment-id=<id> or --header=<value>");
    }
    params = autopay::x402::SettlementNoticeToJson(*notice);
  } else if (command == "getshortlivedtoken") {
    params["payment_id"] = RequirePositional(args, "payment_id");
  } else if (command == "refreshbalance") {
    if (auto chain = FindPrefixedOptionValue(args, "--chain=")) {
      params["chain"] = *chain;
    }
    params["force"] = HasFlag(args, "--force");
  } else {
    throw std::runtime_error("unknown command: " + command);
  }
  return {command, params};
}

// Splits scheme://host[:port]/path into origin and endpoint.
autopay::x402::RequestContext ContextFromUrl(const std::string& url, const std::string& method) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw std::runtime_error("--url must be absolute: " + url);
  }
  const auto path_start = url.find_first_of("/?#", scheme_end + 3);
  autopay::x402::RequestContext context;
  context.origin = autopay::util::ToLower(url.substr(0, path_start));
  context.endpoint = path_start == std::string::npos ? "/" : url.substr(path_start);
  context.method = method;
  return context;
}

// {"status": 402, "headers": {...}, "body": "..." | {...}}
autopay::x402::ObservedResponse LoadResponse(const std::string& path) {
  const auto document = nlohmann::json::parse(ReadFileContents(path, "response"));
  autopay::x402::ObservedResponse response;
  response.status = document.at("status").get<int>();
  if (auto headers = document.find("headers"); headers != document.end()) {
    for (const auto& [name, value] : headers->items()) {
      response.headers[name] = value.is_string() ? value.get<std::string>() : value.dump();
    }
  }
  if (auto body = document.find("body"); body != document.end() && !body->is_null()) {
    response.body = body->is_string() ? body->get<std::string>() : body->dump();
  }
  return response;
}

nlohmann::json HandleHandle402(const CliOptions& opts, autopay::rpc::RpcClient& client) {
  const auto& args = opts.args;
  const auto response_path = FindPrefixedOptionValue(args, "--response-file=");
  const auto url = FindPrefixedOptionValue(args, "--url=");
  if (!response_path || !url) {
    throw std::runtime_error("handle402 requires --response-file=<path> and --url=<url>");
  }
  std::string method = FindPrefixedOptionValue(args, "--method=").value_or("GET");
  for (auto& c : method) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  const auto context = ContextFromUrl(*url, method);
  const auto original = LoadResponse(*response_path);

  autopay::x402::InterceptorOptions interceptor_options;
  if (auto tab = FindPrefixedOptionValue(args, "--tab-id=")) {
    interceptor_options.tab_id = ParseIntOption(*tab, "--tab-id");
  }
  if (auto poll = FindPrefixedOptionValue(args, "--poll-ms=")) {
    interceptor_options.poll_interval = std::chrono::milliseconds(ParseIntOption(*poll, "--poll-ms"));
  }

  // The paid request itself is replayed by the caller; a captured response to
  // the retry may be supplied so the settlement gets reported.
  const auto retry_response_path = FindPrefixedOptionValue(args, "--retry-response-file=");
  nlohmann::json sent_headers = nullptr;
  autopay::x402::RetryFunction retry =
      [&](const autopay::x402::HeaderMap& headers)
      -> std::optional<autopay::x402::ObservedResponse> {
    sent_headers = headers;
    if (!retry_response_path) {
      return std::nullopt;
    }
    return LoadResponse(*retry_response_path);
  };

  autopay::rpc::RpcChallengeSink sink(client);
  autopay::x402::Interceptor interceptor(sink, interceptor_options);
  const auto result = interceptor.Handle(context, original, retry);

  nlohmann::json out;
  out["outcome"] =
      result.outcome == autopay::x402::InterceptOutcome::kRetried ? "retried" : "passthrough";
  out["status"] = result.response.status;
  out["resolution"] =
      result.resolution ? autopay::x402::ResolutionToJson(*result.resolution) : nlohmann::json(nullptr);
  out["retry_headers"] = sent_headers;
  return out;
}

int PrintResponse(const CliOptions& opts, const nlohmann::json& response) {
  if (opts.raw) {
    std::cout << response.dump(2) << "\n";
    return response.contains("error") && !response["error"].is_null() ? 1 : 0;
  }
  if (response.contains("error") && !response["error"].is_null()) {
    std::cerr << "error: " << response["error"].dump() << "\n";
    return 1;
  }
  const auto& result = response.at("result");
  if (result.is_string()) {
    std::cout << result.get<std::string>() << "\n";
  } else {
    std::cout << result.dump(2) << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    if (opts.args.empty()) {
      PrintUsage();
      return 1;
    }
    autopay::rpc::RpcClient client(ResolveClientOptions(opts));
    if (opts.args.front() == "handle402") {
      std::cout << HandleHandle402(opts, client).dump(2) << "\n";
      return 0;
    }
    const auto [method, params] = BuildRequest(opts);
    return PrintResponse(opts, client.CallRaw(method, params));
  } catch (const std::exception& ex) {
    std::cerr << "autopay-cli: " << ex.what() << "\n";
    return 1;
  }
}
