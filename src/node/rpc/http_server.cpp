#include "rpc/http_server.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "util/base64.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::rpc {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;
constexpr std::size_t kDefaultMaxBodySize = 1024 * 1024;

// Value of the first header named `name` (case-insensitive), trimmed.
std::optional<std::string> FindHeader(std::string_view headers, std::string_view name) {
  std::size_t start = headers.find("\r\n");
  while (start != std::string_view::npos && start < headers.size()) {
    start += 2;
    const auto end = headers.find("\r\n", start);
    const auto line = headers.substr(start, end == std::string_view::npos ? headers.npos
                                                                          : end - start);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos &&
        util::EqualsIgnoreCase(util::Trim(std::string(line.substr(0, colon))), name)) {
      return util::Trim(std::string(line.substr(colon + 1)));
    }
    start = end;
  }
  return std::nullopt;
}

bool IsJsonContentType(const std::string& value) {
  const auto type = util::Trim(value.substr(0, value.find(';')));
  return util::EqualsIgnoreCase(type, "application/json");
}

// Content-Length, or -1 when absent or malformed.
long long ParseContentLength(const std::string& headers) {
  const auto value = FindHeader(headers, "Content-Length");
  if (!value || value->empty() ||
      !std::all_of(value->begin(), value->end(), [](char c) { return c >= '0' && c <= '9'; }) ||
      value->size() > 12) {
    return -1;
  }
  return std::stoll(*value);
}

// Length-independent comparison so credentials do not leak through timing.
bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  unsigned char diff = a.size() == b.size() ? 0 : 1;
  const std::size_t n = std::max(a.size(), b.size());
  for (std::size_t i = 0; i < n; ++i) {
    const unsigned char x = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    const unsigned char y = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned char>(x ^ y);
  }
  return diff == 0;
}

const char* StatusText(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 415:
      return "Unsupported Media Type";
  }
  return "Error";
}

std::string ErrorBody(int code, const char* message) {
  return nlohmann::json{{"jsonrpc", "2.0"},
                        {"id", nullptr},
                        {"error", {{"code", code}, {"message", message}}}}
      .dump();
}

}  // namespace

HttpServer::HttpServer(Options options, Handler handler)
    : options_(std::move(options)), handler_(std::move(handler)) {
  if (options_.max_body_bytes == 0) {
    options_.max_body_bytes = kDefaultMaxBodySize;
  }
}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (!listener_.BindAndListen(options_.bind_address, options_.port)) {
    running_.store(false);
    throw std::runtime_error("failed to bind RPC port " + options_.bind_address + ":" +
                             std::to_string(options_.port));
  }
  bound_port_ = listener_.LocalPort();
  util::LogInfo("RPC listening on " + options_.bind_address + ":" +
                std::to_string(bound_port_));
  worker_ = std::thread([this]() { ServeLoop(); });
}

void HttpServer::Stop() {
  bool expected = true;
  if (running_.compare_exchange_strong(expected, false)) {
    util::LogInfo("RPC server stopping");
  }
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
  listener_.Close();
}

void HttpServer::Serve() {
  Start();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void HttpServer::ServeLoop() {
  while (running_) {
    auto client = listener_.AcceptWithTimeout(200);
    if (!client.IsValid()) {
      continue;
    }
    if (options_.socket_timeout_ms > 0) {
      client.SetTimeout(options_.socket_timeout_ms);
    }
    HandleClient(std::move(client));
  }
}

void HttpServer::HandleClient(net::TcpSocket client) {
  std::string body;
  int status = 200;
  if (!ReadRequest(client, &body, &status)) {
    std::string error_json = ErrorBody(-32700, "parse error");
    switch (status) {
      case 401:
        error_json = ErrorBody(-32651, "unauthorized");
        break;
      case 403:
        error_json = ErrorBody(-32651, "forbidden");
        break;
      case 405:
        error_json = ErrorBody(-32600, "method not allowed");
        break;
      case 413:
        error_json = ErrorBody(-32000, "request too large");
        break;
      case 415:
        error_json = ErrorBody(-32600, "unsupported media type");
        break;
    }
    SendResponse(client, status, error_json);
    return;
  }
  const auto payload = nlohmann::json::parse(body, nullptr, false);
  if (payload.is_discarded()) {
    SendResponse(client, 400, ErrorBody(-32700, "invalid JSON"));
    return;
  }
  try {
    SendResponse(client, 200, handler_(payload).dump());
  } catch (const std::exception& ex) {
    util::LogError(std::string("RPC handler failed: ") + ex.what());
    SendResponse(client, 200, ErrorBody(-32603, ex.what()));
  }
}

bool HttpServer::ReadRequest(net::TcpSocket& client, std::string* body, int* status) {
  std::string buffer;
  std::array<std::uint8_t, 2048> chunk{};
  std::size_t header_end = std::string::npos;
  while (buffer.size() < kMaxHeaderSize) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    header_end = buffer.find("\r\n\r\n");
    if (header_end != std::string::npos) {
      break;
    }
  }
  if (header_end == std::string::npos) {
    *status = 413;
    return false;
  }
  const std::string headers = buffer.substr(0, header_end);
  const std::string peer = client.PeerAddress();
  if (!HostAllowed(peer)) {
    util::LogWarn("RPC connection from " + (peer.empty() ? "unknown peer" : peer) + " refused");
    *status = 403;
    return false;
  }
  if (headers.rfind("POST ", 0) != 0) {
    *status = 405;
    return false;
  }
  const auto content_type = FindHeader(headers, "Content-Type");
  if (!content_type || !IsJsonContentType(*content_type)) {
    *status = 415;
    return false;
  }
  if (!Authorized(headers, peer)) {
    util::LogWarn("RPC request from " + peer + " failed authentication");
    *status = 401;
    return false;
  }
  const long long content_length = ParseContentLength(headers);
  if (content_length > static_cast<long long>(options_.max_body_bytes)) {
    *status = 413;
    return false;
  }
  std::string payload = buffer.substr(header_end + 4);
  const std::size_t expected =
      content_length < 0 ? payload.size() : static_cast<std::size_t>(content_length);
  while (payload.size() < expected) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    payload.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
  }
  if (payload.size() > options_.max_body_bytes) {
    *status = 413;
    return false;
  }
  payload.resize(expected);
  *body = std::move(payload);
  return true;
}

bool HttpServer::Authorized(const std::string& headers, const std::string&) const {
  if (!options_.require_auth) {
    return true;
  }
  if (options_.rpc_user.empty() || options_.rpc_password.empty()) {
    return false;
  }
  const auto header = FindHeader(headers, "Authorization");
  if (!header || !util::StartsWithIgnoreCase(*header, "Basic ")) {
    return false;
  }
  std::string credentials;
  if (!util::Base64DecodeToString(util::Trim(header->substr(6)), &credentials)) {
    return false;
  }
  return ConstantTimeEquals(credentials, options_.rpc_user + ":" + options_.rpc_password);
}

bool HttpServer::HostAllowed(const std::string& peer) const {
  if (peer.empty()) {
    return false;
  }
  if (options_.allowed_hosts.empty()) {
    return peer == "::1" || peer.rfind("127.", 0) == 0;
  }
  return std::find(options_.allowed_hosts.begin(), options_.allowed_hosts.end(), peer) !=
         options_.allowed_hosts.end();
}

void HttpServer::SendResponse(net::TcpSocket& client, int status, const std::string& json_body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << ' ' << StatusText(status) << "\r\n";
  oss << "Content-Type: application/json\r\n";
  if (status == 401) {
    oss << "WWW-Authenticate: Basic realm=\"autopay\"\r\n";
  }
  oss << "Content-Length: " << json_body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << json_body;
  if (!client.SendAll(oss.str())) {
    util::LogDebug("RPC response could not be delivered");
  }
  client.Close();
}

}  // namespace autopay::rpc
