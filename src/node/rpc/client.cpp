#include "rpc/client.hpp"

#include <array>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "net/socket.hpp"
#include "util/base64.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace autopay::rpc {

namespace {

constexpr std::size_t kMaxResponseHeaderSize = 64 * 1024;
constexpr std::size_t kMaxResponseBodySize = 8 * 1024 * 1024;

std::optional<long long> ParseContentLength(std::string_view headers) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    const auto line = headers.substr(offset, end - offset);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos &&
        util::EqualsIgnoreCase(util::Trim(line.substr(0, colon)), "content-length")) {
      const std::string value = util::Trim(line.substr(colon + 1));
      if (value.empty() || value.size() > 12 ||
          value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
      }
      return std::stoll(value);
    }
    offset = end + 2;
  }
  return std::nullopt;
}

}  // namespace

RpcClient::RpcClient(ClientOptions options) : options_(std::move(options)) {}

std::string RpcClient::BuildHttpRequest(const std::string& body) const {
  std::ostringstream oss;
  oss << "POST / HTTP/1.1\r\n";
  oss << "Host: " << options_.host << ":" << options_.port << "\r\n";
  if (!options_.rpc_user.empty()) {
    oss << "Authorization: Basic "
        << util::Base64Encode(options_.rpc_user + ":" + options_.rpc_password) << "\r\n";
  }
  oss << "Content-Type: application/json\r\n";
  oss << "Content-Length: " << body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << body;
  return oss.str();
}

nlohmann::json RpcClient::CallRaw(const std::string& method, const nlohmann::json& params) {
  const nlohmann::json request = {{"jsonrpc", "2.0"},
                                  {"id", "cli-" + std::to_string(++next_id_)},
                                  {"method", method},
                                  {"params", params}};
  net::TcpSocket socket;
  if (!socket.Connect(options_.host, options_.port, options_.timeout_ms)) {
    throw std::runtime_error("failed to connect to autopayd at " + options_.host + ":" +
                             std::to_string(options_.port));
  }
  if (options_.timeout_ms > 0) {
    socket.SetTimeout(options_.timeout_ms);
  }
  if (!socket.SendAll(BuildHttpRequest(request.dump()))) {
    throw std::runtime_error("failed to send request");
  }

  std::string response;
  std::array<std::uint8_t, 2048> chunk{};
  std::optional<std::size_t> body_offset;
  long long content_length = -1;
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      break;
    }
    response.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (!body_offset) {
      const auto sep = response.find("\r\n\r\n");
      if (sep == std::string::npos) {
        if (response.size() > kMaxResponseHeaderSize) {
          throw std::runtime_error("RPC response headers too large");
        }
        continue;
      }
      body_offset = sep + 4;
      const auto length = ParseContentLength(std::string_view(response.data(), sep));
      if (!length) {
        throw std::runtime_error("missing Content-Length");
      }
      if (*length > static_cast<long long>(kMaxResponseBodySize)) {
        throw std::runtime_error("RPC response too large");
      }
      content_length = *length;
    }
    if (response.size() >= *body_offset + static_cast<std::size_t>(content_length)) {
      break;
    }
  }
  if (!body_offset || content_length < 0 ||
      response.size() < *body_offset + static_cast<std::size_t>(content_length)) {
    throw std::runtime_error("invalid RPC response");
  }
  auto parsed = nlohmann::json::parse(
      response.substr(*body_offset, static_cast<std::size_t>(content_length)), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    const auto status_end = response.find("\r\n");
    throw std::runtime_error("unexpected RPC response: " + response.substr(0, status_end));
  }
  return parsed;
}

nlohmann::json RpcClient::Call(const std::string& method, const nlohmann::json& params) {
  auto response = CallRaw(method, params);
  auto error = response.find("error");
  if (error != response.end() && !error->is_null()) {
    const std::string message =
        error->is_object() ? error->value("message", std::string("rpc error")) : error->dump();
    throw std::runtime_error(method + ": " + message);
  }
  auto result = response.find("result");
  if (result == response.end()) {
    throw std::runtime_error(method + ": response carries no result");
  }
  return *result;
}

std::optional<x402::ChallengeResolution> RpcChallengeSink::Submit(
    const x402::ChallengeDetails& challenge, std::optional<int> tab_id) {
  nlohmann::json params = {{"challenge", x402::ChallengeToJson(challenge)}};
  if (tab_id) {
    params["tab_id"] = *tab_id;
  }
  try {
    x402::ChallengeResolution resolution;
    if (!x402::ResolutionFromJson(client_.Call("submitchallenge", params), &resolution)) {
      util::LogWarn("submitchallenge returned a malformed resolution");
      return std::nullopt;
    }
    return resolution;
  } catch (const std::exception& ex) {
    util::LogWarn(ex.what());
    return std::nullopt;
  }
}

std::optional<x402::ChallengeResolution> RpcChallengeSink::PollResolution(
    const std::string& challenge_id) {
  try {
    const auto result = client_.Call("pollresolution", {{"id", challenge_id}});
    const auto it = result.find("resolution");
    if (it == result.end() || it->is_null()) {
      return std::nullopt;
    }
    x402::ChallengeResolution resolution;
    if (!x402::ResolutionFromJson(*it, &resolution)) {
      return std::nullopt;
    }
    return resolution;
  } catch (const std::exception& ex) {
    util::LogWarn(ex.what());
    return std::nullopt;
  }
}

bool RpcChallengeSink::ReportSettlement(const x402::SettlementNotice& notice) {
  try {
    return client_.Call("reportsettlement", x402::SettlementNoticeToJson(notice))
        .value("ok", false);
  } catch (const std::exception& ex) {
    util::LogWarn(ex.what());
    return false;
  }
}

}  // namespace autopay::rpc
