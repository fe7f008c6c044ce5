#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace autopay::config {

constexpr const char* kCookieUser = "autopaycookie";

struct RpcCredentials {
  std::string user;
  std::string password;
};

// Random hex password for the cookie user.
std::string GenerateCookiePassword();

// Writes "user:password" owner read/write only, creating parent directories.
bool WriteRpcCookie(const std::filesystem::path& path, const RpcCredentials& credentials,
                    std::string* error = nullptr);

// Nullopt when the cookie does not exist; false plus error when it exists
// but cannot be read or is malformed.
bool ReadRpcCookie(const std::filesystem::path& path, std::optional<RpcCredentials>* out,
                   std::string* error = nullptr);

}  // namespace autopay::config
