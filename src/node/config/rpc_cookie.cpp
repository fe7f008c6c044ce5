#include "config/rpc_cookie.hpp"

#include <system_error>

#include "util/atomic_file.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/strings.hpp"

namespace autopay::config {

std::string GenerateCookiePassword() {
  return util::HexEncode(util::SecureRandomBytes(24));
}

bool WriteRpcCookie(const std::filesystem::path& path, const RpcCredentials& credentials,
                    std::string* error) {
  if (credentials.user.empty() || credentials.password.empty() ||
      credentials.user.find(':') != std::string::npos) {
    if (error) {
      *error = "invalid RPC credentials for cookie";
    }
    return false;
  }
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error) {
        *error = "unable to create " + path.parent_path().string() + ": " + ec.message();
      }
      return false;
    }
  }
  return util::AtomicWriteFile(path, credentials.user + ":" + credentials.password + "\n",
                               error);
}

bool ReadRpcCookie(const std::filesystem::path& path, std::optional<RpcCredentials>* out,
                   std::string* error) {
  out->reset();
  std::string contents;
  bool exists = false;
  if (!util::ReadFileToString(path, &contents, &exists, error)) {
    return false;
  }
  if (!exists) {
    return true;
  }
  const std::string line = util::Trim(contents.substr(0, contents.find('\n')));
  const auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == line.size()) {
    if (error) {
      *error = "malformed RPC cookie at " + path.string();
    }
    return false;
  }
  *out = RpcCredentials{line.substr(0, colon), line.substr(colon + 1)};
  return true;
}

}  // namespace autopay::config
