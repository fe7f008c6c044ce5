#include "util/argon2_kdf.hpp"

#include <argon2.h>

namespace autopay::util {

namespace {

constexpr std::uint32_t kMaxArgon2idT = 10;
constexpr std::uint32_t kMaxArgon2idMemoryKiB = 1024u * 1024u;  // 1 GiB
constexpr std::uint32_t kMaxArgon2idParallelism = 8;
// libargon2 refuses fewer than 8 KiB per lane.
constexpr std::uint32_t kMinArgon2idMemoryKiBPerLane = 8;

}  // namespace

Argon2idParams DefaultArgon2idParams() {
  Argon2idParams params;
  params.t_cost = 3;
  params.m_cost_kib = 64 * 1024;
  params.parallelism = 1;
  return params;
}

bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error) {
  const auto fail = [&](const char* what) {
    if (error) {
      *error = std::string("argon2id parameters rejected: ") + what + " (t_cost=" +
               std::to_string(params.t_cost) + ", m_cost_kib=" + std::to_string(params.m_cost_kib) +
               ", parallelism=" + std::to_string(params.parallelism) + ")";
    }
    return false;
  };
  if (params.t_cost == 0 || params.m_cost_kib == 0 || params.parallelism == 0) {
    return fail("zero value");
  }
  if (params.t_cost > kMaxArgon2idT || params.m_cost_kib > kMaxArgon2idMemoryKiB ||
      params.parallelism > kMaxArgon2idParallelism) {
    return fail("exceeds maximums");
  }
  if (params.m_cost_kib < kMinArgon2idMemoryKiBPerLane * params.parallelism) {
    return fail("memory below minimum");
  }
  return true;
}

bool DeriveKeyArgon2id(const std::string& password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out) {
  if (!key_out) return false;
  key_out->assign(kArgon2idKeySize, 0);

  const int rc = argon2id_hash_raw(
      params.t_cost,
      params.m_cost_kib,
      params.parallelism,
      password.data(), password.size(),
      salt.data(), salt.size(),
      key_out->data(), key_out->size());

  return rc == ARGON2_OK;
}

}  // namespace autopay::util
