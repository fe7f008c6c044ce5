#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace autopay::util {

struct Argon2idParams {
  std::uint32_t t_cost;        // iterations
  std::uint32_t m_cost_kib;    // memory in KiB
  std::uint32_t parallelism;   // lanes
};

constexpr std::size_t kArgon2idKeySize = 32;

// 3 iterations, 64 MiB, single lane.
Argon2idParams DefaultArgon2idParams();

// Parameters read back from persisted state are attacker-influenced; reject
// zero values and anything above the caps before spending time on them.
bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error = nullptr);

// Derive a 32-byte key using Argon2id. Returns true on success.
bool DeriveKeyArgon2id(const std::string& password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out);

}  // namespace autopay::util
