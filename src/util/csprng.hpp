#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace autopay::util {

// Fills `out` from the kernel CSPRNG (getrandom, /dev/urandom fallback).
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Returns `size` random bytes. Aborts when the kernel cannot supply them:
// salts, nonces and authorization nonces must never be predictable.
std::vector<std::uint8_t> SecureRandomBytes(std::size_t size);

// RFC 4122 version 4 UUID in canonical lower-case form.
std::string RandomUuid();

}  // namespace autopay::util
