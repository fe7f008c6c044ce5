#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace autopay::util {

std::string Base64Encode(std::span<const std::uint8_t> input);
std::string Base64Encode(std::string_view input);

// Accepts both the standard and the URL-safe alphabet, ignores ASCII
// whitespace and tolerates missing '=' padding (compact JWT segments omit it).
// Characters outside either alphabet are rejected.
bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out);

// Decodes into a string. Returns false on the same inputs Base64Decode rejects.
bool Base64DecodeToString(std::string_view input, std::string* out);

}  // namespace autopay::util
