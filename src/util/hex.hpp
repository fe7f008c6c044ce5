#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace autopay::util {

std::string HexEncode(std::span<const std::uint8_t> data);

// Lower-case hex with a leading "0x", the form every EVM-facing field uses.
std::string HexEncodePrefixed(std::span<const std::uint8_t> data);

// Removes a leading "0x"/"0X" if present.
std::string_view StripHexPrefix(std::string_view hex);

bool IsHexDigits(std::string_view text);

// Decodes an even-length hex string; a "0x" prefix is accepted.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

}  // namespace autopay::util
