#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace autopay::util {

// Non-empty run of ASCII digits, nothing else (no sign, no point).
bool IsDecimalString(std::string_view text);

// Strips redundant leading zeros; "000" becomes "0".
std::string NormalizeDecimal(std::string_view digits);

// Arbitrary-length hex ("0x" optional) to base-10 digits.
std::optional<std::string> HexToDecimal(std::string_view hex);

// Big-endian 256-bit encoding of a base-10 integer. Fails on non-digits and
// on values that do not fit in 256 bits.
bool DecimalToUint256(std::string_view digits, std::array<std::uint8_t, 32>* out);

// Approximate value of `atomic / 10^decimals`. Only for display and USD
// estimation; never feeds anything that is signed.
double AtomicToUnits(std::string_view atomic, int decimals);

// Exact display form of `atomic / 10^decimals`: "12500000", 6 -> "12.5".
// Trailing fractional zeros are dropped. Empty on non-decimal input.
std::string FormatUnits(std::string_view atomic, int decimals);

}  // namespace autopay::util
