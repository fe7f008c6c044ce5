#include "util/decimal.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "util/hex.hpp"

namespace autopay::util {

bool IsDecimalString(std::string_view text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string NormalizeDecimal(std::string_view digits) {
  const auto first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return "0";
  }
  return std::string(digits.substr(first));
}

std::optional<std::string> HexToDecimal(std::string_view hex) {
  hex = StripHexPrefix(hex);
  if (!IsHexDigits(hex)) {
    return std::nullopt;
  }
  // Little-endian base-10 digits, multiplied by 16 and incremented per nibble.
  std::vector<std::uint8_t> digits{0};
  for (char c : hex) {
    int nibble = 0;
    if (c >= '0' && c <= '9') {
      nibble = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      nibble = 10 + (c - 'a');
    } else {
      nibble = 10 + (c - 'A');
    }
    int carry = nibble;
    for (auto& d : digits) {
      const int value = d * 16 + carry;
      d = static_cast<std::uint8_t>(value % 10);
      carry = value / 10;
    }
    while (carry > 0) {
      digits.push_back(static_cast<std::uint8_t>(carry % 10));
      carry /= 10;
    }
  }
  std::string out;
  out.reserve(digits.size());
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    out.push_back(static_cast<char>('0' + *it));
  }
  return NormalizeDecimal(out);
}

bool DecimalToUint256(std::string_view digits, std::array<std::uint8_t, 32>* out) {
  if (!out || !IsDecimalString(digits)) {
    return false;
  }
  std::array<std::uint8_t, 32> value{};
  for (char c : digits) {
    // value = value * 10 + digit, big-endian.
    unsigned carry = static_cast<unsigned>(c - '0');
    for (std::size_t i = value.size(); i-- > 0;) {
      const unsigned product = static_cast<unsigned>(value[i]) * 10u + carry;
      value[i] = static_cast<std::uint8_t>(product & 0xff);
      carry = product >> 8;
    }
    if (carry != 0) {
      return false;
    }
  }
  *out = value;
  return true;
}

double AtomicToUnits(std::string_view atomic, int decimals) {
  if (!IsDecimalString(atomic)) {
    return 0.0;
  }
  long double value = 0;
  for (char c : atomic) {
    value = value * 10 + static_cast<long double>(c - '0');
  }
  return static_cast<double>(value / std::pow(10.0L, static_cast<long double>(decimals)));
}

std::string FormatUnits(std::string_view atomic, int decimals) {
  if (!IsDecimalString(atomic) || decimals < 0) {
    return {};
  }
  std::string digits = NormalizeDecimal(atomic);
  const auto scale = static_cast<std::size_t>(decimals);
  if (digits.size() <= scale) {
    digits.insert(0, scale - digits.size() + 1, '0');
  }
  std::string whole = digits.substr(0, digits.size() - scale);
  std::string fraction = digits.substr(digits.size() - scale);
  while (!fraction.empty() && fraction.back() == '0') {
    fraction.pop_back();
  }
  return fraction.empty() ? whole : whole + "." + fraction;
}

}  // namespace autopay::util
