#include "util/hex.hpp"

namespace autopay::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int NibbleValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (const auto byte : data) {
    out.push_back(kHexDigits[(byte >> 4) & 0x0F]);
    out.push_back(kHexDigits[byte & 0x0F]);
  }
  return out;
}

std::string HexEncodePrefixed(std::span<const std::uint8_t> data) {
  return "0x" + HexEncode(data);
}

std::string_view StripHexPrefix(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  return hex;
}

bool IsHexDigits(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (NibbleValue(c) < 0) {
      return false;
    }
  }
  return true;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  hex = StripHexPrefix(hex);
  out->clear();
  if (hex.size() % 2 != 0) {
    return false;
  }
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = NibbleValue(hex[i]);
    const int lo = NibbleValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

}  // namespace autopay::util
