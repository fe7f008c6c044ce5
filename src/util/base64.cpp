#include "util/base64.hpp"

#include <array>
#include <cctype>

namespace autopay::util {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int kInvalid = -1;
constexpr int kPadding = -2;

constexpr std::array<int, 256> BuildDecodeTable() {
  std::array<int, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
  }
  // URL-safe variants map onto the same sextets.
  table[static_cast<unsigned char>('-')] = 62;
  table[static_cast<unsigned char>('_')] = 63;
  table[static_cast<unsigned char>('=')] = kPadding;
  return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

}  // namespace

std::string Base64Encode(std::span<const std::uint8_t> input) {
  std::string encoded;
  encoded.reserve(((input.size() + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                                 (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                                 static_cast<std::uint32_t>(input[i + 2]);
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3f]);
    encoded.push_back(kAlphabet[(triple >> 6) & 0x3f]);
    encoded.push_back(kAlphabet[triple & 0x3f]);
  }
  const std::size_t rest = input.size() - i;
  if (rest == 1) {
    const std::uint32_t v = static_cast<std::uint32_t>(input[i]) << 16;
    encoded.push_back(kAlphabet[(v >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(v >> 12) & 0x3f]);
    encoded.append("==");
  } else if (rest == 2) {
    const std::uint32_t v = (static_cast<std::uint32_t>(input[i]) << 16) |
                            (static_cast<std::uint32_t>(input[i + 1]) << 8);
    encoded.push_back(kAlphabet[(v >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(v >> 12) & 0x3f]);
    encoded.push_back(kAlphabet[(v >> 6) & 0x3f]);
    encoded.push_back('=');
  }
  return encoded;
}

std::string Base64Encode(std::string_view input) {
  return Base64Encode(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(input.data()), input.size()));
}

bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  out->reserve((input.size() * 3) / 4);
  std::uint32_t acc = 0;
  int bits = 0;
  std::size_t sextets = 0;
  bool saw_padding = false;

  for (unsigned char c : input) {
    if (std::isspace(c)) {
      continue;
    }
    const int decoded = kDecodeTable[c];
    if (decoded == kInvalid) {
      out->clear();
      return false;
    }
    if (decoded == kPadding) {
      saw_padding = true;
      continue;
    }
    if (saw_padding) {
      out->clear();
      return false;
    }
    acc = (acc << 6) | static_cast<std::uint32_t>(decoded);
    bits += 6;
    ++sextets;
    if (bits >= 8) {
      bits -= 8;
      out->push_back(static_cast<std::uint8_t>((acc >> bits) & 0xff));
    }
  }
  // A single dangling sextet cannot encode a byte.
  if (sextets % 4 == 1) {
    out->clear();
    return false;
  }
  return true;
}

bool Base64DecodeToString(std::string_view input, std::string* out) {
  if (!out) {
    return false;
  }
  std::vector<std::uint8_t> bytes;
  if (!Base64Decode(input, &bytes)) {
    return false;
  }
  out->assign(bytes.begin(), bytes.end());
  return true;
}

}  // namespace autopay::util
