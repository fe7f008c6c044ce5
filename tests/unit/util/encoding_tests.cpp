#include <array>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "util/base64.hpp"
#include "util/decimal.hpp"
#include "util/hex.hpp"
#include "util/strings.hpp"

int main() {
  try {
    using namespace autopay;

    // RFC 4648 vectors.
    {
      const std::pair<std::string, std::string> vectors[] = {
          {"", ""},         {"f", "Zg=="},         {"fo", "Zm8="},
          {"foo", "Zm9v"},  {"foob", "Zm9vYg=="},  {"fooba", "Zm9vYmE="},
          {"foobar", "Zm9vYmFy"},
      };
      for (const auto& [plain, encoded] : vectors) {
        if (util::Base64Encode(plain) != encoded) {
          std::cerr << "Base64Encode mismatch for '" << plain << "'\n";
          return EXIT_FAILURE;
        }
        std::string decoded;
        if (!util::Base64DecodeToString(encoded, &decoded) || decoded != plain) {
          std::cerr << "Base64Decode mismatch for '" << encoded << "'\n";
          return EXIT_FAILURE;
        }
      }
    }

    // Lenient forms seen in compact tokens and wrapped headers.
    {
      std::string decoded;
      if (!util::Base64DecodeToString("Zm9vYg", &decoded) || decoded != "foob") {
        std::cerr << "Unpadded base64 rejected\n";
        return EXIT_FAILURE;
      }
      std::vector<std::uint8_t> bytes;
      if (!util::Base64Decode("-_8", &bytes) || bytes.size() != 2 || bytes[0] != 0xfb ||
          bytes[1] != 0xff) {
        std::cerr << "URL-safe alphabet not decoded\n";
        return EXIT_FAILURE;
      }
      if (!util::Base64DecodeToString("Zm9v\nYmFy", &decoded) || decoded != "foobar") {
        std::cerr << "Whitespace not ignored\n";
        return EXIT_FAILURE;
      }
      if (util::Base64Decode("Zm9v!", &bytes)) {
        std::cerr << "Invalid character accepted\n";
        return EXIT_FAILURE;
      }
      if (util::Base64Decode("Zg==Zg", &bytes)) {
        std::cerr << "Data after padding accepted\n";
        return EXIT_FAILURE;
      }
      if (util::Base64Decode("Zm9vY", &bytes)) {
        std::cerr << "Dangling sextet accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      std::vector<std::uint8_t> bytes;
      if (!util::HexDecode("0xDEADbeef", &bytes) || util::HexEncode(bytes) != "deadbeef" ||
          util::HexEncodePrefixed(bytes) != "0xdeadbeef") {
        std::cerr << "Hex round trip failed\n";
        return EXIT_FAILURE;
      }
      if (util::HexDecode("abc", &bytes) || util::HexDecode("zz", &bytes)) {
        std::cerr << "Malformed hex accepted\n";
        return EXIT_FAILURE;
      }
      if (util::IsHexDigits("") || !util::IsHexDigits("0aF")) {
        std::cerr << "IsHexDigits wrong\n";
        return EXIT_FAILURE;
      }
    }

    {
      if (!util::IsDecimalString("0") || util::IsDecimalString("") ||
          util::IsDecimalString("1.5") || util::IsDecimalString("-1")) {
        std::cerr << "IsDecimalString wrong\n";
        return EXIT_FAILURE;
      }
      if (util::NormalizeDecimal("000") != "0" || util::NormalizeDecimal("00120") != "120") {
        std::cerr << "NormalizeDecimal wrong\n";
        return EXIT_FAILURE;
      }
      if (util::HexToDecimal("0x2710").value_or("") != "10000" ||
          util::HexToDecimal("0x0").value_or("") != "0" ||
          util::HexToDecimal("ffffffffffffffffffffffff").value_or("") !=
              "79228162514264337593543950335" ||
          util::HexToDecimal("0xg1").has_value()) {
        std::cerr << "HexToDecimal wrong\n";
        return EXIT_FAILURE;
      }
      std::array<std::uint8_t, 32> word{};
      if (!util::DecimalToUint256("258", &word) || word[31] != 0x02 || word[30] != 0x01 ||
          word[29] != 0x00) {
        std::cerr << "DecimalToUint256 wrong\n";
        return EXIT_FAILURE;
      }
      const double units = util::AtomicToUnits("10000", 6);
      if (units < 0.00999 || units > 0.01001) {
        std::cerr << "AtomicToUnits wrong: " << units << "\n";
        return EXIT_FAILURE;
      }
      if (util::FormatUnits("12500000", 6) != "12.5" || util::FormatUnits("5", 6) != "0.000005" ||
          util::FormatUnits("0", 6) != "0" || util::FormatUnits("1000000", 6) != "1" ||
          util::FormatUnits("007", 0) != "7" || !util::FormatUnits("1.5", 6).empty()) {
        std::cerr << "FormatUnits wrong\n";
        return EXIT_FAILURE;
      }
    }

    {
      if (util::Trim("  x402 \r\n") != "x402" || util::ToLower("X-Payment") != "x-payment" ||
          !util::EqualsIgnoreCase("X402", "x402") ||
          !util::StartsWithIgnoreCase("Application/JSON; charset=utf-8", "application/json")) {
        std::cerr << "String helpers wrong\n";
        return EXIT_FAILURE;
      }
      if (!util::ParseBool("") || !util::ParseBool("Yes") || util::ParseBool("off")) {
        std::cerr << "ParseBool wrong\n";
        return EXIT_FAILURE;
      }
      bool threw = false;
      try {
        util::ParseBool("maybe");
      } catch (const std::runtime_error&) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "ParseBool accepted garbage\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "encoding_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
