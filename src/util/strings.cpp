#include "util/strings.hpp"

#include <cctype>
#include <stdexcept>

namespace autopay::util {

std::string ToLower(std::string_view input) {
  std::string lower;
  lower.reserve(input.size());
  for (char c : input) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lower;
}

std::string Trim(std::string_view input) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const auto first = input.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(kWhitespace);
  return std::string(input.substr(first, last - first + 1));
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && EqualsIgnoreCase(text.substr(0, prefix.size()), prefix);
}

bool ParseBool(const std::string& value) {
  const std::string lower = ToLower(value);
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

}  // namespace autopay::util
