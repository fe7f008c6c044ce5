#pragma once

#include <string>
#include <string_view>

namespace autopay::util {

std::string ToLower(std::string_view input);
std::string Trim(std::string_view input);
bool EqualsIgnoreCase(std::string_view a, std::string_view b);
bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix);

// "1/true/yes/on" and "0/false/no/off"; an empty value means true (a bare
// flag in a config file). Throws std::runtime_error otherwise.
bool ParseBool(const std::string& value);

}  // namespace autopay::util
