#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace codestat {

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string EscapeJsonString(std::string_view value);

// Groups digits in threes: 1234567 -> "1,234,567".
std::string FormatNumber(std::size_t value);

// One decimal place with a trailing percent sign: 72.46 -> "72.5%".
std::string FormatPercentage(double value);

} // namespace codestat
