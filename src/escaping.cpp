#include <codestat/escaping.h>

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace codestat {

std::string EscapeJsonString(std::string_view value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"}, {'\r', "\\r"},
      {'\t', "\\t"}, {'\b', "\\b"},  {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
      continue;
    }
    const auto byte = static_cast<unsigned char>(character);
    if (byte < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x", byte);
      escaped.append(buffer);
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string FormatNumber(std::size_t value) {
  auto digits = std::to_string(value);
  for (auto position = static_cast<std::ptrdiff_t>(digits.size()) - 3;
       position > 0; position -= 3) {
    digits.insert(static_cast<std::size_t>(position), 1, ',');
  }
  return digits;
}

std::string FormatPercentage(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(1) << value << '%';
  return stream.str();
}

} // namespace codestat
