#include <codestat/line_reader.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace codestat {
namespace {

// ASCII whitespace plus the 0x1C-0x1F separators.
bool IsSpace(char character) {
  return character == ' ' || (character >= '\t' && character <= '\r') ||
         (character >= '\x1C' && character <= '\x1F');
}

// UTF-8 encodings of the non-ASCII code points with the Unicode White_Space
// property.
const std::vector<std::string> &UnicodeSpaces() {
  static const std::vector<std::string> spaces = [] {
    std::vector<std::string> encoded = {
        "\xC2\x85",     // U+0085 next line
        "\xC2\xA0",     // U+00A0 no-break space
        "\xE1\x9A\x80", // U+1680 ogham space mark
        "\xE2\x80\xA8", // U+2028 line separator
        "\xE2\x80\xA9", // U+2029 paragraph separator
        "\xE2\x80\xAF", // U+202F narrow no-break space
        "\xE2\x81\x9F", // U+205F medium mathematical space
        "\xE3\x80\x80", // U+3000 ideographic space
    };
    // U+2000 to U+200A
    for (char last = '\x80'; last != '\x8B'; ++last) {
      encoded.push_back(std::string("\xE2\x80") + last);
    }
    return encoded;
  }();
  return spaces;
}

std::size_t LeadingSpaceLength(std::string_view line) {
  if (line.empty()) {
    return 0;
  }
  if (IsSpace(line.front())) {
    return 1;
  }
  for (const auto &space : UnicodeSpaces()) {
    if (line.substr(0, space.size()) == space) {
      return space.size();
    }
  }
  return 0;
}

std::size_t TrailingSpaceLength(std::string_view line) {
  if (line.empty()) {
    return 0;
  }
  if (IsSpace(line.back())) {
    return 1;
  }
  for (const auto &space : UnicodeSpaces()) {
    if (line.size() >= space.size() &&
        line.substr(line.size() - space.size()) == space) {
      return space.size();
    }
  }
  return 0;
}

bool IsContinuationByte(unsigned char byte) { return (byte & 0xC0) == 0x80; }

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

} // namespace

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::string current;
  bool pending = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto character = text[i];
    if (character == '\n' || character == '\r') {
      lines.push_back(std::move(current));
      current.clear();
      pending = false;
      if (character == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    current.push_back(character);
    pending = true;
  }
  if (pending) {
    lines.push_back(std::move(current));
  }
  return lines;
}

bool IsValidUtf8(std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t length = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
      code_point = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      code_point = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > bytes.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto byte = static_cast<unsigned char>(bytes[i + k]);
      if (!IsContinuationByte(byte)) {
        return false;
      }
      code_point = (code_point << 6) | (byte & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

std::string Latin1ToUtf8(std::string_view bytes) {
  std::string converted;
  converted.reserve(bytes.size());
  for (const auto character : bytes) {
    const auto byte = static_cast<unsigned char>(character);
    if (byte < 0x80) {
      converted.push_back(character);
      continue;
    }
    converted.push_back(static_cast<char>(0xC0 | (byte >> 6)));
    converted.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
  }
  return converted;
}

SourceText DecodeSource(std::string bytes, const std::shared_ptr<Logger> &logger,
                        const std::filesystem::path &origin) {
  SourceText source;
  if (IsValidUtf8(bytes)) {
    std::string_view view(bytes);
    if (view.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
      view.remove_prefix(kUtf8Bom.size());
    }
    source.lines = SplitLines(view);
    return source;
  }

  if (logger) {
    logger->Log(LogLevel::kDebug, events::kFileDecodedLatin1,
                {{"path", origin.string()}});
  }
  source.encoding = SourceEncoding::kLatin1;
  source.lines = SplitLines(Latin1ToUtf8(bytes));
  return source;
}

SourceText ReadSourceLines(const std::filesystem::path &path,
                           const std::shared_ptr<Logger> &logger) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    if (logger) {
      logger->Log(LogLevel::kWarn, events::kFileUnreadable,
                  {{"path", path.string()}});
    }
    SourceText unreadable;
    unreadable.readable = false;
    return unreadable;
  }

  std::ostringstream buffer;
  buffer << stream.rdbuf();
  if (stream.bad()) {
    if (logger) {
      logger->Log(LogLevel::kWarn, events::kFileUnreadable,
                  {{"path", path.string()}});
    }
    SourceText unreadable;
    unreadable.readable = false;
    return unreadable;
  }
  return DecodeSource(buffer.str(), logger, path);
}

std::string_view StripLeading(std::string_view line) {
  while (const auto length = LeadingSpaceLength(line)) {
    line.remove_prefix(length);
  }
  return line;
}

std::string_view Strip(std::string_view line) {
  line = StripLeading(line);
  while (const auto length = TrailingSpaceLength(line)) {
    line.remove_suffix(length);
  }
  return line;
}

bool IsBlank(std::string_view line) { return Strip(line).empty(); }

std::size_t CountBlankLines(const std::vector<std::string> &lines) {
  return static_cast<std::size_t>(
      std::count_if(lines.begin(), lines.end(),
                    [](const std::string &line) { return IsBlank(line); }));
}

} // namespace codestat
