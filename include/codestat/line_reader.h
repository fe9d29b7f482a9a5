#pragma once

#include <codestat/logging.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codestat {

enum class SourceEncoding { kUtf8, kLatin1 };

struct SourceText {
  std::vector<std::string> lines;
  SourceEncoding encoding = SourceEncoding::kUtf8;
  bool readable = true;
};

// Lines never carry their terminator. "\n", "\r\n" and "\r" all end a line,
// and a trailing terminator does not start an extra empty line.
std::vector<std::string> SplitLines(std::string_view text);

bool IsValidUtf8(std::string_view bytes);
std::string Latin1ToUtf8(std::string_view bytes);

// Unreadable files come back empty with readable == false.
SourceText DecodeSource(std::string bytes, const std::shared_ptr<Logger> &logger,
                        const std::filesystem::path &origin = {});
SourceText ReadSourceLines(const std::filesystem::path &path,
                           const std::shared_ptr<Logger> &logger = nullptr);

// Whitespace is the Unicode White_Space set, matched in UTF-8.
std::string_view StripLeading(std::string_view line);
std::string_view Strip(std::string_view line);
bool IsBlank(std::string_view line);
std::size_t CountBlankLines(const std::vector<std::string> &lines);

} // namespace codestat
