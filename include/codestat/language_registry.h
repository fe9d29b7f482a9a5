#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codestat {

struct CommentDelimiters {
  std::string start;
  std::string end;
};

struct CommentSyntax {
  std::vector<std::string> single_line;
  std::vector<CommentDelimiters> multi_line;

  bool SupportsSingleLine() const { return !single_line.empty(); }
  bool SupportsMultiLine() const { return !multi_line.empty(); }
};

struct CommentStyle {
  std::string name;
  std::vector<std::string> languages;
  CommentSyntax syntax;
};

// Immutable after construction. Build one per run and pass it by reference.
class LanguageRegistry {
public:
  LanguageRegistry();
  LanguageRegistry(const std::vector<CommentStyle> &styles,
                   std::unordered_map<std::string, std::string> extensions);

  // Extension includes the leading dot; matching ignores case.
  const std::string &LanguageForExtension(std::string_view extension) const;
  const std::string &LanguageForPath(const std::filesystem::path &path) const;
  const CommentSyntax &SyntaxFor(const std::string &language) const;

  bool IsKnownExtension(std::string_view extension) const;
  std::vector<std::string> Extensions() const;

private:
  std::unordered_map<std::string, std::string> extension_to_language_;
  std::unordered_map<std::string, CommentSyntax> language_to_syntax_;
  std::string unknown_language_;
  CommentSyntax empty_syntax_;
};

const std::vector<CommentStyle> &DefaultCommentStyles();
const std::unordered_map<std::string, std::string> &DefaultExtensionMap();

// Lowercases and prefixes a dot when missing: "PY" -> ".py".
std::string NormalizeExtension(std::string_view extension);
// Lowercased extension of the final path component, "" when it has none.
std::string ExtensionOf(const std::filesystem::path &path);

} // namespace codestat
