#include <codestat/language_registry.h>
#include <codestat/models.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace codestat {
namespace {

std::string ToLower(std::string_view value) {
  std::string lowered(value);
  std::transform(
      lowered.begin(), lowered.end(), lowered.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

const CommentDelimiters kCBlock{"/*", "*/"};
const CommentDelimiters kMarkupBlock{"<!--", "-->"};

} // namespace

std::string NormalizeExtension(std::string_view extension) {
  auto normalized = ToLower(extension);
  if (!normalized.empty() && normalized.front() != '.') {
    normalized.insert(normalized.begin(), '.');
  }
  return normalized;
}

std::string ExtensionOf(const std::filesystem::path &path) {
  const auto extension = path.filename().extension().string();
  if (extension == ".") {
    return "";
  }
  return ToLower(extension);
}

const std::vector<CommentStyle> &DefaultCommentStyles() {
  static const std::vector<CommentStyle> styles = {
      {"c_style",
       {"JavaScript", "TypeScript", "C", "C++", "C#", "Java", "Kotlin",
        "Scala", "Go", "Rust", "Swift", "Dart", "PHP", "Groovy"},
       {{"//"}, {kCBlock}}},
      {"hash_style",
       {"Python", "Ruby", "Shell", "Bash", "Zsh", "Fish", "Perl", "R", "YAML",
        "TOML", "Elixir"},
       {{"#"}, {}}},
      {"dash_style", {"SQL", "Lua", "Haskell"}, {{"--"}, {}}},
      {"markup_style", {"HTML", "XML"}, {{}, {kMarkupBlock}}},
      {"css_style", {"CSS", "SCSS", "Sass", "Less"}, {{}, {kCBlock}}},
  };
  return styles;
}

const std::unordered_map<std::string, std::string> &DefaultExtensionMap() {
  static const std::unordered_map<std::string, std::string> extensions = {
      // JavaScript / TypeScript
      {".js", "JavaScript"},
      {".jsx", "JavaScript"},
      {".mjs", "JavaScript"},
      {".cjs", "JavaScript"},
      {".ts", "TypeScript"},
      {".tsx", "TypeScript"},
      // Web
      {".html", "HTML"},
      {".htm", "HTML"},
      {".css", "CSS"},
      {".scss", "SCSS"},
      {".sass", "Sass"},
      {".less", "Less"},
      // C family
      {".c", "C"},
      {".h", "C"},
      {".cpp", "C++"},
      {".cc", "C++"},
      {".cxx", "C++"},
      {".hpp", "C++"},
      {".hh", "C++"},
      {".hxx", "C++"},
      {".cs", "C#"},
      // JVM
      {".java", "Java"},
      {".kt", "Kotlin"},
      {".kts", "Kotlin"},
      {".scala", "Scala"},
      {".groovy", "Groovy"},
      // Systems
      {".go", "Go"},
      {".rs", "Rust"},
      {".swift", "Swift"},
      // Scripting
      {".py", "Python"},
      {".pyw", "Python"},
      {".pyi", "Python"},
      {".rb", "Ruby"},
      {".php", "PHP"},
      {".pl", "Perl"},
      {".lua", "Lua"},
      {".sh", "Shell"},
      {".bash", "Bash"},
      {".zsh", "Zsh"},
      {".fish", "Fish"},
      // Data and config
      {".sql", "SQL"},
      {".json", "JSON"},
      {".yaml", "YAML"},
      {".yml", "YAML"},
      {".xml", "XML"},
      {".toml", "TOML"},
      // Documentation
      {".md", "Markdown"},
      {".markdown", "Markdown"},
      // Statistics
      {".r", "R"},
      // Apple
      {".m", "Objective-C"},
      {".mm", "Objective-C++"},
      // Other modern languages
      {".dart", "Dart"},
      {".ex", "Elixir"},
      {".exs", "Elixir"},
      {".erl", "Erlang"},
      {".hrl", "Erlang"},
      {".hs", "Haskell"},
      {".lhs", "Haskell"},
      // Editors
      {".vim", "VimScript"},
      {".el", "EmacsLisp"},
      // Lisp family
      {".clj", "Clojure"},
      {".cljs", "ClojureScript"},
      {".lisp", "CommonLisp"},
      {".scm", "Scheme"},
  };
  return extensions;
}

LanguageRegistry::LanguageRegistry()
    : LanguageRegistry(DefaultCommentStyles(), DefaultExtensionMap()) {}

LanguageRegistry::LanguageRegistry(
    const std::vector<CommentStyle> &styles,
    std::unordered_map<std::string, std::string> extensions)
    : unknown_language_(kUnknownLanguage) {
  for (auto &[extension, language] : extensions) {
    extension_to_language_.emplace(NormalizeExtension(extension),
                                   std::move(language));
  }
  for (const auto &style : styles) {
    for (const auto &language : style.languages) {
      language_to_syntax_[language] = style.syntax;
    }
  }
}

const std::string &
LanguageRegistry::LanguageForExtension(std::string_view extension) const {
  const auto found = extension_to_language_.find(ToLower(extension));
  if (found == extension_to_language_.end()) {
    return unknown_language_;
  }
  return found->second;
}

const std::string &
LanguageRegistry::LanguageForPath(const std::filesystem::path &path) const {
  return LanguageForExtension(ExtensionOf(path));
}

const CommentSyntax &
LanguageRegistry::SyntaxFor(const std::string &language) const {
  const auto found = language_to_syntax_.find(language);
  if (found == language_to_syntax_.end()) {
    return empty_syntax_;
  }
  return found->second;
}

bool LanguageRegistry::IsKnownExtension(std::string_view extension) const {
  return extension_to_language_.count(ToLower(extension)) > 0;
}

std::vector<std::string> LanguageRegistry::Extensions() const {
  std::vector<std::string> extensions;
  extensions.reserve(extension_to_language_.size());
  for (const auto &entry : extension_to_language_) {
    extensions.push_back(entry.first);
  }
  std::sort(extensions.begin(), extensions.end());
  return extensions;
}

} // namespace codestat
