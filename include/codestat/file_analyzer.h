#pragma once

#include <codestat/language_registry.h>
#include <codestat/logging.h>
#include <codestat/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace codestat {

struct GenericClassifier {
  std::string language;
};

struct PythonAnalyzer {};

struct MarkdownAnalyzer {};

using FileAnalyzer =
    std::variant<GenericClassifier, PythonAnalyzer, MarkdownAnalyzer>;

// Python wins over Markdown, which wins over the generic classifier. Files
// whose extension the registry does not know are not claimed.
std::optional<FileAnalyzer> SelectAnalyzer(const LanguageRegistry &registry,
                                           const std::filesystem::path &path);

FileStatistics AnalyzeFile(const FileAnalyzer &analyzer,
                           const std::filesystem::path &path,
                           const LanguageRegistry &registry,
                           const std::shared_ptr<Logger> &logger);

} // namespace codestat
