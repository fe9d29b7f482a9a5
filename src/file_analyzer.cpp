#include <codestat/file_analyzer.h>
#include <codestat/line_classifier.h>
#include <codestat/line_reader.h>
#include <codestat/markdown_analyzer.h>
#include <codestat/python_analyzer.h>

namespace codestat {
namespace {

class AnalyzerVisitor {
public:
  AnalyzerVisitor(const std::filesystem::path &path,
                  const LanguageRegistry &registry,
                  const std::shared_ptr<Logger> &logger)
      : path_(path), registry_(registry), logger_(logger) {}

  FileStatistics operator()(const GenericClassifier &generic) const {
    const auto source = ReadSourceLines(path_, logger_);
    return FileStatistics(
        path_, generic.language,
        ClassifyLines(source.lines, registry_.SyntaxFor(generic.language)));
  }

  FileStatistics operator()(const PythonAnalyzer &) const {
    return AnalyzePythonFile(path_, registry_, logger_);
  }

  FileStatistics operator()(const MarkdownAnalyzer &) const {
    return AnalyzeMarkdownFile(path_, logger_);
  }

private:
  const std::filesystem::path &path_;
  const LanguageRegistry &registry_;
  const std::shared_ptr<Logger> &logger_;
};

} // namespace

std::optional<FileAnalyzer> SelectAnalyzer(const LanguageRegistry &registry,
                                           const std::filesystem::path &path) {
  const auto &language = registry.LanguageForPath(path);
  if (language == "Python") {
    return FileAnalyzer{PythonAnalyzer{}};
  }
  if (language == "Markdown") {
    return FileAnalyzer{MarkdownAnalyzer{}};
  }
  if (language == kUnknownLanguage) {
    return std::nullopt;
  }
  return FileAnalyzer{GenericClassifier{language}};
}

FileStatistics AnalyzeFile(const FileAnalyzer &analyzer,
                           const std::filesystem::path &path,
                           const LanguageRegistry &registry,
                           const std::shared_ptr<Logger> &logger) {
  return std::visit(AnalyzerVisitor(path, registry, logger), analyzer);
}

} // namespace codestat
