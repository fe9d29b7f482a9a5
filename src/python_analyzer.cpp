#include <codestat/line_classifier.h>
#include <codestat/python_analyzer.h>
#include <codestat/python_syntax.h>

#include <string>

namespace codestat {
namespace {

constexpr const char *kPythonLanguage = "Python";

std::string JoinLines(const std::vector<std::string> &lines) {
  std::string text;
  for (const auto &line : lines) {
    text += line;
    text += '\n';
  }
  return text;
}

} // namespace

FileStatistics AnalyzePythonSource(const std::filesystem::path &path,
                                   const SourceText &source,
                                   const LanguageRegistry &registry,
                                   const std::shared_ptr<Logger> &logger) {
  const auto active_logger = EnsureLogger(logger);
  LineCounts counts;
  counts.total = source.lines.size();
  if (counts.total == 0) {
    return FileStatistics(path, kPythonLanguage, counts, PythonMetadata{});
  }
  counts.blank = CountBlankLines(source.lines);

  const auto syntax = ParsePythonSyntax(JoinLines(source.lines));
  if (!syntax) {
    active_logger->Log(LogLevel::kDebug, events::kPythonParseUnavailable,
                       {{"path", path.string()}});
    counts.comment = CountSingleLineComments(
        source.lines, registry.SyntaxFor(kPythonLanguage));
    return FileStatistics(path, kPythonLanguage, counts, PythonMetadata{});
  }

  counts.comment = syntax->comment_lines.size();
  PythonMetadata metadata;
  if (syntax->has_errors) {
    active_logger->Log(LogLevel::kDebug, events::kPythonParseFailed,
                       {{"path", path.string()},
                        {"reason", "syntax error"}});
  } else if (source.encoding != SourceEncoding::kUtf8) {
    active_logger->Log(LogLevel::kDebug, events::kPythonParseFailed,
                       {{"path", path.string()},
                        {"reason", "source is not valid UTF-8"}});
  } else {
    metadata = syntax->metadata;
  }
  return FileStatistics(path, kPythonLanguage, counts, metadata);
}

FileStatistics AnalyzePythonFile(const std::filesystem::path &path,
                                 const LanguageRegistry &registry,
                                 const std::shared_ptr<Logger> &logger) {
  return AnalyzePythonSource(path, ReadSourceLines(path, logger), registry,
                             logger);
}

} // namespace codestat
