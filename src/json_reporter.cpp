#include <codestat/escaping.h>
#include <codestat/json_reporter.h>

#include <iomanip>
#include <sstream>

namespace codestat {
namespace {

std::string Quoted(std::string_view value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string FormatRatio(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

std::string BuildPythonJson(const PythonMetadata &python) {
  std::ostringstream json;
  json << "{\"has_docstring\": " << (python.has_docstring ? "true" : "false")
       << ", \"num_classes\": " << python.num_classes
       << ", \"num_functions\": " << python.num_functions << "}";
  return json.str();
}

std::string BuildMarkdownJson(const MarkdownMetadata &markdown) {
  std::ostringstream json;
  json << "{\"headings_by_level\": {";
  for (int level = 1; level <= 6; ++level) {
    if (level > 1) {
      json << ", ";
    }
    json << "\"" << level << "\": " << markdown.HeadingsAtLevel(level);
  }
  json << "}, \"num_headings\": " << markdown.num_headings
       << ", \"num_links\": " << markdown.num_links
       << ", \"num_images\": " << markdown.num_images
       << ", \"num_code_blocks\": " << markdown.num_code_blocks
       << ", \"num_tables\": " << markdown.num_tables << "}";
  return json.str();
}

std::string BuildFileJson(const FileStatistics &file) {
  std::ostringstream json;
  json << "{\"name\": " << Quoted(file.Filename())
       << ", \"path\": " << Quoted(file.path().generic_string())
       << ", \"language\": " << Quoted(file.language())
       << ", \"total_lines\": " << file.total_lines()
       << ", \"code_lines\": " << file.code_lines()
       << ", \"comment_lines\": " << file.comment_lines()
       << ", \"blank_lines\": " << file.blank_lines();
  if (const auto *python = file.python()) {
    json << ", \"python\": " << BuildPythonJson(*python);
  }
  if (const auto *markdown = file.markdown()) {
    json << ", \"markdown\": " << BuildMarkdownJson(*markdown);
  }
  json << "}";
  return json.str();
}

std::string BuildDirectoryJson(const DirectoryStatistics &directory) {
  std::ostringstream json;
  json << "{\"name\": " << Quoted(directory.Name())
       << ", \"path\": " << Quoted(directory.path.generic_string())
       << ", \"total_files\": " << directory.TotalFiles()
       << ", \"total_lines\": " << directory.TotalLines()
       << ", \"code_lines\": " << directory.TotalCodeLines()
       << ", \"comment_lines\": " << directory.TotalCommentLines()
       << ", \"blank_lines\": " << directory.TotalBlankLines()
       << ", \"files\": [";
  for (std::size_t i = 0; i < directory.files.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << BuildFileJson(directory.files[i]);
  }
  json << "], \"subdirectories\": [";
  for (std::size_t i = 0; i < directory.subdirectories.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << BuildDirectoryJson(directory.subdirectories[i]);
  }
  json << "]}";
  return json.str();
}

std::string BuildSummaryJson(const DirectoryStatistics &statistics) {
  const auto python = statistics.Python();
  std::ostringstream json;
  json << "{\"total_files\": " << statistics.TotalFiles()
       << ", \"total_lines\": " << statistics.TotalLines()
       << ", \"code_lines\": " << statistics.TotalCodeLines()
       << ", \"comment_lines\": " << statistics.TotalCommentLines()
       << ", \"blank_lines\": " << statistics.TotalBlankLines()
       << ", \"code_percentage\": " << FormatRatio(statistics.CodePercentage())
       << ", \"comment_percentage\": "
       << FormatRatio(statistics.CommentPercentage())
       << ", \"blank_percentage\": "
       << FormatRatio(statistics.BlankPercentage())
       << ", \"python\": {\"files\": " << python.python_files
       << ", \"classes\": " << python.num_classes
       << ", \"functions\": " << python.num_functions
       << ", \"files_with_docstring\": " << python.files_with_docstring
       << "}}";
  return json.str();
}

} // namespace

std::string JsonReporter::Render(const DirectoryStatistics &statistics,
                                 const ReportContext &context) const {
  std::ostringstream json;
  json << "{\"project\": " << Quoted(context.project_path.generic_string())
       << ", \"summary\": " << BuildSummaryJson(statistics)
       << ", \"tree\": " << BuildDirectoryJson(statistics) << "}\n";
  return json.str();
}

} // namespace codestat
