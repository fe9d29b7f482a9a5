#include <codestat/console_reporter.h>
#include <codestat/escaping.h>

#include <sstream>

namespace codestat {
namespace {

const std::string kWideRule(60, '=');
const std::string kNarrowRule(40, '-');

std::string Indent(std::size_t depth) { return std::string(depth * 2, ' '); }

std::string DirectorySummary(const DirectoryStatistics &directory) {
  return "(" + std::to_string(directory.TotalFiles()) + " files, " +
         std::to_string(directory.TotalLines()) + " lines)";
}

void RenderDirectoryHeading(std::ostringstream &output,
                            const DirectoryStatistics &directory,
                            std::size_t depth, bool is_last) {
  if (depth == 0) {
    output << directory.Name() << "/ " << DirectorySummary(directory) << "\n";
    return;
  }
  output << Indent(depth - 1) << (is_last ? "`-- " : "|-- ")
         << directory.Name() << "/ " << DirectorySummary(directory) << "\n";
}

void RenderFile(std::ostringstream &output, const FileStatistics &file,
                std::size_t depth) {
  const auto prefix = Indent(depth);
  output << prefix << "|-- " << file.Filename() << "\n";
  output << prefix << "|     Lines: " << file.total_lines()
         << " | Code: " << file.code_lines()
         << " | Comments: " << file.comment_lines()
         << " | Blank: " << file.blank_lines() << "\n";

  if (const auto *python = file.python()) {
    output << prefix << "|     Python: Classes: " << python->num_classes
           << " | Functions: " << python->num_functions
           << " | Docstring: " << (python->has_docstring ? "yes" : "no")
           << "\n";
  } else {
    output << prefix << "|     Language: " << file.language() << "\n";
  }
  if (const auto *markdown = file.markdown()) {
    output << prefix << "|     Markdown: Headings: " << markdown->num_headings
           << " | Links: " << markdown->num_links
           << " | Images: " << markdown->num_images
           << " | Code blocks: " << markdown->num_code_blocks
           << " | Tables: " << markdown->num_tables << "\n";
  }
  output << prefix << "|\n";
}

void RenderTree(std::ostringstream &output,
                const DirectoryStatistics &directory, std::size_t depth,
                bool is_last, bool include_files) {
  RenderDirectoryHeading(output, directory, depth, is_last);
  if (include_files) {
    for (const auto &file : directory.files) {
      RenderFile(output, file, depth);
    }
  }
  for (std::size_t i = 0; i < directory.subdirectories.size(); ++i) {
    RenderTree(output, directory.subdirectories[i], depth + 1,
               i + 1 == directory.subdirectories.size(), include_files);
  }
  if (depth == 0) {
    output << "\n";
  }
}

void RenderHeader(std::ostringstream &output, const ReportContext &context) {
  output << "\nCodeStat - Project Analysis\n"
         << kWideRule << "\n"
         << "Project: " << context.project_path.string() << "\n"
         << kWideRule << "\n\n";
}

void RenderSummary(std::ostringstream &output,
                   const DirectoryStatistics &statistics) {
  output << "\n" << kWideRule << "\nSummary\n" << kWideRule << "\n\n";
  output << "Total Files: " << FormatNumber(statistics.TotalFiles()) << "\n";
  output << "Total Lines: " << FormatNumber(statistics.TotalLines()) << "\n";
  output << "  |-- Code: " << FormatNumber(statistics.TotalCodeLines()) << " ("
         << FormatPercentage(statistics.CodePercentage()) << ")\n";
  output << "  |-- Comments: " << FormatNumber(statistics.TotalCommentLines())
         << " (" << FormatPercentage(statistics.CommentPercentage()) << ")\n";
  output << "  `-- Blank: " << FormatNumber(statistics.TotalBlankLines())
         << " (" << FormatPercentage(statistics.BlankPercentage()) << ")\n\n";

  const auto python = statistics.Python();
  if (python.python_files > 0) {
    output << "Python Specifics:\n";
    output << "  |-- Files: " << python.python_files << "\n";
    output << "  |-- Classes: " << python.num_classes << "\n";
    output << "  |-- Functions: " << python.num_functions << "\n";
    output << "  `-- Files with Docstring: " << python.files_with_docstring
           << "\n\n";
  }
  output << kWideRule << "\n\n";
}

void RenderCompactSummary(std::ostringstream &output,
                          const DirectoryStatistics &statistics,
                          const ReportContext &context) {
  output << "\nCodeStat - Quick Summary\n" << kNarrowRule << "\n";
  output << "Project: " << context.project_path.string() << "\n";
  output << "Files: " << FormatNumber(statistics.TotalFiles())
         << " | Lines: " << FormatNumber(statistics.TotalLines()) << "\n";
  output << "Code: " << FormatPercentage(statistics.CodePercentage())
         << " | Comments: " << FormatPercentage(statistics.CommentPercentage())
         << " | Blank: " << FormatPercentage(statistics.BlankPercentage())
         << "\n";

  const auto python = statistics.Python();
  if (python.python_files > 0) {
    output << "Python: " << python.python_files << " files, "
           << python.num_classes << " classes, " << python.num_functions
           << " functions\n";
  }
  output << kNarrowRule << "\n\n";
}

} // namespace

ConsoleReporter::ConsoleReporter(bool verbose) : verbose_(verbose) {}

std::string ConsoleReporter::Render(const DirectoryStatistics &statistics,
                                    const ReportContext &context) const {
  std::ostringstream output;
  if (!verbose_) {
    RenderCompactSummary(output, statistics, context);
    return output.str();
  }
  RenderHeader(output, context);
  RenderTree(output, statistics, 0, true, true);
  RenderTree(output, statistics, 0, true, false);
  RenderSummary(output, statistics);
  return output.str();
}

} // namespace codestat
