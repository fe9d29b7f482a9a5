#include <codestat/models.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace codestat {
namespace {

template <typename Selector>
std::size_t SumRecursively(const DirectoryStatistics &directory,
                           Selector selector) {
  std::size_t total = 0;
  for (const auto &file : directory.files) {
    total += selector(file);
  }
  for (const auto &subdirectory : directory.subdirectories) {
    total += SumRecursively(subdirectory, selector);
  }
  return total;
}

} // namespace

double Percentage(std::size_t part, std::size_t total) {
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(part) / static_cast<double>(total) * 100.0;
}

std::size_t MarkdownMetadata::HeadingsAtLevel(int level) const {
  if (level < 1 || level > static_cast<int>(headings_by_level.size())) {
    return 0;
  }
  return headings_by_level[static_cast<std::size_t>(level - 1)];
}

FileStatistics::FileStatistics(std::filesystem::path path,
                               std::string language, LineCounts counts,
                               std::optional<LanguageMetadata> metadata)
    : path_(std::move(path)), language_(std::move(language)),
      total_lines_(counts.total), comment_lines_(counts.comment),
      blank_lines_(counts.blank), metadata_(std::move(metadata)) {
  const auto accounted = counts.blank + counts.comment;
  code_lines_ = accounted > counts.total ? 0 : counts.total - accounted;
}

const PythonMetadata *FileStatistics::python() const {
  if (!metadata_) {
    return nullptr;
  }
  return std::get_if<PythonMetadata>(&*metadata_);
}

const MarkdownMetadata *FileStatistics::markdown() const {
  if (!metadata_) {
    return nullptr;
  }
  return std::get_if<MarkdownMetadata>(&*metadata_);
}

std::string FileStatistics::Filename() const {
  return path_.filename().string();
}

double FileStatistics::CodePercentage() const {
  return Percentage(code_lines_, total_lines_);
}

double FileStatistics::CommentPercentage() const {
  return Percentage(comment_lines_, total_lines_);
}

double FileStatistics::BlankPercentage() const {
  return Percentage(blank_lines_, total_lines_);
}

std::string FileStatistics::Describe() const {
  std::ostringstream stream;
  stream << Filename() << ": " << total_lines_ << " lines (" << code_lines_
         << " code, " << comment_lines_ << " comments, " << blank_lines_
         << " blank)";
  return stream.str();
}

std::string DirectoryStatistics::Name() const {
  auto name = path.filename().string();
  if (name.empty()) {
    return path.string();
  }
  return name;
}

std::size_t DirectoryStatistics::TotalFiles() const {
  auto count = files.size();
  for (const auto &subdirectory : subdirectories) {
    count += subdirectory.TotalFiles();
  }
  return count;
}

std::size_t DirectoryStatistics::TotalLines() const {
  return SumRecursively(
      *this, [](const FileStatistics &file) { return file.total_lines(); });
}

std::size_t DirectoryStatistics::TotalCodeLines() const {
  return SumRecursively(
      *this, [](const FileStatistics &file) { return file.code_lines(); });
}

std::size_t DirectoryStatistics::TotalCommentLines() const {
  return SumRecursively(
      *this, [](const FileStatistics &file) { return file.comment_lines(); });
}

std::size_t DirectoryStatistics::TotalBlankLines() const {
  return SumRecursively(
      *this, [](const FileStatistics &file) { return file.blank_lines(); });
}

double DirectoryStatistics::CodePercentage() const {
  return Percentage(TotalCodeLines(), TotalLines());
}

double DirectoryStatistics::CommentPercentage() const {
  return Percentage(TotalCommentLines(), TotalLines());
}

double DirectoryStatistics::BlankPercentage() const {
  return Percentage(TotalBlankLines(), TotalLines());
}

PythonSummary DirectoryStatistics::Python() const {
  PythonSummary summary;
  for (const auto &file : files) {
    const auto *metadata = file.python();
    if (metadata == nullptr) {
      continue;
    }
    ++summary.python_files;
    summary.num_classes += metadata->num_classes;
    summary.num_functions += metadata->num_functions;
    if (metadata->has_docstring) {
      ++summary.files_with_docstring;
    }
  }
  for (const auto &subdirectory : subdirectories) {
    const auto nested = subdirectory.Python();
    summary.python_files += nested.python_files;
    summary.num_classes += nested.num_classes;
    summary.num_functions += nested.num_functions;
    summary.files_with_docstring += nested.files_with_docstring;
  }
  return summary;
}

void DirectoryStatistics::SortFilesBySize() {
  std::stable_sort(files.begin(), files.end(),
                   [](const FileStatistics &lhs, const FileStatistics &rhs) {
                     return lhs.total_lines() > rhs.total_lines();
                   });
  for (auto &subdirectory : subdirectories) {
    subdirectory.SortFilesBySize();
  }
}

std::string DirectoryStatistics::Describe() const {
  std::ostringstream stream;
  stream << Name() << ": " << TotalFiles() << " files, " << TotalLines()
         << " lines (" << TotalCodeLines() << " code, " << TotalCommentLines()
         << " comments, " << TotalBlankLines() << " blank)";
  return stream.str();
}

} // namespace codestat
