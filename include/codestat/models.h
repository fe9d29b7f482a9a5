#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codestat {

inline constexpr const char *kUnknownLanguage = "Unknown";

struct PythonMetadata {
  bool has_docstring = false;
  std::size_t num_classes = 0;
  std::size_t num_functions = 0;

  bool operator==(const PythonMetadata &) const = default;
};

struct MarkdownMetadata {
  // Index 0 holds level 1 (#), index 5 holds level 6 (######).
  std::array<std::size_t, 6> headings_by_level{};
  std::size_t num_headings = 0;
  std::size_t num_links = 0;
  std::size_t num_images = 0;
  std::size_t num_code_blocks = 0;
  std::size_t num_tables = 0;

  std::size_t HeadingsAtLevel(int level) const;

  bool operator==(const MarkdownMetadata &) const = default;
};

using LanguageMetadata = std::variant<PythonMetadata, MarkdownMetadata>;

struct LineCounts {
  std::size_t total = 0;
  std::size_t blank = 0;
  std::size_t comment = 0;
};

class FileStatistics {
public:
  // Code lines are derived from the counts, clamped at zero.
  FileStatistics(std::filesystem::path path, std::string language,
                 LineCounts counts,
                 std::optional<LanguageMetadata> metadata = std::nullopt);

  const std::filesystem::path &path() const { return path_; }
  const std::string &language() const { return language_; }
  std::size_t total_lines() const { return total_lines_; }
  std::size_t code_lines() const { return code_lines_; }
  std::size_t comment_lines() const { return comment_lines_; }
  std::size_t blank_lines() const { return blank_lines_; }
  const std::optional<LanguageMetadata> &metadata() const { return metadata_; }

  const PythonMetadata *python() const;
  const MarkdownMetadata *markdown() const;

  std::string Filename() const;
  double CodePercentage() const;
  double CommentPercentage() const;
  double BlankPercentage() const;
  std::string Describe() const;

  bool operator==(const FileStatistics &) const = default;

private:
  std::filesystem::path path_;
  std::string language_;
  std::size_t total_lines_ = 0;
  std::size_t code_lines_ = 0;
  std::size_t comment_lines_ = 0;
  std::size_t blank_lines_ = 0;
  std::optional<LanguageMetadata> metadata_;
};

struct PythonSummary {
  std::size_t python_files = 0;
  std::size_t num_classes = 0;
  std::size_t num_functions = 0;
  std::size_t files_with_docstring = 0;
};

struct DirectoryStatistics {
  std::filesystem::path path;
  std::vector<FileStatistics> files;
  std::vector<DirectoryStatistics> subdirectories;

  std::string Name() const;

  std::size_t TotalFiles() const;
  std::size_t TotalLines() const;
  std::size_t TotalCodeLines() const;
  std::size_t TotalCommentLines() const;
  std::size_t TotalBlankLines() const;

  double CodePercentage() const;
  double CommentPercentage() const;
  double BlankPercentage() const;

  PythonSummary Python() const;

  // Stable: files with equal line counts keep their relative order.
  void SortFilesBySize();

  std::string Describe() const;
};

double Percentage(std::size_t part, std::size_t total);

} // namespace codestat
