#include <codestat/markdown_analyzer.h>

#include <optional>
#include <string_view>

namespace codestat {
namespace {

constexpr const char *kMarkdownLanguage = "Markdown";
constexpr std::size_t kMaxHeadingLevel = 6;

// Next position of a character at or after a non-decreasing position.
// Answers are reused, so a whole line costs one pass per character.
class NextOccurrence {
public:
  NextOccurrence(std::string_view line, char target)
      : line_(line), target_(target) {}

  std::size_t From(std::size_t position) {
    if (!searched_ || (found_ != std::string_view::npos && found_ < position)) {
      found_ = line_.find(target_, position);
      searched_ = true;
    }
    return found_;
  }

private:
  std::string_view line_;
  char target_;
  bool searched_ = false;
  std::size_t found_ = std::string_view::npos;
};

struct BracketScanner {
  explicit BracketScanner(std::string_view text)
      : line(text), close_bracket(text, ']'), close_paren(text, ')') {}

  // Matches "[label](target)" at the bracket at open and returns the
  // position just past ')'. The label stops at the first ']', the target at
  // the first ')', and the target may not be empty.
  std::optional<std::size_t> Match(std::size_t open, bool allow_empty_label) {
    const auto label_end = close_bracket.From(open + 1);
    if (label_end == std::string_view::npos ||
        (!allow_empty_label && label_end == open + 1)) {
      return std::nullopt;
    }
    const auto target_open = label_end + 1;
    if (target_open >= line.size() || line[target_open] != '(') {
      return std::nullopt;
    }
    const auto target_end = close_paren.From(target_open + 1);
    if (target_end == std::string_view::npos ||
        target_end == target_open + 1) {
      return std::nullopt;
    }
    return target_end + 1;
  }

  std::string_view line;
  NextOccurrence close_bracket;
  NextOccurrence close_paren;
};

std::size_t CountImages(std::string_view line) {
  BracketScanner scanner(line);
  std::size_t images = 0;
  std::size_t position = 0;
  while ((position = line.find("![", position)) != std::string_view::npos) {
    if (const auto end = scanner.Match(position + 1, true)) {
      ++images;
      position = *end;
    } else {
      ++position;
    }
  }
  return images;
}

// Links are bracket groups not preceded by '!'. Matches never overlap.
std::size_t CountLinks(std::string_view line) {
  BracketScanner scanner(line);
  std::size_t links = 0;
  std::size_t position = 0;
  while ((position = line.find('[', position)) != std::string_view::npos) {
    if (position > 0 && line[position - 1] == '!') {
      ++position;
      continue;
    }
    if (const auto end = scanner.Match(position, false)) {
      ++links;
      position = *end;
    } else {
      ++position;
    }
  }
  return links;
}

// Level of an ATX heading: one to six '#' followed by whitespace.
std::optional<std::size_t> HeadingLevel(std::string_view line) {
  const auto content = StripLeading(line);
  const auto hashes = content.find_first_not_of('#');
  const auto level = hashes == std::string_view::npos ? content.size() : hashes;
  if (level == 0 || level > kMaxHeadingLevel || level == content.size()) {
    return std::nullopt;
  }
  const auto rest = content.substr(level);
  if (StripLeading(rest).size() == rest.size()) {
    return std::nullopt;
  }
  return level;
}

bool IsDividerCell(std::string_view cell) {
  cell = Strip(cell);
  if (!cell.empty() && cell.front() == ':') {
    cell.remove_prefix(1);
  }
  if (!cell.empty() && cell.back() == ':') {
    cell.remove_suffix(1);
  }
  return !cell.empty() && cell.find_first_not_of('-') == std::string_view::npos;
}

// A table divider row such as "| --- | :---: |" with at least two cells.
bool IsTableDivider(std::string_view line) {
  line = Strip(line);
  if (!line.empty() && line.front() == '|') {
    line.remove_prefix(1);
  }
  if (!line.empty() && line.back() == '|') {
    line.remove_suffix(1);
  }
  std::size_t cells = 0;
  while (true) {
    const auto pipe = line.find('|');
    if (!IsDividerCell(line.substr(0, pipe))) {
      return false;
    }
    ++cells;
    if (pipe == std::string_view::npos) {
      break;
    }
    line.remove_prefix(pipe + 1);
  }
  return cells >= 2;
}

bool IsFenceLine(std::string_view stripped) {
  return stripped.substr(0, 3) == "```";
}

} // namespace

MarkdownMetadata ScanMarkdown(const std::vector<std::string> &lines) {
  MarkdownMetadata metadata;
  bool in_fence = false;

  for (std::size_t index = 0; index < lines.size(); ++index) {
    const auto &line = lines[index];
    if (IsFenceLine(Strip(line))) {
      if (!in_fence) {
        ++metadata.num_code_blocks;
      }
      in_fence = !in_fence;
      continue;
    }
    if (in_fence) {
      continue;
    }

    if (const auto level = HeadingLevel(line)) {
      ++metadata.headings_by_level[*level - 1];
      ++metadata.num_headings;
    }

    metadata.num_images += CountImages(line);
    metadata.num_links += CountLinks(line);

    // The divider is looked up on the raw next line, fenced or not.
    if (line.find('|') != std::string::npos && index + 1 < lines.size()) {
      if (IsTableDivider(lines[index + 1])) {
        ++metadata.num_tables;
      }
    }
  }
  return metadata;
}

FileStatistics AnalyzeMarkdownSource(const std::filesystem::path &path,
                                     const SourceText &source) {
  LineCounts counts;
  counts.total = source.lines.size();
  counts.blank = CountBlankLines(source.lines);
  return FileStatistics(path, kMarkdownLanguage, counts,
                        ScanMarkdown(source.lines));
}

FileStatistics AnalyzeMarkdownFile(const std::filesystem::path &path,
                                   const std::shared_ptr<Logger> &logger) {
  return AnalyzeMarkdownSource(path, ReadSourceLines(path, logger));
}

} // namespace codestat
