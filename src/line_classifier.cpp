#include <codestat/line_classifier.h>
#include <codestat/line_reader.h>

#include <algorithm>

namespace codestat {
namespace {

enum class ScanState { kCode, kInComment };

const CommentDelimiters *FindOpeningDelimiter(std::string_view line,
                                              const CommentSyntax &syntax) {
  const auto found = std::find_if(
      syntax.multi_line.begin(), syntax.multi_line.end(),
      [&](const CommentDelimiters &delimiters) {
        return line.find(delimiters.start) != std::string_view::npos;
      });
  if (found == syntax.multi_line.end()) {
    return nullptr;
  }
  return &*found;
}

} // namespace

bool StartsWithSingleLineMarker(std::string_view stripped_line,
                                const CommentSyntax &syntax) {
  return std::any_of(syntax.single_line.begin(), syntax.single_line.end(),
                     [&](const std::string &marker) {
                       return stripped_line.substr(0, marker.size()) == marker;
                     });
}

std::size_t CountCommentLines(const std::vector<std::string> &lines,
                              const CommentSyntax &syntax) {
  std::size_t comment_lines = 0;
  auto state = ScanState::kCode;
  std::string closing_marker;

  for (const auto &line : lines) {
    const auto stripped = Strip(line);
    if (stripped.empty()) {
      continue;
    }

    if (state == ScanState::kInComment) {
      ++comment_lines;
      if (stripped.find(closing_marker) != std::string_view::npos) {
        state = ScanState::kCode;
        closing_marker.clear();
      }
      continue;
    }

    if (syntax.SupportsMultiLine()) {
      if (const auto *opening = FindOpeningDelimiter(stripped, syntax)) {
        ++comment_lines;
        if (stripped.find(opening->end) == std::string_view::npos) {
          state = ScanState::kInComment;
          closing_marker = opening->end;
        }
        continue;
      }
    }

    if (StartsWithSingleLineMarker(stripped, syntax)) {
      ++comment_lines;
    }
  }
  return comment_lines;
}

std::size_t CountSingleLineComments(const std::vector<std::string> &lines,
                                    const CommentSyntax &syntax) {
  return static_cast<std::size_t>(
      std::count_if(lines.begin(), lines.end(), [&](const std::string &line) {
        const auto stripped = Strip(line);
        return !stripped.empty() && StartsWithSingleLineMarker(stripped, syntax);
      }));
}

LineCounts ClassifyLines(const std::vector<std::string> &lines,
                         const CommentSyntax &syntax) {
  LineCounts counts;
  counts.total = lines.size();
  counts.blank = CountBlankLines(lines);
  counts.comment = CountCommentLines(lines, syntax);
  return counts;
}

} // namespace codestat
