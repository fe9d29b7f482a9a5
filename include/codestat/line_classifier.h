#pragma once

#include <codestat/language_registry.h>
#include <codestat/models.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codestat {

bool StartsWithSingleLineMarker(std::string_view stripped_line,
                                const CommentSyntax &syntax);

// Counts lines that hold a comment. Blank lines are never counted.
std::size_t CountCommentLines(const std::vector<std::string> &lines,
                              const CommentSyntax &syntax);

// Only the single-line markers are honoured.
std::size_t CountSingleLineComments(const std::vector<std::string> &lines,
                                    const CommentSyntax &syntax);

LineCounts ClassifyLines(const std::vector<std::string> &lines,
                         const CommentSyntax &syntax);

} // namespace codestat
