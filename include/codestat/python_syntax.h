#pragma once

#include <codestat/models.h>

#include <cstddef>
#include <optional>
#include <set>
#include <string_view>

namespace codestat {

struct PythonSyntax {
  // True when the tree holds ERROR or MISSING nodes, or Python 2 only
  // statements such as `print "x"`.
  bool has_errors = false;
  // Default-initialized whenever has_errors is set.
  PythonMetadata metadata;
  // 1-based physical lines that hold a comment token.
  std::set<std::size_t> comment_lines;
};

// Parses source with tree-sitter-python. Returns std::nullopt when the parser
// could not produce a tree at all.
std::optional<PythonSyntax> ParsePythonSyntax(std::string_view source);

} // namespace codestat
