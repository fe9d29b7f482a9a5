#include <codestat/python_syntax.h>

#include <cstdint>
#include <cstring>
#include <memory>

extern "C" {
#include <tree_sitter/api.h>

const TSLanguage *tree_sitter_python(void);
}

namespace codestat {
namespace {

using ParserHandle = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
using TreeHandle = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

bool IsType(TSNode node, const char *type) {
  return std::strcmp(ts_node_type(node), type) == 0;
}

// Python 3 rejects these even though the grammar accepts them.
bool IsLegacyStatement(TSNode node) {
  return IsType(node, "print_statement") || IsType(node, "exec_statement");
}

std::string_view NodeText(TSNode node, std::string_view source) {
  const auto start = ts_node_start_byte(node);
  const auto end = ts_node_end_byte(node);
  if (start >= end || end > source.size()) {
    return {};
  }
  return source.substr(start, end - start);
}

// Docstrings are plain string literals: no bytes prefix, no f-string.
bool IsPlainString(TSNode node, std::string_view source) {
  if (!IsType(node, "string")) {
    return false;
  }
  for (const auto character : NodeText(node, source)) {
    if (character == '"' || character == '\'') {
      return true;
    }
    if (character == 'b' || character == 'B' || character == 'f' ||
        character == 'F') {
      return false;
    }
  }
  return false;
}

bool IsStringLiteralExpression(TSNode node, std::string_view source) {
  while (IsType(node, "parenthesized_expression") &&
         ts_node_named_child_count(node) == 1) {
    node = ts_node_named_child(node, 0);
  }
  if (IsType(node, "concatenated_string")) {
    const auto count = ts_node_named_child_count(node);
    for (std::uint32_t i = 0; i < count; ++i) {
      const auto part = ts_node_named_child(node, i);
      if (!IsType(part, "comment") && !IsPlainString(part, source)) {
        return false;
      }
    }
    return count > 0;
  }
  return IsPlainString(node, source);
}

bool StartsWithDocstring(TSNode module, std::string_view source) {
  const auto count = ts_node_named_child_count(module);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto statement = ts_node_named_child(module, i);
    if (IsType(statement, "comment")) {
      continue;
    }
    if (!IsType(statement, "expression_statement") ||
        ts_node_named_child_count(statement) != 1) {
      return false;
    }
    return IsStringLiteralExpression(ts_node_named_child(statement, 0),
                                     source);
  }
  return false;
}

// Iterative pre-order walk; deeply nested expressions must not grow the
// native stack.
void CollectNodes(TSNode root, PythonSyntax &syntax) {
  TSTreeCursor cursor = ts_tree_cursor_new(root);
  bool descend = true;
  while (true) {
    if (descend) {
      const auto node = ts_tree_cursor_current_node(&cursor);
      if (IsType(node, "comment")) {
        syntax.comment_lines.insert(ts_node_start_point(node).row + 1);
      } else if (IsType(node, "class_definition")) {
        ++syntax.metadata.num_classes;
      } else if (IsType(node, "function_definition")) {
        ++syntax.metadata.num_functions;
      } else if (IsLegacyStatement(node)) {
        syntax.has_errors = true;
      }
      if (ts_tree_cursor_goto_first_child(&cursor)) {
        continue;
      }
    }
    if (ts_tree_cursor_goto_next_sibling(&cursor)) {
      descend = true;
      continue;
    }
    if (!ts_tree_cursor_goto_parent(&cursor)) {
      break;
    }
    descend = false;
  }
  ts_tree_cursor_delete(&cursor);
}

} // namespace

std::optional<PythonSyntax> ParsePythonSyntax(std::string_view source) {
  ParserHandle parser(ts_parser_new(), ts_parser_delete);
  if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
    return std::nullopt;
  }
  TreeHandle tree(ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                         static_cast<std::uint32_t>(
                                             source.size())),
                  ts_tree_delete);
  if (!tree) {
    return std::nullopt;
  }

  const auto root = ts_tree_root_node(tree.get());
  PythonSyntax syntax;
  syntax.has_errors = ts_node_has_error(root);
  CollectNodes(root, syntax);
  if (syntax.has_errors) {
    syntax.metadata = PythonMetadata{};
    return syntax;
  }
  syntax.metadata.has_docstring = StartsWithDocstring(root, source);
  return syntax;
}

} // namespace codestat
