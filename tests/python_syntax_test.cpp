#include <codestat/python_syntax.h>

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace codestat {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

PythonSyntax Parse(const std::string &source) {
  const auto syntax = ParsePythonSyntax(source);
  EXPECT_TRUE(syntax.has_value());
  return syntax.value_or(PythonSyntax{});
}

TEST(PythonSyntaxTest, CountsDefinitionsInEveryScope) {
  const auto syntax = Parse("import functools\n"
                            "\n"
                            "class Outer:\n"
                            "    class Inner:\n"
                            "        def method(self):\n"
                            "            def helper():\n"
                            "                return lambda: 1\n"
                            "            return helper\n"
                            "\n"
                            "@functools.cache\n"
                            "async def fetch():\n"
                            "    pass\n");

  EXPECT_FALSE(syntax.has_errors);
  EXPECT_EQ(2u, syntax.metadata.num_classes);
  EXPECT_EQ(3u, syntax.metadata.num_functions);
  EXPECT_FALSE(syntax.metadata.has_docstring);
}

TEST(PythonSyntaxTest, CommentLinesAreDistinctRows) {
  const auto syntax = Parse("# first\n"
                            "x = 1  # trailing\n"
                            "text = '''\n"
                            "# inside a string\n"
                            "'''\n"
                            "    # indented\n");

  EXPECT_THAT(syntax.comment_lines, ElementsAre(1u, 2u, 6u));
}

TEST(PythonSyntaxTest, DocstringMayFollowComments) {
  EXPECT_TRUE(Parse("#!/usr/bin/env python\n\"\"\"Tool.\"\"\"\n")
                  .metadata.has_docstring);
}

TEST(PythonSyntaxTest, ParenthesizedAndConcatenatedDocstrings) {
  EXPECT_TRUE(Parse("(\"Module.\")\n").metadata.has_docstring);
  EXPECT_TRUE(Parse("\"Part one. \" \"Part two.\"\n").metadata.has_docstring);
  EXPECT_TRUE(Parse("u'Unicode prefix.'\n").metadata.has_docstring);
}

TEST(PythonSyntaxTest, BytesAndFStringsAreNotDocstrings) {
  EXPECT_FALSE(Parse("b'raw bytes'\n").metadata.has_docstring);
  EXPECT_FALSE(Parse("f'{1}'\n").metadata.has_docstring);
  EXPECT_FALSE(Parse("'a' + 'b'\n").metadata.has_docstring);
  EXPECT_FALSE(Parse("x = 'doc'\n").metadata.has_docstring);
}

TEST(PythonSyntaxTest, ErrorsResetMetadataButKeepComments) {
  const auto syntax = Parse("'''Doc.'''\n"
                            "# note\n"
                            "class A:\n"
                            "    def f(self:\n");

  EXPECT_TRUE(syntax.has_errors);
  EXPECT_EQ(PythonMetadata{}, syntax.metadata);
  EXPECT_THAT(syntax.comment_lines, ElementsAre(2u));
}

TEST(PythonSyntaxTest, ExecStatementIsAnError) {
  EXPECT_TRUE(Parse("exec \"x = 1\"\n").has_errors);
}

TEST(PythonSyntaxTest, EmptySourceHasNothing) {
  const auto syntax = Parse("");

  EXPECT_FALSE(syntax.has_errors);
  EXPECT_EQ(PythonMetadata{}, syntax.metadata);
  EXPECT_THAT(syntax.comment_lines, IsEmpty());
}

TEST(PythonSyntaxTest, DeeplyNestedExpressionsAreWalked) {
  std::string expression = "total = 1";
  for (int i = 0; i < 5000; ++i) {
    expression += " + 1";
  }

  const auto syntax = Parse(expression + "\n");

  EXPECT_FALSE(syntax.has_errors);
  EXPECT_EQ(0u, syntax.metadata.num_functions);
}

} // namespace
} // namespace codestat
