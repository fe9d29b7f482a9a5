#include <codestat/line_reader.h>

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace codestat {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

TEST(SplitLinesTest, HandlesAllLineTerminators) {
  EXPECT_THAT(SplitLines("a\nb\r\nc\rd"), ElementsAre("a", "b", "c", "d"));
}

TEST(SplitLinesTest, TrailingTerminatorDoesNotAddALine) {
  EXPECT_THAT(SplitLines("a\nb\n"), ElementsAre("a", "b"));
  EXPECT_THAT(SplitLines("a\n\n"), ElementsAre("a", ""));
  EXPECT_THAT(SplitLines(""), IsEmpty());
  EXPECT_THAT(SplitLines("\n"), ElementsAre(""));
}

TEST(Utf8Test, ValidatesEncodings) {
  EXPECT_TRUE(IsValidUtf8("plain ascii"));
  EXPECT_TRUE(IsValidUtf8("caf\xC3\xA9 \xE2\x82\xAC"));
  EXPECT_FALSE(IsValidUtf8("caf\xE9"));
  EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));
  EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));
  EXPECT_FALSE(IsValidUtf8("\xE2\x82"));
}

TEST(Utf8Test, ConvertsLatin1) {
  EXPECT_EQ("caf\xC3\xA9", Latin1ToUtf8("caf\xE9"));
  EXPECT_EQ("abc", Latin1ToUtf8("abc"));
}

TEST(DecodeSourceTest, StripsByteOrderMark) {
  const auto source = DecodeSource("\xEF\xBB\xBFx = 1\n", nullptr);

  EXPECT_EQ(SourceEncoding::kUtf8, source.encoding);
  EXPECT_THAT(source.lines, ElementsAre("x = 1"));
}

TEST(DecodeSourceTest, FallsBackToLatin1AndLogs) {
  std::stringstream log;
  auto logger = MakeLogger({LogLevel::kDebug}, log);

  const auto source = DecodeSource("# caf\xE9\nx = 1\n", logger, "legacy.py");

  EXPECT_EQ(SourceEncoding::kLatin1, source.encoding);
  EXPECT_THAT(source.lines, ElementsAre("# caf\xC3\xA9", "x = 1"));
  EXPECT_THAT(log.str(), HasSubstr("file.decoded_latin1"));
  EXPECT_THAT(log.str(), HasSubstr("legacy.py"));
}

TEST(ReadSourceLinesTest, ReadsFileFromDisk) {
  test::TemporaryProject project;
  const auto path = project.AddFile("main.c", "int x;\r\n\r\nint y;\r\n");

  const auto source = ReadSourceLines(path);

  EXPECT_TRUE(source.readable);
  EXPECT_THAT(source.lines, ElementsAre("int x;", "", "int y;"));
}

TEST(ReadSourceLinesTest, MissingFileIsEmptyAndUnreadable) {
  test::TemporaryProject project;
  std::stringstream log;
  auto logger = MakeLogger({LogLevel::kWarn}, log);

  const auto source = ReadSourceLines(project.root() / "gone.py", logger);

  EXPECT_FALSE(source.readable);
  EXPECT_THAT(source.lines, IsEmpty());
  EXPECT_THAT(log.str(), HasSubstr("file.unreadable"));
}

TEST(BlankLineTest, WhitespaceOnlyLinesAreBlank) {
  EXPECT_TRUE(IsBlank(""));
  EXPECT_TRUE(IsBlank(" \t\f"));
  EXPECT_FALSE(IsBlank("  x "));
  EXPECT_EQ(2u, CountBlankLines({"a", "", "   ", "b"}));
  EXPECT_EQ("x", Strip("\t x \r"));
}

TEST(BlankLineTest, UnicodeSpacesAreStripped) {
  EXPECT_TRUE(IsBlank("\xC2\xA0"));
  EXPECT_TRUE(IsBlank("\xC2\x85 \xE3\x80\x80\xE2\x80\x8A\x1F"));
  EXPECT_EQ("x", Strip("\xE2\x80\xAFx\xC2\xA0"));
  EXPECT_EQ("x ", StripLeading("\xC2\xA0 x "));
  EXPECT_FALSE(IsBlank("\xC3\xA9"));
  EXPECT_FALSE(IsBlank("\xE2\x80\x8B"));
}

TEST(BlankLineTest, Latin1NoBreakSpaceLineIsBlank) {
  const auto source = DecodeSource("x = 1\n\xA0\n\x85\n", nullptr);

  EXPECT_EQ(SourceEncoding::kLatin1, source.encoding);
  EXPECT_EQ(2u, CountBlankLines(source.lines));
}

} // namespace
} // namespace codestat
