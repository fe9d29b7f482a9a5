#include <codestat/language_registry.h>
#include <codestat/models.h>

#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace codestat {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(LanguageRegistryTest, MapsExtensionsIgnoringCase) {
  const LanguageRegistry registry;

  EXPECT_EQ("Python", registry.LanguageForExtension(".py"));
  EXPECT_EQ("Python", registry.LanguageForExtension(".PY"));
  EXPECT_EQ("C++", registry.LanguageForExtension(".hpp"));
  EXPECT_EQ("R", registry.LanguageForExtension(".R"));
  EXPECT_EQ("Markdown", registry.LanguageForExtension(".markdown"));
  EXPECT_EQ(kUnknownLanguage, registry.LanguageForExtension(".xyz"));
  EXPECT_EQ(kUnknownLanguage, registry.LanguageForExtension(""));
}

TEST(LanguageRegistryTest, ResolvesLanguageFromPath) {
  const LanguageRegistry registry;

  EXPECT_EQ("TypeScript", registry.LanguageForPath("src/app/Main.TSX"));
  EXPECT_EQ("Shell", registry.LanguageForPath("/tmp/run.sh"));
  EXPECT_EQ(kUnknownLanguage, registry.LanguageForPath("Makefile"));
  EXPECT_EQ(kUnknownLanguage, registry.LanguageForPath(".bashrc"));
}

TEST(LanguageRegistryTest, ProvidesCommentSyntaxPerStyle) {
  const LanguageRegistry registry;

  const auto &c_style = registry.SyntaxFor("Go");
  EXPECT_THAT(c_style.single_line, ElementsAre("//"));
  ASSERT_EQ(1u, c_style.multi_line.size());
  EXPECT_EQ("/*", c_style.multi_line.front().start);
  EXPECT_EQ("*/", c_style.multi_line.front().end);

  EXPECT_THAT(registry.SyntaxFor("Ruby").single_line, ElementsAre("#"));
  EXPECT_FALSE(registry.SyntaxFor("Ruby").SupportsMultiLine());
  EXPECT_THAT(registry.SyntaxFor("Lua").single_line, ElementsAre("--"));

  const auto &markup = registry.SyntaxFor("XML");
  EXPECT_FALSE(markup.SupportsSingleLine());
  ASSERT_EQ(1u, markup.multi_line.size());
  EXPECT_EQ("<!--", markup.multi_line.front().start);

  const auto &css = registry.SyntaxFor("SCSS");
  EXPECT_FALSE(css.SupportsSingleLine());
  EXPECT_TRUE(css.SupportsMultiLine());
}

TEST(LanguageRegistryTest, UnknownLanguagesHaveNoCommentSyntax) {
  const LanguageRegistry registry;

  EXPECT_FALSE(registry.SyntaxFor("JSON").SupportsSingleLine());
  EXPECT_FALSE(registry.SyntaxFor("JSON").SupportsMultiLine());
  EXPECT_THAT(registry.SyntaxFor("Klingon").single_line, IsEmpty());
}

TEST(LanguageRegistryTest, ListsExtensionsSorted) {
  const LanguageRegistry registry;
  const auto extensions = registry.Extensions();

  EXPECT_TRUE(std::is_sorted(extensions.begin(), extensions.end()));
  EXPECT_THAT(extensions, Contains(".py"));
  EXPECT_THAT(extensions, Contains(".md"));
  EXPECT_EQ(DefaultExtensionMap().size(), extensions.size());
}

TEST(LanguageRegistryTest, AcceptsCustomTables) {
  const LanguageRegistry registry(
      {{"semicolon", {"Assembly"}, {{";"}, {}}}}, {{"ASM", "Assembly"}});

  EXPECT_EQ("Assembly", registry.LanguageForExtension(".asm"));
  EXPECT_TRUE(registry.IsKnownExtension(".Asm"));
  EXPECT_THAT(registry.SyntaxFor("Assembly").single_line, ElementsAre(";"));
  EXPECT_FALSE(registry.IsKnownExtension(".py"));
}

TEST(NormalizeExtensionTest, LowercasesAndAddsDot) {
  EXPECT_EQ(".py", NormalizeExtension("PY"));
  EXPECT_EQ(".js", NormalizeExtension(".Js"));
  EXPECT_EQ("", NormalizeExtension(""));
}

TEST(ExtensionOfTest, UsesTheFinalComponent) {
  EXPECT_EQ(".gz", ExtensionOf("archive.tar.GZ"));
  EXPECT_EQ("", ExtensionOf("dir.d/Makefile"));
  EXPECT_EQ("", ExtensionOf(".gitignore"));
}

} // namespace
} // namespace codestat
