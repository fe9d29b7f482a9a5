#include <codestat/escaping.h>

#include <gtest/gtest.h>

namespace {

TEST(EscapingTest, EscapesQuotesAndBackslashes) {
  EXPECT_EQ("say \\\"hi\\\" C:\\\\src", codestat::EscapeJsonString(
                                            "say \"hi\" C:\\src"));
}

TEST(EscapingTest, EscapesControlCharacters) {
  EXPECT_EQ("a\\tb\\nc\\r", codestat::EscapeJsonString("a\tb\nc\r"));
  EXPECT_EQ("\\u0001", codestat::EscapeJsonString(std::string(1, '\x01')));
}

TEST(EscapingTest, LeavesUtf8Untouched) {
  EXPECT_EQ("caf\xC3\xA9", codestat::EscapeJsonString("caf\xC3\xA9"));
}

TEST(FormatNumberTest, GroupsThousands) {
  EXPECT_EQ("0", codestat::FormatNumber(0));
  EXPECT_EQ("999", codestat::FormatNumber(999));
  EXPECT_EQ("1,000", codestat::FormatNumber(1000));
  EXPECT_EQ("1,234,567", codestat::FormatNumber(1234567));
}

TEST(FormatPercentageTest, RoundsToOneDecimal) {
  EXPECT_EQ("72.5%", codestat::FormatPercentage(72.46));
  EXPECT_EQ("0.0%", codestat::FormatPercentage(0.0));
  EXPECT_EQ("100.0%", codestat::FormatPercentage(100.0));
}

} // namespace
