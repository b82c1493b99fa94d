#include <intent/escaping.h>

#include <gtest/gtest.h>

namespace intent {
namespace {

TEST(EscapingTest, EscapesJsonControlCharacters) {
  const std::string input = "Line1\nLine2\t\"quoted\"\\";
  EXPECT_EQ(EscapeJsonString(input),
            "Line1\\nLine2\\t\\\"quoted\\\"\\\\");
}

TEST(EscapingTest, EscapesRemainingControlCharactersAsUnicode) {
  const std::string input{'a', '\x01', 'b'};
  EXPECT_EQ(EscapeJsonString(input), "a\\u0001b");
}

TEST(EscapingTest, LeavesNonAsciiBytesUntouched) {
  EXPECT_EQ(EscapeJsonString("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(EscapingTest, EscapesMarkdownPipesAndLineBreaks) {
  EXPECT_EQ(EscapeMarkdownCell("a|b\r\nc"), "a\\|b<br>c");
  EXPECT_EQ(EscapeMarkdownCell("plain"), "plain");
}

} // namespace
} // namespace intent
