#include <intent/text.h>

#include <gtest/gtest.h>

namespace intent {
namespace {

TEST(TextTest, LowersAndTrims) {
  EXPECT_EQ(ToLower("UserService"), "userservice");
  EXPECT_EQ(Trim("  lodash \n"), "lodash");
  EXPECT_EQ(Trim("   "), "");
}

TEST(TextTest, MatchesSubstringsAndPrefixes) {
  EXPECT_TRUE(Contains("userPassword", "Password"));
  EXPECT_FALSE(Contains("user", "password"));
  EXPECT_TRUE(StartsWith("node:fs", "node:"));
  EXPECT_FALSE(StartsWith("no", "node:"));
}

TEST(TextTest, ContainsAnyHonoursCaseFlag) {
  const std::vector<std::string> needles = {"auth", "payment"};
  EXPECT_FALSE(ContainsAny("@Company/AUTH-client", needles));
  EXPECT_TRUE(ContainsAny("@Company/AUTH-client", needles, true));
  EXPECT_FALSE(ContainsAny("lodash", needles, true));
}

TEST(TextTest, AppendUniqueKeepsFirstOccurrenceOrder) {
  std::vector<std::string> values;
  AppendUnique(values, "db.find");
  AppendUnique(values, "validate");
  AppendUnique(values, "db.find");

  EXPECT_EQ(values, (std::vector<std::string>{"db.find", "validate"}));
  EXPECT_TRUE(IsOneOf("validate", values));
}

} // namespace
} // namespace intent
