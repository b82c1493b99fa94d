#include <cstdlib>
#include <filesystem>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace intent {
namespace {

using ::testing::Gt;
using ::testing::HasSubstr;

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::path(INTENT_ANALYZE_BINARY);
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system((command + " > /dev/null 2>&1").c_str()));
}

TEST(CliIntegrationTest, CleanSourceExitsWithZero) {
  test::TemporaryProject project;
  const auto source = project.AddFile(
      "src/math.js", "function add(a, b) {\n  return a + b;\n}\n");
  const auto output_directory = project.root() / "artifacts";

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command = cli.string() + " analyze --file " +
                              source.string() + " --out " +
                              output_directory.string();

  ASSERT_EQ(ExitCode(command), 0);
  const auto markdown_report = output_directory / "intent_report.md";
  ASSERT_TRUE(std::filesystem::exists(markdown_report));
  EXPECT_FALSE(std::filesystem::exists(output_directory / "intent_report.json"));
}

TEST(CliIntegrationTest, FlaggedSourceWritesReportsAndExitsWithTwo) {
  test::TemporaryProject project;
  const auto source = project.AddFile(
      "src/users.service.ts",
      "export async function loadUser(id: string): Promise<User> {\n"
      "  const response = await fetch(`/api/users/${id}`);\n"
      "  return response.json();\n"
      "}\n");
  const auto output_directory = project.root() / "artifacts";

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command =
      cli.string() + " analyze --file " + source.string() +
      " --format markdown,json --dependencies express --out " +
      output_directory.string();

  ASSERT_EQ(ExitCode(command), 2);

  const auto markdown_report = output_directory / "intent_report.md";
  const auto json_report = output_directory / "intent_report.json";
  ASSERT_TRUE(std::filesystem::exists(markdown_report));
  ASSERT_TRUE(std::filesystem::exists(json_report));
  EXPECT_THAT(test::LoadFile(markdown_report).size(), Gt<std::size_t>(0));
  EXPECT_THAT(test::LoadFile(json_report), HasSubstr("\"type\": \"network\""));
}

TEST(CliIntegrationTest, CommandDefaultsToAnalyze) {
  test::TemporaryProject project;
  const auto source =
      project.AddFile("util.js", "function id(value) {\n  return value;\n}\n");
  const auto output_directory = project.root() / "artifacts";
  const auto config_path = project.AddFile(
      "intent.yaml", "formats:\n  - json\nout: " + output_directory.string() +
                         "\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const std::string command = cli.string() + " --file " + source.string() +
                              " --config " + config_path.string();

  ASSERT_EQ(ExitCode(command), 0);
  EXPECT_TRUE(std::filesystem::exists(output_directory / "intent_report.json"));
  EXPECT_FALSE(std::filesystem::exists(output_directory / "intent_report.md"));
}

TEST(CliIntegrationTest, UnparseableSourceExitsWithOne) {
  test::TemporaryProject project;
  const auto source =
      project.AddFile("broken.js", "const greeting = 'unterminated;\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  EXPECT_EQ(ExitCode(cli.string() + " analyze --file " + source.string()), 1);
}

TEST(CliIntegrationTest, MissingFileFlagExitsWithOne) {
  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  EXPECT_EQ(ExitCode(cli.string() + " analyze --format json"), 1);
  EXPECT_EQ(ExitCode(cli.string() + " report --file x.js"), 1);
}

TEST(CliIntegrationTest, HelpExitsWithZero) {
  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  EXPECT_EQ(ExitCode(cli.string() + " --help"), 0);
  EXPECT_EQ(ExitCode(cli.string() + " analyze --help"), 0);
}

} // namespace
} // namespace intent
