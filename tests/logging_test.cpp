#include <intent/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  intent::StructuredLogger logger(stream, {intent::LogLevel::kInfo});

  logger.Log(intent::LogLevel::kDebug, "debug message", {});
  logger.Log(intent::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  intent::StructuredLogger logger(stream, {intent::LogLevel::kDebug});

  logger.Log(intent::LogLevel::kDebug, "analysis.stage",
             {{"stage", "parsing"}, {"input_size", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"parsing\""));
  EXPECT_NE(std::string::npos, output.find("\"input_size\": \"42\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"analysis.stage\""));
}

TEST(LoggingTest, KeepsMultilineFieldValuesOnOneRecord) {
  std::stringstream stream;
  intent::StructuredLogger logger(stream, {intent::LogLevel::kWarn});

  logger.Log(intent::LogLevel::kError, "analysis.failed",
             {{"error", "line one\nline \"two\""}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("line one\\nline \\\"two\\\""));
  EXPECT_EQ(output.find('\n'), output.size() - 1);
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(intent::ParseLogLevel("DEBUG"), intent::LogLevel::kDebug);
  EXPECT_EQ(intent::ParseLogLevel(" warning "), intent::LogLevel::kWarn);
  EXPECT_EQ(intent::ParseLogLevel("error"), intent::LogLevel::kError);
  EXPECT_EQ(intent::LogLevelName(intent::LogLevel::kInfo), "info");
  EXPECT_THROW(intent::ParseLogLevel("loud"), std::invalid_argument);
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = intent::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<intent::NullLogger>(provided));

  auto custom = std::make_shared<intent::StructuredLogger>(
      std::cout, intent::LoggingConfig{});
  EXPECT_EQ(custom, intent::EnsureLogger(custom));
}

} // namespace
