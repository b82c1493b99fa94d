#include <intent/intent_json.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace intent {
namespace {

using ::testing::HasSubstr;

CodeIntent MakeFullIntent() {
  CodeIntent intent;
  intent.purpose = "Controller + API endpoint";
  intent.category = Category::kBusiness;
  intent.actions = {"Calls fetch", "Returns result"};

  DataFlow input;
  input.name = "password";
  input.type = "string";
  input.source = FlowSource::kParameter;
  input.validation = {"validatePassword"};
  input.transformations = {"hash operation"};
  input.sensitivity = Sensitivity::kSensitive;
  intent.inputs.push_back(input);

  DataFlow output;
  output.name = "return";
  output.type = "object";
  output.source = FlowSource::kInternal;
  intent.outputs.push_back(output);

  SideEffect network;
  network.type = SideEffectType::kNetwork;
  network.action = "HTTP request";
  network.target = "https://api.example.com/users";
  network.risk = Risk::kHigh;
  intent.side_effects.push_back(network);

  SideEffect async_effect;
  async_effect.type = SideEffectType::kAsync;
  async_effect.action = "Asynchronous operation";
  async_effect.risk = Risk::kLow;
  intent.side_effects.push_back(async_effect);

  Dependency dependency;
  dependency.name = "express";
  dependency.type = DependencyType::kExternal;
  dependency.purpose = "Web framework";
  dependency.critical = true;
  intent.dependencies.push_back(dependency);

  intent.complexity = ComplexityAnalysis{7, 5, 3, 4, 50};
  intent.patterns = {"Factory"};
  intent.anti_patterns = {"Magic Numbers"};
  intent.suggestions = {"Extract magic numbers into named constants"};
  intent.confidence = 0.8125;

  Diagnostic located;
  located.facet = "parser";
  located.severity = DiagnosticSeverity::kWarning;
  located.message = "Unexpected token \"}\"";
  located.line = 4;
  located.column = 12;
  intent.diagnostics.push_back(located);

  Diagnostic unlocated;
  unlocated.facet = "data_flow";
  unlocated.severity = DiagnosticSeverity::kError;
  unlocated.message = "function has no body";
  intent.diagnostics.push_back(unlocated);
  return intent;
}

TEST(IntentJsonTest, SerializedIntentReadsBackUnchanged) {
  const auto intent = MakeFullIntent();

  EXPECT_EQ(DeserializeIntent(SerializeIntent(intent)), intent);
}

TEST(IntentJsonTest, DefaultIntentReadsBackUnchanged) {
  CodeIntent intent;
  intent.purpose = "General purpose function";

  EXPECT_EQ(DeserializeIntent(SerializeIntent(intent)), intent);
}

TEST(IntentJsonTest, UsesSnakeCaseKeysAndLowercaseEnumNames) {
  const auto json = SerializeIntent(MakeFullIntent());

  EXPECT_THAT(json, HasSubstr("\"side_effects\": ["));
  EXPECT_THAT(json, HasSubstr("\"anti_patterns\": [\"Magic Numbers\"]"));
  EXPECT_THAT(json, HasSubstr("\"category\": \"business\""));
  EXPECT_THAT(json, HasSubstr("\"sensitivity\": \"sensitive\""));
  EXPECT_THAT(json, HasSubstr("\"risk\": \"high\""));
  EXPECT_THAT(json, HasSubstr("\"critical\": true"));
  EXPECT_THAT(json, HasSubstr("\"confidence\": 0.8125"));
}

TEST(IntentJsonTest, WritesAbsentOptionalsAsNull) {
  const auto json = SerializeIntent(MakeFullIntent());

  EXPECT_THAT(json, HasSubstr("\"target\": null"));
  EXPECT_THAT(json, HasSubstr("\"line\": null, \"column\": null"));
  EXPECT_THAT(json, HasSubstr("\"line\": 4, \"column\": 12"));
}

TEST(IntentJsonTest, EscapesQuotesInStrings) {
  const auto json = SerializeIntent(MakeFullIntent());

  EXPECT_THAT(json, HasSubstr("Unexpected token \\\"}\\\""));
}

TEST(IntentJsonTest, SerializesSideEffectOnItsOwn) {
  SideEffect effect;
  effect.type = SideEffectType::kDatabase;
  effect.action = "Database write: save";
  effect.target = "db";
  effect.risk = Risk::kMedium;

  EXPECT_EQ(SerializeSideEffect(effect),
            "{\"type\": \"database\", \"action\": \"Database write: save\", "
            "\"target\": \"db\", \"risk\": \"medium\"}");
}

TEST(IntentJsonTest, MissingOptionalSectionsFallBackToDefaults) {
  const auto intent = DeserializeIntent(
      R"({"purpose": "Utility function", "category": "utility"})");

  EXPECT_EQ(intent.purpose, "Utility function");
  EXPECT_EQ(intent.category, Category::kUtility);
  EXPECT_TRUE(intent.actions.empty());
  EXPECT_EQ(intent.complexity, ComplexityAnalysis{});
  EXPECT_DOUBLE_EQ(intent.confidence, 0.0);
}

TEST(IntentJsonTest, RejectsMissingPurpose) {
  try {
    DeserializeIntent(R"({"category": "data"})");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("missing 'purpose'"));
  }
}

TEST(IntentJsonTest, RejectsNonObjectDocument) {
  try {
    DeserializeIntent("[1, 2, 3]");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_STREQ(error.what(), "Intent JSON must be an object");
  }
}

TEST(IntentJsonTest, RejectsMalformedDocument) {
  try {
    DeserializeIntent(R"({"purpose": "x", "category": )");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Invalid intent JSON"));
  }
}

TEST(IntentJsonTest, RejectsUnknownEnumName) {
  try {
    DeserializeIntent(R"({"purpose": "x", "category": "marketing"})");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_STREQ(error.what(), "Unknown category: marketing");
  }
}

TEST(IntentJsonTest, RejectsScalarWhereArrayExpected) {
  try {
    DeserializeIntent(
        R"({"purpose": "x", "category": "data", "patterns": "Factory"})");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_STREQ(error.what(), "Intent JSON field 'patterns' must be an array");
  }
}

} // namespace
} // namespace intent
