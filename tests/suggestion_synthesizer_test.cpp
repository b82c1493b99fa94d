#include <intent/suggestion_synthesizer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace intent {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

DataFlow Input(const std::string &name, Sensitivity sensitivity,
               std::vector<std::string> validation = {}) {
  DataFlow flow;
  flow.name = name;
  flow.sensitivity = sensitivity;
  flow.validation = std::move(validation);
  return flow;
}

TEST(SuggestionSynthesizerTest, QuietForSimpleCode) {
  SuggestionInput input;
  input.purpose = "Utility function";

  EXPECT_THAT(SuggestionSynthesizer().Synthesize(input), IsEmpty());
}

TEST(SuggestionSynthesizerTest, EmitsRulesInFixedOrder) {
  SuggestionInput input;
  input.purpose = "API endpoint + Database operation";
  input.complexity.cyclomatic = 11;
  input.complexity.cognitive = 16;
  input.complexity.coupling = 21;
  input.await_count = 4;
  input.side_effects.push_back(SideEffect{SideEffectType::kNetwork, "request",
                                          std::string("/api"), Risk::kHigh});
  input.inputs.push_back(Input("token", Sensitivity::kSensitive));

  EXPECT_THAT(
      SuggestionSynthesizer().Synthesize(input),
      ElementsAre("Consider breaking down complex functions",
                  "Simplify logic to improve readability",
                  "Reduce external dependencies",
                  "Consider using Repository pattern for data access",
                  "Consider using Promise.all for parallel async operations",
                  "Add error handling for critical operations",
                  "Add validation for sensitive data inputs"));
}

TEST(SuggestionSynthesizerTest, ThresholdsAreExclusive) {
  SuggestionInput input;
  input.complexity.cyclomatic = 10;
  input.complexity.cognitive = 15;
  input.complexity.coupling = 20;
  input.await_count = 3;

  EXPECT_THAT(SuggestionSynthesizer().Synthesize(input), IsEmpty());
}

TEST(SuggestionSynthesizerTest, RepositoryPatternSilencesDataAccessRule) {
  SuggestionInput input;
  input.purpose = "Database operation";
  input.patterns = {"Repository"};

  EXPECT_THAT(SuggestionSynthesizer().Synthesize(input), IsEmpty());
}

TEST(SuggestionSynthesizerTest, ValidatedOrPublicInputsNeedNoValidation) {
  SuggestionInput input;
  input.inputs = {Input("password", Sensitivity::kSensitive, {"validate"}),
                  Input("email", Sensitivity::kPrivate)};

  EXPECT_THAT(SuggestionSynthesizer().Synthesize(input), IsEmpty());

  input.inputs.push_back(Input("balance", Sensitivity::kCritical));
  EXPECT_THAT(SuggestionSynthesizer().Synthesize(input),
              ElementsAre("Add validation for sensitive data inputs"));
}

TEST(ConfidenceScorerTest, StartsAtBaseline) {
  EXPECT_DOUBLE_EQ(ConfidenceScorer().Score({}), 0.5);
}

TEST(ConfidenceScorerTest, AddsWeightedSignals) {
  ConfidenceSignals signals;
  signals.has_comments = true;
  signals.pattern_count = 2;

  EXPECT_DOUBLE_EQ(ConfidenceScorer().Score(signals), 0.64);
}

TEST(ConfidenceScorerTest, ClampsAtMaximum) {
  ConfidenceSignals signals;
  signals.has_type_annotations = true;
  signals.has_comments = true;
  signals.test_file = true;
  signals.pattern_count = 12;
  signals.known_purpose = true;

  EXPECT_DOUBLE_EQ(ConfidenceScorer().Score(signals), kMaxConfidence);
}

} // namespace
} // namespace intent
