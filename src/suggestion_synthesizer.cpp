#include <intent/suggestion_synthesizer.h>

#include <intent/text.h>

#include <algorithm>
#include <cmath>

namespace intent {
namespace {

constexpr int kCyclomaticThreshold = 10;
constexpr int kCognitiveThreshold = 15;
constexpr int kCouplingThreshold = 20;
constexpr int kAwaitThreshold = 3;

void AddComplexitySuggestions(const ComplexityAnalysis &complexity,
                              std::vector<std::string> &suggestions) {
  if (complexity.cyclomatic > kCyclomaticThreshold) {
    AppendUnique(suggestions, "Consider breaking down complex functions");
  }
  if (complexity.cognitive > kCognitiveThreshold) {
    AppendUnique(suggestions, "Simplify logic to improve readability");
  }
  if (complexity.coupling > kCouplingThreshold) {
    AppendUnique(suggestions, "Reduce external dependencies");
  }
}

void AddDataAccessSuggestion(const SuggestionInput &input,
                             std::vector<std::string> &suggestions) {
  if (Contains(input.purpose, "Database") &&
      !IsOneOf("Repository", input.patterns)) {
    AppendUnique(suggestions, "Consider using Repository pattern for data access");
  }
}

void AddAsyncSuggestion(int await_count,
                        std::vector<std::string> &suggestions) {
  if (await_count > kAwaitThreshold) {
    AppendUnique(suggestions,
                 "Consider using Promise.all for parallel async operations");
  }
}

void AddRiskSuggestion(const std::vector<SideEffect> &effects,
                       std::vector<std::string> &suggestions) {
  const auto risky =
      std::any_of(effects.begin(), effects.end(), [](const SideEffect &effect) {
        return effect.risk == Risk::kHigh;
      });
  if (risky) {
    AppendUnique(suggestions, "Add error handling for critical operations");
  }
}

void AddValidationSuggestion(const std::vector<DataFlow> &inputs,
                             std::vector<std::string> &suggestions) {
  const auto unvalidated =
      std::any_of(inputs.begin(), inputs.end(), [](const DataFlow &flow) {
        return (flow.sensitivity == Sensitivity::kSensitive ||
                flow.sensitivity == Sensitivity::kCritical) &&
               flow.validation.empty();
      });
  if (unvalidated) {
    AppendUnique(suggestions, "Add validation for sensitive data inputs");
  }
}

} // namespace

std::vector<std::string>
SuggestionSynthesizer::Synthesize(const SuggestionInput &input) const {
  std::vector<std::string> suggestions;
  AddComplexitySuggestions(input.complexity, suggestions);
  AddDataAccessSuggestion(input, suggestions);
  AddAsyncSuggestion(input.await_count, suggestions);
  AddRiskSuggestion(input.side_effects, suggestions);
  AddValidationSuggestion(input.inputs, suggestions);
  return suggestions;
}

double ConfidenceScorer::Score(const ConfidenceSignals &signals) const {
  double confidence = 0.5;
  if (signals.has_type_annotations) {
    confidence += 0.15;
  }
  if (signals.has_comments) {
    confidence += 0.1;
  }
  if (signals.test_file) {
    confidence += 0.1;
  }
  confidence += std::min(0.1, 0.02 * static_cast<double>(signals.pattern_count));
  if (signals.known_purpose) {
    confidence += 0.1;
  }
  confidence = std::clamp(confidence, 0.0, kMaxConfidence);
  return std::round(confidence * 10000.0) / 10000.0;
}

} // namespace intent
