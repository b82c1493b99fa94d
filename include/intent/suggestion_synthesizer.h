#pragma once

#include <intent/models.h>

#include <string>
#include <vector>

namespace intent {

struct SuggestionInput {
  std::string purpose;
  std::vector<DataFlow> inputs;
  std::vector<SideEffect> side_effects;
  std::vector<std::string> patterns;
  ComplexityAnalysis complexity;
  int await_count = 0;
};

// Fixed ordered rule table; each rule contributes at most one sentence.
class SuggestionSynthesizer {
public:
  std::vector<std::string> Synthesize(const SuggestionInput &input) const;
};

struct ConfidenceSignals {
  bool has_type_annotations = false;
  bool has_comments = false;
  bool test_file = false;
  std::size_t pattern_count = 0;
  bool known_purpose = false;
};

inline constexpr double kMaxConfidence = 0.95;

class ConfidenceScorer {
public:
  // Weighted sum clamped to [0, kMaxConfidence], rounded to four decimals.
  double Score(const ConfidenceSignals &signals) const;
};

} // namespace intent
