#pragma once

#include <intent/complexity_analyzer.h>
#include <intent/data_flow_analyzer.h>
#include <intent/dependency_extractor.h>
#include <intent/interfaces.h>
#include <intent/logging.h>
#include <intent/pattern_detector.h>
#include <intent/purpose_detector.h>
#include <intent/registry.h>
#include <intent/side_effect_detector.h>
#include <intent/suggestion_synthesizer.h>

#include <future>
#include <memory>
#include <string>

namespace intent {

inline constexpr char kToolId[] = "semantic-analyzer";
inline constexpr char kAnalyzeOperation[] = "analyze-intent";
inline constexpr char kCodeIssuesInsight[] = "code-issues";

struct AnalyzerComponents {
  std::shared_ptr<SourceParser> parser;
  std::shared_ptr<const AnalysisRegistry> registry;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<PerformanceTracker> tracker;
  std::shared_ptr<InsightBus> insight_bus;
};

// Parses one code unit, runs every extractor against the read-only tree and
// assembles the CodeIntent. A failing extractor degrades its facet to a
// diagnostic; parse failures are tracked and rethrown.
class DefaultIntentAnalyzer : public IntentAnalyzer {
public:
  explicit DefaultIntentAnalyzer(AnalyzerComponents components);

  CodeIntent Analyze(const std::string &code,
                     const AnalysisContext &context) override;

  // Runs Analyze on a separate thread. The analyzer must outlive the future.
  std::future<CodeIntent> AnalyzeAsync(std::string code,
                                       AnalysisContext context);

private:
  CodeIntent RunPipeline(const std::string &code,
                         const AnalysisContext &context);
  void TrackMetric(const ToolMetric &metric);
  void ShareFindings(const CodeIntent &intent);
  void LogStage(const char *stage, LogFields fields = {});

  std::shared_ptr<SourceParser> parser_;
  std::shared_ptr<const AnalysisRegistry> registry_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<PerformanceTracker> tracker_;
  std::shared_ptr<InsightBus> insight_bus_;

  PurposeDetector purpose_;
  DataFlowAnalyzer data_flow_;
  SideEffectDetector side_effects_;
  DependencyExtractor dependencies_;
  ComplexityAnalyzer complexity_;
  PatternDetector patterns_;
  AntiPatternDetector anti_patterns_;
  SuggestionSynthesizer synthesizer_;
  ConfidenceScorer scorer_;
};

} // namespace intent
