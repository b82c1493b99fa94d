#pragma once

#include <intent/intent_analyzer.h>
#include <intent/interfaces.h>
#include <intent/logging.h>
#include <intent/registry.h>

#include <memory>

namespace intent {

// Assembles a DefaultIntentAnalyzer. Missing components fall back to the
// ScriptParser, the default registry, a NullLogger and the logging
// collaborators.
class IntentAnalyzerBuilder {
public:
  IntentAnalyzerBuilder &WithParser(std::shared_ptr<SourceParser> parser);
  IntentAnalyzerBuilder &
  WithRegistry(std::shared_ptr<const AnalysisRegistry> registry);
  IntentAnalyzerBuilder &WithLogger(std::shared_ptr<Logger> logger);
  IntentAnalyzerBuilder &
  WithTracker(std::shared_ptr<PerformanceTracker> tracker);
  IntentAnalyzerBuilder &WithInsightBus(std::shared_ptr<InsightBus> bus);
  // Used only when no parser is supplied.
  IntentAnalyzerBuilder &WithParseOptions(ParseOptions options);

  DefaultIntentAnalyzer Build();
  std::unique_ptr<DefaultIntentAnalyzer> BuildUnique();

private:
  AnalyzerComponents Assemble();

  AnalyzerComponents components_;
  ParseOptions parse_options_;
};

} // namespace intent
