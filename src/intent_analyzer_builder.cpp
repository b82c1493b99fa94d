#include <intent/intent_analyzer_builder.h>

#include <intent/collaborators.h>
#include <intent/script_parser.h>

#include <utility>

namespace {

template <typename Interface, typename Implementation, typename... Args>
std::shared_ptr<Interface> EnsureComponent(std::shared_ptr<Interface> component,
                                           Args &&...args) {
  if (component) {
    return component;
  }
  return std::make_shared<Implementation>(std::forward<Args>(args)...);
}

} // namespace

namespace intent {

IntentAnalyzerBuilder &
IntentAnalyzerBuilder::WithParser(std::shared_ptr<SourceParser> parser) {
  components_.parser = std::move(parser);
  return *this;
}

IntentAnalyzerBuilder &IntentAnalyzerBuilder::WithRegistry(
    std::shared_ptr<const AnalysisRegistry> registry) {
  components_.registry = std::move(registry);
  return *this;
}

IntentAnalyzerBuilder &
IntentAnalyzerBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

IntentAnalyzerBuilder &
IntentAnalyzerBuilder::WithTracker(std::shared_ptr<PerformanceTracker> tracker) {
  components_.tracker = std::move(tracker);
  return *this;
}

IntentAnalyzerBuilder &
IntentAnalyzerBuilder::WithInsightBus(std::shared_ptr<InsightBus> bus) {
  components_.insight_bus = std::move(bus);
  return *this;
}

IntentAnalyzerBuilder &
IntentAnalyzerBuilder::WithParseOptions(ParseOptions options) {
  parse_options_ = options;
  return *this;
}

AnalyzerComponents IntentAnalyzerBuilder::Assemble() {
  AnalyzerComponents components;
  components.logger = EnsureLogger(components_.logger);
  components.parser = EnsureComponent<SourceParser, ScriptParser>(
      components_.parser, parse_options_);
  components.registry = components_.registry ? components_.registry
                                             : DefaultAnalysisRegistry();
  components.tracker =
      EnsureComponent<PerformanceTracker, LoggingPerformanceTracker>(
          components_.tracker, components.logger);
  components.insight_bus = EnsureComponent<InsightBus, LoggingInsightBus>(
      components_.insight_bus, components.logger);
  return components;
}

DefaultIntentAnalyzer IntentAnalyzerBuilder::Build() {
  return DefaultIntentAnalyzer(Assemble());
}

std::unique_ptr<DefaultIntentAnalyzer> IntentAnalyzerBuilder::BuildUnique() {
  return std::make_unique<DefaultIntentAnalyzer>(Assemble());
}

} // namespace intent
