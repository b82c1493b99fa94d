#include <intent/intent_analyzer.h>

#include <intent/collaborators.h>
#include <intent/errors.h>
#include <intent/facet_result.h>
#include <intent/intent_json.h>
#include <intent/script_parser.h>
#include <intent/text.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace intent {
namespace {

template <typename T>
T Collect(FacetResult<T> result, std::vector<Diagnostic> &diagnostics,
          Logger &logger) {
  if (result.diagnostic) {
    logger.Log(LogLevel::kWarn, "analysis.facet.failed",
               {{"facet", result.diagnostic->facet},
                {"error", result.diagnostic->message}});
    diagnostics.push_back(std::move(*result.diagnostic));
  }
  return std::move(result.value);
}

bool HasHighRisk(const std::vector<SideEffect> &effects) {
  return std::any_of(effects.begin(), effects.end(),
                     [](const SideEffect &effect) {
                       return effect.risk == Risk::kHigh;
                     });
}

std::chrono::milliseconds
ElapsedSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

} // namespace

DefaultIntentAnalyzer::DefaultIntentAnalyzer(AnalyzerComponents components)
    : parser_(components.parser ? std::move(components.parser)
                                : std::make_shared<ScriptParser>()),
      registry_(components.registry ? std::move(components.registry)
                                    : DefaultAnalysisRegistry()),
      logger_(EnsureLogger(std::move(components.logger))),
      tracker_(components.tracker
                   ? std::move(components.tracker)
                   : std::make_shared<LoggingPerformanceTracker>(logger_)),
      insight_bus_(components.insight_bus
                       ? std::move(components.insight_bus)
                       : std::make_shared<LoggingInsightBus>(logger_)),
      purpose_(registry_), data_flow_(registry_), side_effects_(registry_),
      dependencies_(registry_), complexity_(registry_), patterns_(registry_),
      anti_patterns_(registry_) {}

CodeIntent DefaultIntentAnalyzer::Analyze(const std::string &code,
                                          const AnalysisContext &context) {
  logger_->Log(LogLevel::kInfo, "analysis.start",
               {{"file_name", context.file_name.value_or("")},
                {"size", std::to_string(code.size())}});

  const auto timestamp = std::chrono::system_clock::now();
  const auto start = std::chrono::steady_clock::now();
  try {
    auto intent = RunPipeline(code, context);

    ToolMetric metric;
    metric.tool_id = kToolId;
    metric.operation = kAnalyzeOperation;
    metric.timestamp = timestamp;
    metric.duration = ElapsedSince(start);
    metric.success = true;
    metric.input = MetricPayload{"code", code.size()};
    metric.output = MetricPayload{"intent", SerializeIntent(intent).size()};
    metric.confidence = intent.confidence;
    TrackMetric(metric);
    ShareFindings(intent);

    logger_->Log(LogLevel::kInfo, "analysis.complete",
                 {{"duration_ms", std::to_string(metric.duration.count())},
                  {"purpose", intent.purpose},
                  {"confidence", std::to_string(intent.confidence)},
                  {"diagnostics", std::to_string(intent.diagnostics.size())}});
    return intent;
  } catch (const std::exception &error) {
    LogStage("failed");
    logger_->Log(LogLevel::kError, "analysis.failed",
                 {{"file_name", context.file_name.value_or("")},
                  {"error", error.what()}});

    ToolMetric metric;
    metric.tool_id = kToolId;
    metric.operation = kAnalyzeOperation;
    metric.timestamp = timestamp;
    metric.duration = ElapsedSince(start);
    metric.success = false;
    metric.input = MetricPayload{"code", code.size()};
    metric.output = MetricPayload{"error", 0};
    metric.confidence = 0.0;
    metric.error = error.what();
    TrackMetric(metric);
    throw;
  }
}

std::future<CodeIntent>
DefaultIntentAnalyzer::AnalyzeAsync(std::string code,
                                    AnalysisContext context) {
  return std::async(std::launch::async,
                    [this, code = std::move(code),
                     context = std::move(context)]() {
                      return Analyze(code, context);
                    });
}

CodeIntent DefaultIntentAnalyzer::RunPipeline(const std::string &code,
                                              const AnalysisContext &context) {
  LogStage("parsing");
  auto parsed = parser_->Parse(code);
  if (!parsed.program) {
    throw ParseError("Parser returned no program", 1, 1);
  }
  const auto &program = *parsed.program;
  auto diagnostics = std::move(parsed.diagnostics);

  LogStage("extracting", {{"parser_diagnostics",
                           std::to_string(diagnostics.size())}});
  auto purpose = Collect(RunFacet<std::string>("purpose", kGeneralPurpose,
                                               [&] {
                                                 return purpose_.Detect(
                                                     program, context);
                                               }),
                         diagnostics, *logger_);
  auto actions = Collect(RunFacet<std::vector<std::string>>(
                             "actions", {},
                             [&] { return purpose_.ExtractActions(program); }),
                         diagnostics, *logger_);
  auto data_flow = Collect(RunFacet<DataFlowResult>(
                               "data_flow", {},
                               [&] { return data_flow_.Analyze(program); }),
                           diagnostics, *logger_);
  auto side_effects = Collect(RunFacet<SideEffectResult>(
                                  "side_effects", {},
                                  [&] { return side_effects_.Detect(program); }),
                              diagnostics, *logger_);
  auto dependencies = Collect(RunFacet<std::vector<Dependency>>(
                                  "dependencies", {},
                                  [&] {
                                    return dependencies_.Extract(program,
                                                                 context);
                                  }),
                              diagnostics, *logger_);
  auto complexity = Collect(RunFacet<ComplexityAnalysis>(
                                "complexity", ComplexityAnalysis{},
                                [&] { return complexity_.Analyze(program); }),
                            diagnostics, *logger_);
  auto patterns = Collect(RunFacet<std::vector<std::string>>(
                              "patterns", {},
                              [&] { return patterns_.Detect(program, code); }),
                          diagnostics, *logger_);
  auto anti_patterns = Collect(RunFacet<std::vector<std::string>>(
                                   "anti_patterns", {},
                                   [&] {
                                     return anti_patterns_.Detect(program,
                                                                  code);
                                   }),
                               diagnostics, *logger_);

  LogStage("synthesizing", {{"patterns", std::to_string(patterns.size())},
                            {"anti_patterns",
                             std::to_string(anti_patterns.size())}});
  SuggestionInput suggestion_input;
  suggestion_input.purpose = purpose;
  suggestion_input.inputs = data_flow.inputs;
  suggestion_input.side_effects = side_effects.effects;
  suggestion_input.patterns = patterns;
  suggestion_input.complexity = complexity;
  suggestion_input.await_count = side_effects.await_count;

  ConfidenceSignals signals;
  signals.has_type_annotations = parsed.has_type_annotations;
  signals.has_comments = parsed.comment_count > 0;
  signals.test_file =
      context.file_name && Contains(*context.file_name, "test");
  signals.pattern_count = patterns.size();
  signals.known_purpose = purpose != "unknown" && purpose != kGeneralPurpose;

  CodeIntent intent;
  intent.category = PurposeDetector::Categorize(purpose);
  intent.suggestions = synthesizer_.Synthesize(suggestion_input);
  intent.confidence = scorer_.Score(signals);
  intent.purpose = std::move(purpose);
  intent.actions = std::move(actions);
  intent.inputs = std::move(data_flow.inputs);
  intent.outputs = std::move(data_flow.outputs);
  intent.side_effects = std::move(side_effects.effects);
  intent.dependencies = std::move(dependencies);
  intent.complexity = complexity;
  intent.patterns = std::move(patterns);
  intent.anti_patterns = std::move(anti_patterns);
  intent.diagnostics = std::move(diagnostics);

  LogStage("assembled",
           {{"suggestions", std::to_string(intent.suggestions.size())}});
  return intent;
}

void DefaultIntentAnalyzer::TrackMetric(const ToolMetric &metric) {
  try {
    tracker_->Track(metric);
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "collaborator.failed",
                 {{"collaborator", "performance_tracker"},
                  {"error", error.what()}});
  }
}

void DefaultIntentAnalyzer::ShareFindings(const CodeIntent &intent) {
  if (intent.anti_patterns.empty() && !HasHighRisk(intent.side_effects)) {
    return;
  }

  Insight insight;
  insight.type = kCodeIssuesInsight;
  insight.anti_patterns = intent.anti_patterns;
  for (const auto &effect : intent.side_effects) {
    if (effect.risk == Risk::kHigh) {
      insight.risky_effects.push_back(effect);
    }
  }
  insight.confidence = intent.confidence;
  insight.affects = {"security-scanner", "smart-reviewer"};

  try {
    insight_bus_->ShareInsight(kToolId, insight);
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "collaborator.failed",
                 {{"collaborator", "insight_bus"}, {"error", error.what()}});
  }
}

void DefaultIntentAnalyzer::LogStage(const char *stage, LogFields fields) {
  fields.emplace(fields.begin(), "stage", stage);
  logger_->Log(LogLevel::kDebug, "analysis.stage", std::move(fields));
}

} // namespace intent
