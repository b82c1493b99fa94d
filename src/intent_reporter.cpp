#include <intent/intent_reporter.h>

#include <intent/escaping.h>
#include <intent/intent_json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace intent {
namespace {

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string Cell(const std::string &value) {
  return value.empty() ? "-" : EscapeMarkdownCell(value);
}

std::string JoinWithBreaks(const std::vector<std::string> &items) {
  if (items.empty()) {
    return "-";
  }
  return Join(items, "<br>", [](const std::string &value) {
    return EscapeMarkdownCell(value);
  });
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string FormatConfidence(double confidence) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << confidence;
  return stream.str();
}

std::string BuildHeaderMarkdown(const CodeIntent &intent,
                                const ReportOptions &options,
                                const std::string &timestamp) {
  std::ostringstream section;
  section << "## Analysis Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Source | " << Cell(options.source) << " |\n";
  section << "| Purpose | " << Cell(intent.purpose) << " |\n";
  section << "| Category | " << ToString(intent.category) << " |\n";
  section << "| Confidence | " << FormatConfidence(intent.confidence)
          << " |\n\n";
  return section.str();
}

std::string BuildListMarkdown(const std::string &title,
                              const std::vector<std::string> &items) {
  std::ostringstream section;
  section << "## " << title << "\n\n";
  if (items.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &item : items) {
    section << "- " << item << "\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildDataFlowMarkdown(const std::string &title,
                                  const std::vector<DataFlow> &flows) {
  std::ostringstream section;
  section << "## " << title << "\n\n";
  section << "| Name | Type | Source | Sensitivity | Validation | "
             "Transformations |\n";
  section << "| --- | --- | --- | --- | --- | --- |\n";
  if (flows.empty()) {
    section << "| None | - | - | - | - | - |\n\n";
    return section.str();
  }

  for (const auto &flow : flows) {
    section << "| " << Cell(flow.name) << " | " << Cell(flow.type) << " | "
            << ToString(flow.source) << " | " << ToString(flow.sensitivity)
            << " | " << JoinWithBreaks(flow.validation) << " | "
            << JoinWithBreaks(flow.transformations) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildSideEffectsMarkdown(const std::vector<SideEffect> &effects) {
  std::ostringstream section;
  section << "## Side Effects\n\n";
  section << "| Type | Action | Target | Risk |\n";
  section << "| --- | --- | --- | --- |\n";
  if (effects.empty()) {
    section << "| None | - | - | - |\n\n";
    return section.str();
  }

  for (const auto &effect : effects) {
    section << "| " << ToString(effect.type) << " | " << Cell(effect.action)
            << " | " << Cell(effect.target.value_or("")) << " | "
            << ToString(effect.risk) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string
BuildDependenciesMarkdown(const std::vector<Dependency> &dependencies) {
  std::ostringstream section;
  section << "## Dependencies\n\n";
  section << "| Name | Type | Purpose | Critical |\n";
  section << "| --- | --- | --- | --- |\n";
  if (dependencies.empty()) {
    section << "| None | - | - | - |\n\n";
    return section.str();
  }

  for (const auto &dependency : dependencies) {
    section << "| " << Cell(dependency.name) << " | "
            << ToString(dependency.type) << " | " << Cell(dependency.purpose)
            << " | " << (dependency.critical ? "yes" : "no") << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildComplexityMarkdown(const ComplexityAnalysis &complexity) {
  std::ostringstream section;
  section << "## Complexity\n\n";
  section << "| Metric | Value |\n";
  section << "| --- | --- |\n";
  section << "| Cognitive | " << complexity.cognitive << " |\n";
  section << "| Cyclomatic | " << complexity.cyclomatic << " |\n";
  section << "| Depth | " << complexity.depth << " |\n";
  section << "| Coupling | " << complexity.coupling << " |\n";
  section << "| Cohesion | " << complexity.cohesion << " |\n\n";
  return section.str();
}

std::string FormatLocation(const Diagnostic &diagnostic) {
  if (!diagnostic.line) {
    return "-";
  }
  return std::to_string(*diagnostic.line) + ":" +
         std::to_string(diagnostic.column.value_or(1));
}

std::string BuildDiagnosticsMarkdown(const std::vector<Diagnostic> &diagnostics) {
  std::ostringstream section;
  section << "## Diagnostics\n\n";
  section << "| Facet | Severity | Location | Message |\n";
  section << "| --- | --- | --- | --- |\n";
  if (diagnostics.empty()) {
    section << "| None | - | - | - |\n";
    return section.str();
  }

  for (const auto &diagnostic : diagnostics) {
    section << "| " << Cell(diagnostic.facet) << " | "
            << ToString(diagnostic.severity) << " | "
            << FormatLocation(diagnostic) << " | " << Cell(diagnostic.message)
            << " |\n";
  }
  return section.str();
}

std::string BuildHeaderJson(const ReportOptions &options,
                            const std::string &timestamp) {
  std::ostringstream json;
  json << "\"analysis_header\": {";
  json << "\"generated_on\": \"" << EscapeJsonString(timestamp) << "\", ";
  json << "\"source\": \"" << EscapeJsonString(options.source) << "\"}";
  return json.str();
}

std::string CurrentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &now_time);
#else
  gmtime_r(&now_time, &utc);
#endif
  std::ostringstream timestamp_stream;
  timestamp_stream << std::put_time(&utc, "%FT%TZ");
  return timestamp_stream.str();
}

} // namespace

Report IntentReporter::Render(const CodeIntent &intent,
                              const ReportOptions &options) const {
  const auto timestamp = CurrentTimestamp();

  Report report;
  if (ShouldRenderFormat(options.formats, "markdown")) {
    std::ostringstream output;
    output << "# Code Intent Report\n\n";
    output << BuildHeaderMarkdown(intent, options, timestamp);
    output << BuildListMarkdown("Actions", intent.actions);
    output << BuildDataFlowMarkdown("Inputs", intent.inputs);
    output << BuildDataFlowMarkdown("Outputs", intent.outputs);
    output << BuildSideEffectsMarkdown(intent.side_effects);
    output << BuildDependenciesMarkdown(intent.dependencies);
    output << BuildComplexityMarkdown(intent.complexity);
    output << BuildListMarkdown("Patterns", intent.patterns);
    output << BuildListMarkdown("Anti-Patterns", intent.anti_patterns);
    output << BuildListMarkdown("Suggestions", intent.suggestions);
    output << BuildDiagnosticsMarkdown(intent.diagnostics);
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(options.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildHeaderJson(options, timestamp) << ", ";
    output << "\"intent\": " << SerializeIntent(intent);
    output << "}";
    report.json = output.str();
  }
  return report;
}

} // namespace intent
