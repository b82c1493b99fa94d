#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace intent {

enum class Category { kBusiness, kInfrastructure, kUtility, kSecurity, kData };

enum class FlowSource { kParameter, kDatabase, kApi, kFile, kUser, kInternal };

enum class Sensitivity { kPublic, kPrivate, kSensitive, kCritical };

enum class SideEffectType { kDatabase, kFile, kNetwork, kConsole, kGlobal, kAsync };

enum class Risk { kLow, kMedium, kHigh };

enum class DependencyType { kInternal, kExternal, kSystem };

enum class DiagnosticSeverity { kWarning, kError };

struct AnalysisContext {
  std::optional<std::string> file_name;
  std::optional<std::string> project_type;
  std::vector<std::string> dependencies;
};

struct DataFlow {
  std::string name;
  std::string type;
  FlowSource source = FlowSource::kParameter;
  std::vector<std::string> validation;
  std::vector<std::string> transformations;
  Sensitivity sensitivity = Sensitivity::kPublic;

  bool operator==(const DataFlow &other) const = default;
};

struct SideEffect {
  SideEffectType type = SideEffectType::kConsole;
  std::string action;
  std::optional<std::string> target;
  Risk risk = Risk::kLow;

  bool operator==(const SideEffect &other) const = default;
};

struct Dependency {
  std::string name;
  DependencyType type = DependencyType::kExternal;
  std::string purpose;
  bool critical = false;

  bool operator==(const Dependency &other) const = default;
};

struct ComplexityAnalysis {
  int cognitive = 0;
  int cyclomatic = 1;
  int depth = 0;
  int coupling = 0;
  int cohesion = 100;

  bool operator==(const ComplexityAnalysis &other) const = default;
};

struct Diagnostic {
  std::string facet;
  DiagnosticSeverity severity = DiagnosticSeverity::kWarning;
  std::string message;
  std::optional<int> line;
  std::optional<int> column;

  bool operator==(const Diagnostic &other) const = default;
};

struct CodeIntent {
  std::string purpose;
  Category category = Category::kInfrastructure;
  std::vector<std::string> actions;
  std::vector<DataFlow> inputs;
  std::vector<DataFlow> outputs;
  std::vector<SideEffect> side_effects;
  std::vector<Dependency> dependencies;
  ComplexityAnalysis complexity;
  std::vector<std::string> patterns;
  std::vector<std::string> anti_patterns;
  std::vector<std::string> suggestions;
  double confidence = 0.0;
  std::vector<Diagnostic> diagnostics;

  bool operator==(const CodeIntent &other) const = default;
};

struct MetricPayload {
  std::string type;
  std::size_t size = 0;

  bool operator==(const MetricPayload &other) const = default;
};

// One analysis call as reported to the performance tracker.
struct ToolMetric {
  std::string tool_id;
  std::string operation;
  std::chrono::system_clock::time_point timestamp;
  std::chrono::milliseconds duration{0};
  bool success = false;
  MetricPayload input;
  MetricPayload output;
  double confidence = 0.0;
  std::optional<std::string> error;
};

// Findings forwarded to other tools over the insight bus.
struct Insight {
  std::string type;
  std::vector<std::string> anti_patterns;
  std::vector<SideEffect> risky_effects;
  double confidence = 0.0;
  std::vector<std::string> affects;
};

// Fixed risk for each side effect kind.
Risk RiskFor(SideEffectType type);

std::string ToString(Category category);
std::string ToString(FlowSource source);
std::string ToString(Sensitivity sensitivity);
std::string ToString(SideEffectType type);
std::string ToString(Risk risk);
std::string ToString(DependencyType type);
std::string ToString(DiagnosticSeverity severity);

Category ParseCategory(const std::string &value);
FlowSource ParseFlowSource(const std::string &value);
Sensitivity ParseSensitivity(const std::string &value);
SideEffectType ParseSideEffectType(const std::string &value);
Risk ParseRisk(const std::string &value);
DependencyType ParseDependencyType(const std::string &value);
DiagnosticSeverity ParseDiagnosticSeverity(const std::string &value);

} // namespace intent
