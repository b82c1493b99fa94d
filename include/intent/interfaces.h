#pragma once

#include <intent/ast.h>
#include <intent/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace intent {

struct ParseOptions {
  bool typescript = true;
  bool jsx = true;
  bool decorators = true;
  std::size_t max_recovered_errors = 50;
};

struct ParseResult {
  ast::NodePtr program;
  // Recovered syntax errors, facet "parser".
  std::vector<Diagnostic> diagnostics;
  bool has_type_annotations = false;
  std::size_t comment_count = 0;
};

class SourceParser {
public:
  virtual ~SourceParser() = default;
  virtual ParseResult Parse(const std::string &source) = 0;
};

class PerformanceTracker {
public:
  virtual ~PerformanceTracker() = default;
  virtual void Track(const ToolMetric &metric) = 0;
};

class InsightBus {
public:
  virtual ~InsightBus() = default;
  virtual void ShareInsight(const std::string &source_id,
                            const Insight &insight) = 0;
};

class IntentAnalyzer {
public:
  virtual ~IntentAnalyzer() = default;
  virtual CodeIntent Analyze(const std::string &code,
                             const AnalysisContext &context) = 0;
};

} // namespace intent
