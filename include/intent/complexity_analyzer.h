#pragma once

#include <intent/ast.h>
#include <intent/models.h>
#include <intent/registry.h>

#include <memory>

namespace intent {

inline constexpr int kMaxCognitive = 100;
inline constexpr int kMaxCoupling = 100;

class ComplexityAnalyzer {
public:
  explicit ComplexityAnalyzer(std::shared_ptr<const AnalysisRegistry> registry);

  ComplexityAnalysis Analyze(const ast::Node &program) const;

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
};

} // namespace intent
