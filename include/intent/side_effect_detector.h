#pragma once

#include <intent/ast.h>
#include <intent/models.h>
#include <intent/registry.h>

#include <memory>
#include <vector>

namespace intent {

struct SideEffectResult {
  std::vector<SideEffect> effects;
  // Every `await` seen; the effect list only carries one async marker.
  int await_count = 0;
};

class SideEffectDetector {
public:
  explicit SideEffectDetector(std::shared_ptr<const AnalysisRegistry> registry);

  SideEffectResult Detect(const ast::Node &program) const;

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
};

} // namespace intent
