#pragma once

#include <intent/ast.h>
#include <intent/models.h>
#include <intent/registry.h>

#include <memory>
#include <string>
#include <vector>

namespace intent {

// Modules referenced through `import`, `import()` and `require()`, plus any
// caller-declared dependencies the code itself does not mention.
class DependencyExtractor {
public:
  explicit DependencyExtractor(
      std::shared_ptr<const AnalysisRegistry> registry);

  std::vector<Dependency> Extract(const ast::Node &program,
                                  const AnalysisContext &context) const;

  Dependency Describe(const std::string &specifier) const;

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
};

} // namespace intent
