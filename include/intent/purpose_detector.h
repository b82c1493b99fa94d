#pragma once

#include <intent/ast.h>
#include <intent/models.h>
#include <intent/registry.h>

#include <memory>
#include <string>
#include <vector>

namespace intent {

inline constexpr char kGeneralPurpose[] = "General purpose code";

// Purpose labels from decorators, call targets, JSX and naming conventions,
// joined with " + " in visitation order.
class PurposeDetector {
public:
  explicit PurposeDetector(std::shared_ptr<const AnalysisRegistry> registry);

  std::string Detect(const ast::Node &program,
                     const AnalysisContext &context) const;

  // Called functions as `object.property` or `name`, first ten distinct.
  std::vector<std::string> ExtractActions(const ast::Node &program) const;

  static Category Categorize(const std::string &purpose);

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
};

} // namespace intent
