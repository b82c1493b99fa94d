#pragma once

#include <intent/ast.h>
#include <intent/models.h>
#include <intent/registry.h>

#include <memory>
#include <string>
#include <vector>

namespace intent {

struct DataFlowResult {
  std::vector<DataFlow> inputs;
  std::vector<DataFlow> outputs;
};

// Inputs are the parameters of function declarations, outputs the values of
// return statements.
class DataFlowAnalyzer {
public:
  explicit DataFlowAnalyzer(std::shared_ptr<const AnalysisRegistry> registry);

  DataFlowResult Analyze(const ast::Node &program) const;

  Sensitivity ClassifySensitivity(const std::string &name) const;

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
};

// "<method> operation" for member calls, "function call" for other calls,
// "<op> operation" for binary expressions, otherwise "transformation".
std::string DescribeOperation(const ast::Node &expression);

// string, number, boolean, array, object or function for literal shapes;
// empty when the shape says nothing.
std::string LiteralShape(const ast::Node &expression);

} // namespace intent
