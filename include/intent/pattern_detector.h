#pragma once

#include <intent/ast.h>
#include <intent/registry.h>

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace intent {

// Design patterns, each matched by its own predicate over the tree or the raw
// source. Results keep the fixed predicate order.
class PatternDetector {
public:
  // Throws std::regex_error when a registry pattern does not compile.
  explicit PatternDetector(std::shared_ptr<const AnalysisRegistry> registry);

  std::vector<std::string> Detect(const ast::Node &program,
                                  const std::string &code) const;

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
  std::regex singleton_;
  std::regex factory_name_;
  std::regex observer_;
};

class AntiPatternDetector {
public:
  explicit AntiPatternDetector(
      std::shared_ptr<const AnalysisRegistry> registry);

  std::vector<std::string> Detect(const ast::Node &program,
                                  const std::string &code) const;

private:
  std::shared_ptr<const AnalysisRegistry> registry_;
};

// True when some run of five consecutive lines appears twice.
bool HasDuplicatedLines(const std::string &code);

} // namespace intent
