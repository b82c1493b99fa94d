#include <intent/dependency_extractor.h>

#include <intent/ast_visitor.h>
#include <intent/text.h>

#include <unordered_set>
#include <utility>

namespace intent {
namespace {

using namespace ast;

constexpr char kFallbackPurpose[] = "General dependency";

class SpecifierVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  void Visit(const Node &, const ImportDeclaration &declaration) override {
    Add(declaration.source);
  }

  void Visit(const Node &, const CallExpression &call) override {
    if (!call.callee || call.arguments.empty() || !call.arguments.front()) {
      return;
    }
    const auto name = IdentifierName(call.callee.get());
    if (name != "require" && name != "import") {
      return;
    }
    if (const auto *literal = call.arguments.front()->As<StringLiteral>()) {
      Add(literal->value);
    }
  }

  const std::vector<std::string> &specifiers() const { return specifiers_; }

private:
  void Add(const std::string &specifier) {
    if (!specifier.empty() && seen_.insert(specifier).second) {
      specifiers_.push_back(specifier);
    }
  }

  std::unordered_set<std::string> seen_;
  std::vector<std::string> specifiers_;
};

} // namespace

DependencyExtractor::DependencyExtractor(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)) {}

std::vector<Dependency>
DependencyExtractor::Extract(const Node &program,
                             const AnalysisContext &context) const {
  SpecifierVisitor visitor;
  Walk(program, visitor);

  std::vector<Dependency> dependencies;
  std::unordered_set<std::string> seen;
  for (const auto &specifier : visitor.specifiers()) {
    seen.insert(specifier);
    dependencies.push_back(Describe(specifier));
  }
  for (const auto &declared : context.dependencies) {
    const auto specifier = Trim(declared);
    if (!specifier.empty() && seen.insert(specifier).second) {
      dependencies.push_back(Describe(specifier));
    }
  }
  return dependencies;
}

Dependency DependencyExtractor::Describe(const std::string &specifier) const {
  Dependency dependency;
  dependency.name = specifier;
  if (StartsWith(specifier, ".")) {
    dependency.type = DependencyType::kInternal;
  } else if (StartsWith(specifier, "node:") ||
             IsOneOf(specifier, registry_->builtin_modules)) {
    dependency.type = DependencyType::kSystem;
  } else {
    dependency.type = DependencyType::kExternal;
  }

  dependency.purpose = kFallbackPurpose;
  for (const auto &[needle, label] : registry_->dependency_purposes) {
    if (Contains(specifier, needle)) {
      dependency.purpose = label;
      break;
    }
  }
  dependency.critical =
      ContainsAny(specifier, registry_->critical_dependency_keywords, true);
  return dependency;
}

} // namespace intent
