#include <intent/pattern_detector.h>

#include <intent/ast_visitor.h>
#include <intent/text.h>

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace intent {
namespace {

using namespace ast;

constexpr int kGodObjectMethods = 20;
constexpr int kCallbackDepth = 5;
constexpr int kMagicNumbers = 5;
constexpr int kMaxParameters = 4;
constexpr int kBlockDepth = 4;
constexpr int kUnusedVariables = 2;
constexpr std::size_t kDuplicateWindow = 5;

class PatternVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit PatternVisitor(const std::regex &factory_name)
      : factory_name_(factory_name) {}

  void Visit(const Node &, const FunctionDeclaration &function) override {
    if (!function.name.empty() &&
        std::regex_search(function.name, factory_name_)) {
      factory = true;
    }
  }

  void Visit(const Node &, const ClassDeclaration &declaration) override {
    if (Contains(declaration.name, "Repository")) {
      repository = true;
    }
    InspectMembers(declaration);
  }

  void Visit(const Node &, const ClassExpression &expression) override {
    InspectMembers(expression);
  }

  bool factory = false;
  bool repository = false;
  bool dependency_injection = false;

private:
  void InspectMembers(const Class &type) {
    for (const auto &member : type.members) {
      const auto *method = member ? member->As<ClassMethod>() : nullptr;
      if (method != nullptr && method->kind == MethodKind::kConstructor &&
          !method->params.empty()) {
        dependency_injection = true;
      }
    }
  }

  const std::regex &factory_name_;
};

class AntiPatternVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit AntiPatternVisitor(const AnalysisRegistry &registry)
      : registry_(registry) {}

  void Visit(const Node &, const ClassDeclaration &declaration) override {
    CountMethods(declaration);
  }

  void Visit(const Node &, const ClassExpression &expression) override {
    CountMethods(expression);
  }

  void Visit(const Node &, const CallExpression &) override {
    ++call_depth_;
    max_call_depth = std::max(max_call_depth, call_depth_);
  }

  void Visit(const Node &, const BlockStatement &) override {
    ++block_depth_;
    max_block_depth = std::max(max_block_depth, block_depth_);
  }

  void Leave(const Node &node) override {
    if (node.Is<CallExpression>()) {
      --call_depth_;
    } else if (node.Is<BlockStatement>()) {
      --block_depth_;
    }
  }

  void Visit(const Node &, const NumericLiteral &literal) override {
    const auto &ordinary = registry_.ordinary_numbers;
    if (std::find(ordinary.begin(), ordinary.end(), literal.value) ==
        ordinary.end()) {
      ++magic_numbers;
    }
  }

  void Visit(const Node &, const FunctionDeclaration &function) override {
    if (static_cast<int>(function.params.size()) > kMaxParameters) {
      long_parameter_list = true;
    }
  }

  void Visit(const Node &, const VariableDeclarator &declarator) override {
    const auto name = IdentifierName(declarator.id.get());
    if (!name.empty()) {
      declared_.insert(name);
    }
  }

  void Visit(const Node &, const Identifier &identifier) override {
    if (identifier.role == IdentifierRole::kReference) {
      referenced_.insert(identifier.name);
    }
  }

  int UnusedVariables() const {
    return static_cast<int>(
        std::count_if(declared_.begin(), declared_.end(),
                      [&](const std::string &name) {
                        return referenced_.count(name) == 0;
                      }));
  }

  int max_methods = 0;
  int max_call_depth = 0;
  int max_block_depth = 0;
  int magic_numbers = 0;
  bool long_parameter_list = false;

private:
  void CountMethods(const Class &type) {
    const auto methods = std::count_if(
        type.members.begin(), type.members.end(),
        [](const NodePtr &member) { return member && member->Is<ClassMethod>(); });
    max_methods = std::max(max_methods, static_cast<int>(methods));
  }

  const AnalysisRegistry &registry_;
  int call_depth_ = 0;
  int block_depth_ = 0;
  std::unordered_set<std::string> declared_;
  std::unordered_set<std::string> referenced_;
};

} // namespace

bool HasDuplicatedLines(const std::string &code) {
  std::vector<std::string> lines;
  std::istringstream stream(code);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  if (!code.empty() && code.back() == '\n') {
    lines.emplace_back();
  }

  std::unordered_set<std::string> windows;
  for (std::size_t i = 0; i + kDuplicateWindow < lines.size(); ++i) {
    std::string window;
    for (std::size_t j = i; j < i + kDuplicateWindow; ++j) {
      if (j > i) {
        window += '\n';
      }
      window += lines[j];
    }
    if (!windows.insert(std::move(window)).second) {
      return true;
    }
  }
  return false;
}

PatternDetector::PatternDetector(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)), singleton_(registry_->singleton_pattern),
      factory_name_(registry_->factory_name_pattern),
      observer_(registry_->observer_pattern) {}

std::vector<std::string> PatternDetector::Detect(const Node &program,
                                                 const std::string &code) const {
  PatternVisitor visitor(factory_name_);
  Walk(program, visitor);

  std::vector<std::string> patterns;
  if (std::regex_search(code, singleton_)) {
    patterns.emplace_back("Singleton");
  }
  if (visitor.factory) {
    patterns.emplace_back("Factory");
  }
  if (std::regex_search(code, observer_)) {
    patterns.emplace_back("Observer/EventEmitter");
  }
  if (visitor.repository) {
    patterns.emplace_back("Repository");
  }
  if (visitor.dependency_injection) {
    patterns.emplace_back("Dependency Injection");
  }
  if (Contains(code, ".with") && Contains(code, ".build()")) {
    patterns.emplace_back("Builder");
  }
  if (Contains(code, "next()") || Contains(code, "middleware")) {
    patterns.emplace_back("Middleware");
  }
  return patterns;
}

AntiPatternDetector::AntiPatternDetector(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)) {}

std::vector<std::string>
AntiPatternDetector::Detect(const Node &program,
                            const std::string &code) const {
  AntiPatternVisitor visitor(*registry_);
  Walk(program, visitor);

  std::vector<std::string> anti_patterns;
  if (visitor.max_methods > kGodObjectMethods) {
    anti_patterns.emplace_back("God Object - too many responsibilities");
  }
  if (visitor.max_call_depth > kCallbackDepth) {
    anti_patterns.emplace_back("Callback Hell - use async/await");
  }
  if (visitor.magic_numbers > kMagicNumbers) {
    anti_patterns.emplace_back("Magic Numbers - use named constants");
  }
  if (HasDuplicatedLines(code)) {
    anti_patterns.emplace_back("Code Duplication - extract common logic");
  }
  if (visitor.long_parameter_list) {
    anti_patterns.emplace_back("Long Parameter List - use object parameters");
  }
  if (visitor.max_block_depth > kBlockDepth) {
    anti_patterns.emplace_back("Deep Nesting - simplify logic");
  }
  if (visitor.UnusedVariables() > kUnusedVariables) {
    anti_patterns.emplace_back("Unused Variables - remove dead code");
  }
  return anti_patterns;
}

} // namespace intent
