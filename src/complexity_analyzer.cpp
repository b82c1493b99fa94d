#include <intent/complexity_analyzer.h>

#include <intent/ast_visitor.h>
#include <intent/text.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace intent {
namespace {

using namespace ast;

// Nodes that open a bracket or brace scope.
bool OpensScope(const Node &node) {
  return node.Is<BlockStatement>() || node.Is<ClassDeclaration>() ||
         node.Is<ClassExpression>() || node.Is<SwitchStatement>() ||
         node.Is<ObjectExpression>() || node.Is<ArrayExpression>() ||
         node.Is<ObjectPattern>() || node.Is<ArrayPattern>();
}

class ComplexityVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit ComplexityVisitor(const AnalysisRegistry &registry)
      : registry_(registry) {}

  void Visit(const Node &node, const Program &) override { Enter(node); }
  void Visit(const Node &node, const BlockStatement &) override {
    Enter(node);
  }
  void Visit(const Node &node, const ClassDeclaration &) override {
    Enter(node);
  }
  void Visit(const Node &node, const ClassExpression &) override {
    Enter(node);
  }
  void Visit(const Node &node, const ObjectExpression &) override {
    Enter(node);
  }
  void Visit(const Node &node, const ArrayExpression &) override {
    Enter(node);
  }
  void Visit(const Node &node, const ObjectPattern &) override { Enter(node); }
  void Visit(const Node &node, const ArrayPattern &) override { Enter(node); }

  void Visit(const Node &, const IfStatement &statement) override {
    cognitive_ += statement.alternate ? 2 : 1;
    ++cyclomatic_;
  }

  void Visit(const Node &, const ForStatement &) override { Loop(); }
  void Visit(const Node &, const ForInStatement &) override { Loop(); }
  void Visit(const Node &, const ForOfStatement &) override { Loop(); }
  void Visit(const Node &, const WhileStatement &) override { Loop(); }
  void Visit(const Node &, const DoWhileStatement &) override { Loop(); }

  void Visit(const Node &node, const SwitchStatement &) override {
    Enter(node);
    cognitive_ += 2;
  }

  void Visit(const Node &, const SwitchCase &) override { ++cyclomatic_; }

  void Visit(const Node &, const TryStatement &) override { cognitive_ += 2; }

  void Visit(const Node &, const CatchClause &) override { ++cyclomatic_; }

  void Visit(const Node &, const ConditionalExpression &) override {
    ++cognitive_;
    ++cyclomatic_;
  }

  void Visit(const Node &, const LogicalExpression &expression) override {
    if (expression.op == "&&" || expression.op == "||") {
      ++cyclomatic_;
    }
  }

  void Visit(const Node &, const CallExpression &call) override {
    if (!call.callee) {
      return;
    }
    if (const auto *member = call.callee->As<MemberExpression>()) {
      if (!IsOneOf(IdentifierName(member->object.get()),
                   registry_.builtin_receivers)) {
        ++coupling_;
      }
    }
  }

  void Visit(const Node &node, const FunctionDeclaration &) override {
    CountFunction(node);
  }

  void Visit(const Node &node, const ArrowFunctionExpression &) override {
    CountFunction(node);
  }

  void Leave(const Node &node) override {
    if ((node.Is<Program>() || OpensScope(node)) && current_depth_ > 0) {
      --current_depth_;
    }
  }

  ComplexityAnalysis Result() const {
    ComplexityAnalysis analysis;
    analysis.cognitive = std::min(cognitive_, kMaxCognitive);
    analysis.cyclomatic = cyclomatic_;
    // The program scope itself does not count as nesting.
    analysis.depth = std::max(max_depth_ - 1, 0);
    analysis.coupling = std::min(coupling_, kMaxCoupling);
    analysis.cohesion =
        total_functions_ > 0
            ? static_cast<int>(std::lround(related_functions_ * 100.0 /
                                           total_functions_))
            : 100;
    return analysis;
  }

private:
  void Enter(const Node &) {
    ++current_depth_;
    max_depth_ = std::max(max_depth_, current_depth_);
  }

  void Loop() {
    cognitive_ += 2;
    ++cyclomatic_;
  }

  void CountFunction(const Node &node) {
    ++total_functions_;
    if (!registry_.functions_related || registry_.functions_related(node)) {
      ++related_functions_;
    }
  }

  const AnalysisRegistry &registry_;
  int cognitive_ = 0;
  int cyclomatic_ = 1;
  int current_depth_ = 0;
  int max_depth_ = 0;
  int coupling_ = 0;
  int total_functions_ = 0;
  int related_functions_ = 0;
};

} // namespace

ComplexityAnalyzer::ComplexityAnalyzer(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)) {}

ComplexityAnalysis ComplexityAnalyzer::Analyze(const Node &program) const {
  ComplexityVisitor visitor(*registry_);
  Walk(program, visitor);
  return visitor.Result();
}

} // namespace intent
