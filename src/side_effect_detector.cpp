#include <intent/side_effect_detector.h>

#include <intent/ast_visitor.h>
#include <intent/text.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace intent {
namespace {

using namespace ast;

SideEffect MakeEffect(SideEffectType type, std::string action,
                      std::optional<std::string> target) {
  SideEffect effect;
  effect.type = type;
  effect.action = std::move(action);
  effect.target = std::move(target);
  effect.risk = RiskFor(type);
  return effect;
}

std::string FirstStringArgument(const CallExpression &call) {
  if (!call.arguments.empty() && call.arguments.front()) {
    if (const auto *literal = call.arguments.front()->As<StringLiteral>()) {
      return literal->value;
    }
  }
  return "unknown";
}

class SideEffectVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit SideEffectVisitor(const AnalysisRegistry &registry)
      : registry_(registry) {}

  void Visit(const Node &, const CallExpression &call) override {
    if (!call.callee) {
      return;
    }
    const auto &callee = *call.callee;
    const auto *member = callee.As<MemberExpression>();

    if (member != nullptr) {
      const auto object = IdentifierName(member->object.get());
      const auto property =
          member->computed ? std::string{} : IdentifierName(member->property.get());

      if (IsOneOf(property, registry_.database_write_methods)) {
        Add(SideEffectType::kDatabase, "write", DottedName(callee));
      }
      if (IsOneOf(IdentifierName(RootObject(callee)),
                  registry_.filesystem_modules)) {
        Add(SideEffectType::kFile, property.empty() ? "unknown" : property,
            DottedName(callee));
      }
      if (IsOneOf(object, registry_.network_identifiers)) {
        Add(SideEffectType::kNetwork, "request", FirstStringArgument(call));
      }
      if (object == "console" && IsOneOf(property, registry_.console_methods)) {
        Add(SideEffectType::kConsole, "log", std::nullopt);
      }
      return;
    }

    if (IsOneOf(IdentifierName(&callee), registry_.network_identifiers)) {
      Add(SideEffectType::kNetwork, "request", FirstStringArgument(call));
    }
  }

  void Visit(const Node &, const AssignmentExpression &assignment) override {
    if (!assignment.left) {
      return;
    }
    const auto *member = assignment.left->As<MemberExpression>();
    if (member != nullptr && IsOneOf(IdentifierName(member->object.get()),
                                     registry_.global_objects)) {
      Add(SideEffectType::kGlobal, "mutation", DottedName(*assignment.left));
    }
  }

  void Visit(const Node &, const AwaitExpression &) override {
    ++result_.await_count;
    const auto has_marker =
        std::any_of(result_.effects.begin(), result_.effects.end(),
                    [](const SideEffect &effect) {
                      return effect.type == SideEffectType::kAsync;
                    });
    if (!has_marker) {
      Add(SideEffectType::kAsync, "await", std::nullopt);
    }
  }

  SideEffectResult TakeResult() { return std::move(result_); }

private:
  void Add(SideEffectType type, std::string action,
           std::optional<std::string> target) {
    result_.effects.push_back(
        MakeEffect(type, std::move(action), std::move(target)));
  }

  const AnalysisRegistry &registry_;
  SideEffectResult result_;
};

} // namespace

SideEffectDetector::SideEffectDetector(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)) {}

SideEffectResult SideEffectDetector::Detect(const Node &program) const {
  SideEffectVisitor visitor(*registry_);
  Walk(program, visitor);
  return visitor.TakeResult();
}

} // namespace intent
