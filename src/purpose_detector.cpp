#include <intent/purpose_detector.h>

#include <intent/ast_visitor.h>
#include <intent/text.h>

#include <utility>

namespace intent {
namespace {

using namespace ast;

constexpr std::size_t kMaxActions = 10;

class PurposeVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit PurposeVisitor(const AnalysisRegistry &registry)
      : registry_(registry) {}

  void Visit(const Node &, const Decorator &decorator) override {
    if (!decorator.expression) {
      return;
    }
    const auto *call = decorator.expression->As<CallExpression>();
    const auto name = call != nullptr
                          ? IdentifierName(call->callee.get())
                          : IdentifierName(decorator.expression.get());
    if (IsOneOf(name, registry_.api_decorators)) {
      labels_.push_back("API endpoint");
    }
  }

  void Visit(const Node &, const CallExpression &call) override {
    if (!call.callee) {
      return;
    }
    if (const auto *member = call.callee->As<MemberExpression>()) {
      const auto property =
          member->computed ? "" : IdentifierName(member->property.get());
      if (IsOneOf(property, registry_.database_purpose_methods)) {
        labels_.push_back("Database operation");
      }
    }
    const auto name = IdentifierName(call.callee.get());
    if (name.empty()) {
      return;
    }
    if (IsOneOf(name, registry_.auth_functions)) {
      labels_.push_back("Authentication");
    }
    if (ContainsAny(name, registry_.validation_keywords)) {
      labels_.push_back("Input validation");
    }
  }

  void Visit(const Node &, const JsxElement &) override {
    labels_.push_back("UI component");
  }

  void Visit(const Node &, const FunctionDeclaration &function) override {
    for (const auto &prefix : registry_.event_handler_prefixes) {
      if (StartsWith(function.name, prefix)) {
        labels_.push_back("Event handler");
        return;
      }
    }
  }

  void Visit(const Node &, const ClassDeclaration &klass) override {
    for (const auto &[needle, label] : registry_.class_purposes) {
      if (Contains(klass.name, needle)) {
        labels_.push_back(label);
      }
    }
  }

  const std::vector<std::string> &labels() const { return labels_; }

private:
  const AnalysisRegistry &registry_;
  std::vector<std::string> labels_;
};

class ActionVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  void Visit(const Node &, const CallExpression &call) override {
    if (!call.callee || actions_.size() >= kMaxActions) {
      return;
    }
    if (call.callee->Is<MemberExpression>()) {
      AppendUnique(actions_, DottedName(*call.callee));
      return;
    }
    const auto name = IdentifierName(call.callee.get());
    if (!name.empty() && !IsReservedWord(name)) {
      AppendUnique(actions_, name);
    }
  }

  std::vector<std::string> TakeActions() { return std::move(actions_); }

private:
  std::vector<std::string> actions_;
};

std::string JoinLabels(const std::vector<std::string> &labels) {
  std::string joined;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) {
      joined += " + ";
    }
    joined += labels[i];
  }
  return joined;
}

} // namespace

PurposeDetector::PurposeDetector(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)) {}

std::string PurposeDetector::Detect(const Node &program,
                                    const AnalysisContext &context) const {
  PurposeVisitor visitor(*registry_);
  Walk(program, visitor);
  if (!visitor.labels().empty()) {
    return JoinLabels(visitor.labels());
  }

  if (context.file_name) {
    const auto file_name = ToLower(*context.file_name);
    for (const auto &[needle, label] : registry_->file_name_purposes) {
      if (Contains(file_name, needle)) {
        return label;
      }
    }
  }
  return kGeneralPurpose;
}

std::vector<std::string>
PurposeDetector::ExtractActions(const Node &program) const {
  ActionVisitor visitor;
  Walk(program, visitor);
  return visitor.TakeActions();
}

Category PurposeDetector::Categorize(const std::string &purpose) {
  if (Contains(purpose, "Auth")) {
    return Category::kSecurity;
  }
  if (Contains(purpose, "Database") || Contains(purpose, "Repository")) {
    return Category::kData;
  }
  if (Contains(purpose, "Controller") || Contains(purpose, "API")) {
    return Category::kBusiness;
  }
  if (Contains(purpose, "Service") || Contains(purpose, "Helper")) {
    return Category::kUtility;
  }
  return Category::kInfrastructure;
}

} // namespace intent
