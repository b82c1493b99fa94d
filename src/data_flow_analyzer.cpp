#include <intent/data_flow_analyzer.h>

#include <intent/ast_visitor.h>
#include <intent/errors.h>
#include <intent/text.h>

#include <utility>
#include <vector>

namespace intent {
namespace {

using namespace ast;

constexpr char kFacet[] = "data_flow";

const std::vector<std::string> kStringMethods = {
    "toUpperCase", "toLowerCase", "trim",     "trimStart", "trimEnd",
    "split",       "substring",   "substr",   "startsWith", "endsWith",
    "replace",     "replaceAll",  "charAt",   "charCodeAt", "padStart",
    "padEnd",      "localeCompare", "normalize", "match"};

const std::vector<std::string> kArrayMethods = {
    "map",  "filter", "reduce",    "forEach", "push",    "pop",
    "shift", "unshift", "some",    "every",   "flatMap", "findIndex",
    "sort", "reverse", "splice"};

const std::vector<std::string> kNumberMethods = {"toFixed", "toPrecision",
                                                 "toExponential"};

const std::vector<std::string> kComparisonOperators = {
    "==", "===", "!=", "!==", "<", ">", "<=", ">="};

bool IsNamed(const Node *node, const std::string &name) {
  return node != nullptr && IdentifierName(node) == name;
}

class ReferenceFinder : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit ReferenceFinder(const std::string &name) : name_(name) {}

  void Visit(const Node &, const Identifier &identifier) override {
    if (identifier.role != IdentifierRole::kPropertyName &&
        identifier.name == name_) {
      found_ = true;
    }
  }

  bool found() const { return found_; }

private:
  const std::string &name_;
  bool found_ = false;
};

bool ReferencesName(const NodeList &nodes, const std::string &name) {
  ReferenceFinder finder(name);
  for (const auto &node : nodes) {
    if (node) {
      Walk(*node, finder);
    }
  }
  return finder.found();
}

// First usage of `name` that reveals its type.
class UsageTypeVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit UsageTypeVisitor(const std::string &name) : name_(name) {}

  void Visit(const Node &, const CallExpression &call) override {
    if (!type_.empty() || !call.callee) {
      return;
    }
    const auto *member = call.callee->As<MemberExpression>();
    if (member == nullptr || member->computed ||
        !IsNamed(member->object.get(), name_)) {
      return;
    }
    const auto method = IdentifierName(member->property.get());
    if (IsOneOf(method, kStringMethods)) {
      type_ = "string";
    } else if (IsOneOf(method, kArrayMethods)) {
      type_ = "array";
    } else if (IsOneOf(method, kNumberMethods)) {
      type_ = "number";
    }
  }

  void Visit(const Node &, const BinaryExpression &binary) override {
    if (!type_.empty() || !binary.left || !binary.right ||
        !IsOneOf(binary.op, kComparisonOperators)) {
      return;
    }
    if (IsNamed(binary.left.get(), name_)) {
      type_ = LiteralShape(*binary.right);
    } else if (IsNamed(binary.right.get(), name_)) {
      type_ = LiteralShape(*binary.left);
    }
  }

  const std::string &type() const { return type_; }

private:
  const std::string &name_;
  std::string type_;
};

class ValidationVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  ValidationVisitor(const AnalysisRegistry &registry, const std::string &name)
      : registry_(registry), name_(name) {}

  void Visit(const Node &, const CallExpression &call) override {
    if (!call.callee) {
      return;
    }
    const auto callee = CalleeName(*call.callee);
    if (callee.empty() ||
        !ContainsAny(callee, registry_.validation_keywords, true) ||
        !ReferencesName(call.arguments, name_)) {
      return;
    }
    AppendUnique(validations_, call.callee->Is<MemberExpression>()
                                   ? DottedName(*call.callee)
                                   : callee);
  }

  std::vector<std::string> TakeValidations() {
    return std::move(validations_);
  }

private:
  const AnalysisRegistry &registry_;
  const std::string &name_;
  std::vector<std::string> validations_;
};

std::string DescribeAssignment(const AssignmentExpression &assignment) {
  if (assignment.op != "=" && assignment.op.size() > 1) {
    return assignment.op.substr(0, assignment.op.size() - 1) + " operation";
  }
  return assignment.right ? DescribeOperation(*assignment.right)
                          : "transformation";
}

// Initializers of and assignments to `name`, in source order.
class HistoryVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  explicit HistoryVisitor(const std::string &name) : name_(name) {}

  void Visit(const Node &, const VariableDeclarator &declarator) override {
    if (IsNamed(declarator.id.get(), name_) && declarator.init) {
      history_.push_back(DescribeOperation(*declarator.init));
    }
  }

  void Visit(const Node &, const AssignmentExpression &assignment) override {
    if (IsNamed(assignment.left.get(), name_)) {
      history_.push_back(DescribeAssignment(assignment));
    }
  }

  std::vector<std::string> TakeHistory() { return std::move(history_); }

private:
  const std::string &name_;
  std::vector<std::string> history_;
};

class DataFlowVisitor : public AstVisitor {
public:
  using AstVisitor::Visit;

  DataFlowVisitor(const DataFlowAnalyzer &analyzer,
                  const AnalysisRegistry &registry, const Node &program)
      : analyzer_(analyzer), registry_(registry) {
    scopes_.push_back(&program);
  }

  void Visit(const Node &node, const FunctionDeclaration &function) override {
    if (!function.body) {
      throw ExtractorError(kFacet, "Function '" + function.name +
                                       "' has no body");
    }
    for (const auto &param : function.params) {
      if (param) {
        AddInput(*param, *function.body);
      }
    }
    EnterScope(node, *function.body);
  }

  void Visit(const Node &node, const FunctionExpression &function) override {
    if (function.body) {
      EnterScope(node, *function.body);
    }
  }

  void Visit(const Node &node,
             const ArrowFunctionExpression &function) override {
    if (function.body) {
      EnterScope(node, *function.body);
    }
  }

  void Visit(const Node &node, const ClassMethod &method) override {
    if (method.body) {
      EnterScope(node, *method.body);
    }
  }

  void Leave(const Node &node) override {
    if (!owners_.empty() && owners_.back() == &node) {
      owners_.pop_back();
      scopes_.pop_back();
    }
  }

  void Visit(const Node &, const ReturnStatement &statement) override {
    if (!statement.argument) {
      return;
    }
    const auto &argument = *statement.argument;
    DataFlow output;
    output.name = "return";
    output.type = LiteralShape(argument);
    if (output.type.empty()) {
      output.type = "unknown";
    }
    output.source = FlowSource::kInternal;
    const auto name = IdentifierName(&argument);
    if (name.empty()) {
      output.transformations.push_back(DescribeOperation(argument));
    } else {
      HistoryVisitor history(name);
      Walk(*scopes_.back(), history);
      output.transformations = history.TakeHistory();
    }
    result_.outputs.push_back(std::move(output));
  }

  DataFlowResult TakeResult() { return std::move(result_); }

private:
  void EnterScope(const Node &owner, const Node &body) {
    owners_.push_back(&owner);
    scopes_.push_back(&body);
  }

  void AddInput(const Node &param, const Node &body) {
    const Node *binding = &param;
    const Node *default_value = nullptr;
    if (const auto *pattern = param.As<AssignmentPattern>()) {
      binding = pattern->left.get();
      default_value = pattern->right.get();
    }
    const auto *identifier =
        binding != nullptr ? binding->As<Identifier>() : nullptr;
    if (identifier == nullptr) {
      return;
    }

    DataFlow input;
    input.name = identifier->name;
    input.source = FlowSource::kParameter;
    input.type = InferParameterType(*identifier, default_value, body);

    ValidationVisitor validation(registry_, identifier->name);
    Walk(body, validation);
    input.validation = validation.TakeValidations();

    HistoryVisitor history(identifier->name);
    Walk(body, history);
    input.transformations = history.TakeHistory();

    input.sensitivity = analyzer_.ClassifySensitivity(identifier->name);
    result_.inputs.push_back(std::move(input));
  }

  static std::string InferParameterType(const Identifier &identifier,
                                        const Node *default_value,
                                        const Node &body) {
    if (identifier.type) {
      if (!identifier.type->keyword.empty()) {
        return identifier.type->keyword;
      }
      if (!identifier.type->text.empty()) {
        return identifier.type->text;
      }
    }
    if (default_value != nullptr) {
      auto shape = LiteralShape(*default_value);
      if (!shape.empty()) {
        return shape;
      }
    }
    UsageTypeVisitor usage(identifier.name);
    Walk(body, usage);
    if (!usage.type().empty()) {
      return usage.type();
    }
    return "unknown";
  }

  const DataFlowAnalyzer &analyzer_;
  const AnalysisRegistry &registry_;
  std::vector<const Node *> owners_;
  std::vector<const Node *> scopes_;
  DataFlowResult result_;
};

} // namespace

std::string DescribeOperation(const Node &expression) {
  if (const auto *call = expression.As<CallExpression>()) {
    if (call->callee) {
      if (const auto *member = call->callee->As<MemberExpression>()) {
        const auto property =
            member->computed ? "" : IdentifierName(member->property.get());
        if (!property.empty()) {
          return property + " operation";
        }
      }
    }
    return "function call";
  }
  if (const auto *binary = expression.As<BinaryExpression>()) {
    return binary->op + " operation";
  }
  return "transformation";
}

std::string LiteralShape(const Node &expression) {
  if (expression.Is<StringLiteral>() || expression.Is<TemplateLiteral>()) {
    return "string";
  }
  if (expression.Is<NumericLiteral>()) {
    return "number";
  }
  if (const auto *unary = expression.As<UnaryExpression>()) {
    if ((unary->op == "-" || unary->op == "+") && unary->argument &&
        unary->argument->Is<NumericLiteral>()) {
      return "number";
    }
    return "";
  }
  if (expression.Is<BooleanLiteral>()) {
    return "boolean";
  }
  if (expression.Is<ArrayExpression>()) {
    return "array";
  }
  if (expression.Is<ObjectExpression>()) {
    return "object";
  }
  if (IsFunctionLike(expression)) {
    return "function";
  }
  return "";
}

DataFlowAnalyzer::DataFlowAnalyzer(
    std::shared_ptr<const AnalysisRegistry> registry)
    : registry_(std::move(registry)) {}

DataFlowResult DataFlowAnalyzer::Analyze(const Node &program) const {
  DataFlowVisitor visitor(*this, *registry_, program);
  Walk(program, visitor);
  return visitor.TakeResult();
}

Sensitivity
DataFlowAnalyzer::ClassifySensitivity(const std::string &name) const {
  const auto lowered = ToLower(name);
  if (ContainsAny(lowered, registry_->critical_keywords, true)) {
    return Sensitivity::kCritical;
  }
  if (ContainsAny(lowered, registry_->sensitive_keywords, true)) {
    return Sensitivity::kSensitive;
  }
  if (ContainsAny(lowered, registry_->private_keywords, true)) {
    return Sensitivity::kPrivate;
  }
  return Sensitivity::kPublic;
}

} // namespace intent
