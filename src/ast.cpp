#include <intent/ast.h>
#include <intent/ast_visitor.h>

#include <algorithm>
#include <array>

namespace intent::ast {
namespace {

constexpr std::array<std::string_view, 41> kReservedWords = {
    "break",    "case",     "catch",  "class",      "const",  "continue",
    "debugger", "default",  "delete", "do",         "else",   "enum",
    "export",   "extends",  "false",  "finally",    "for",    "function",
    "if",       "import",   "in",     "instanceof", "new",    "null",
    "return",   "super",    "switch", "this",       "throw",  "true",
    "try",      "typeof",   "var",    "void",       "while",  "with",
    "let",      "static",   "yield",  "implements", "package"};

} // namespace

void Walk(const Node &root, AstVisitor &visitor) {
  std::visit([&](const auto &value) { visitor.Visit(root, value); },
             root.data);
  root.ForEachChild([&](const Node &child) { Walk(child, visitor); });
  visitor.Leave(root);
}

std::string IdentifierName(const Node *node) {
  if (node == nullptr) {
    return "";
  }
  if (const auto *identifier = node->As<Identifier>()) {
    return identifier->name;
  }
  return "";
}

std::string DottedName(const Node &member) {
  const auto *expression = member.As<MemberExpression>();
  if (expression == nullptr) {
    const auto name = IdentifierName(&member);
    return name.empty() ? "unknown" : name;
  }
  auto object = IdentifierName(expression->object.get());
  if (object.empty()) {
    object = "unknown";
  }
  auto property = expression->computed
                      ? std::string{}
                      : IdentifierName(expression->property.get());
  if (property.empty()) {
    property = "unknown";
  }
  return object + "." + property;
}

const Node *RootObject(const Node &member) {
  const Node *current = &member;
  while (const auto *expression = current->As<MemberExpression>()) {
    if (!expression->object) {
      break;
    }
    current = expression->object.get();
  }
  return current;
}

std::string CalleeName(const Node &callee) {
  if (const auto *identifier = callee.As<Identifier>()) {
    return identifier->name;
  }
  if (const auto *member = callee.As<MemberExpression>()) {
    if (!member->computed) {
      return IdentifierName(member->property.get());
    }
  }
  return "";
}

bool IsFunctionLike(const Node &node) { return AsFunction(node) != nullptr; }

const Function *AsFunction(const Node &node) {
  if (const auto *declaration = node.As<FunctionDeclaration>()) {
    return declaration;
  }
  if (const auto *expression = node.As<FunctionExpression>()) {
    return expression;
  }
  if (const auto *arrow = node.As<ArrowFunctionExpression>()) {
    return arrow;
  }
  return nullptr;
}

const Class *AsClass(const Node &node) {
  if (const auto *declaration = node.As<ClassDeclaration>()) {
    return declaration;
  }
  if (const auto *expression = node.As<ClassExpression>()) {
    return expression;
  }
  return nullptr;
}

bool IsReservedWord(std::string_view word) {
  return std::find(kReservedWords.begin(), kReservedWords.end(), word) !=
         kReservedWords.end();
}

} // namespace intent::ast
