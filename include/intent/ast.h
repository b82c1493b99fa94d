#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace intent::ast {

struct SourceSpan {
  std::size_t offset = 0;
  std::size_t length = 0;
  int line = 1;
  int column = 1;
};

struct Node;
using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

// A TypeScript annotation kept as text. `keyword` is set for the primitive
// shapes the analyzer understands: string, number, boolean, array, object.
struct TypeAnnotation {
  std::string text;
  std::string keyword;
};

template <typename F> void VisitChild(F &f, const NodePtr &child) {
  if (child) {
    f(*child);
  }
}

template <typename F> void VisitChildren(F &f, const NodeList &children) {
  for (const auto &child : children) {
    VisitChild(f, child);
  }
}

struct Leaf {
  template <typename F> void ForEachChild(F &&) const {}
};

// --------------------
// Module level
// --------------------
struct Program {
  NodeList body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, body);
  }
};

// Region skipped by error recovery.
struct ErrorNode : Leaf {
  std::string message;
};

struct ImportSpecifier {
  std::string imported;
  std::string local;
};

struct ImportDeclaration : Leaf {
  std::string source;
  std::vector<ImportSpecifier> specifiers;
  bool type_only = false;
};

struct ExportDeclaration {
  NodePtr declaration;
  std::optional<std::string> source;
  std::vector<std::string> exported;
  bool is_default = false;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, declaration);
  }
};

// interface / type alias / enum / declare: recorded by name, body skipped.
struct TypeDeclaration : Leaf {
  std::string kind;
  std::string name;
};

// --------------------
// Declarations
// --------------------
struct VariableDeclaration {
  std::string kind;
  NodeList declarators;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, declarators);
  }
};

struct VariableDeclarator {
  NodePtr id;
  NodePtr init;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, id);
    VisitChild(f, init);
  }
};

struct Function {
  std::string name;
  NodeList params;
  NodePtr body;
  bool is_async = false;
  bool is_generator = false;
  std::optional<TypeAnnotation> return_type;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, params);
    VisitChild(f, body);
  }
};

struct FunctionDeclaration : Function {};
struct FunctionExpression : Function {};
struct ArrowFunctionExpression : Function {
  bool expression_body = false;
};

struct Class {
  std::string name;
  NodeList decorators;
  NodePtr super_class;
  NodeList members;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, decorators);
    VisitChild(f, super_class);
    VisitChildren(f, members);
  }
};

struct ClassDeclaration : Class {};
struct ClassExpression : Class {};

enum class MethodKind { kConstructor, kMethod, kGetter, kSetter };

struct ClassMethod {
  std::string key;
  NodePtr computed_key;
  MethodKind kind = MethodKind::kMethod;
  bool is_static = false;
  bool is_async = false;
  bool is_generator = false;
  NodeList decorators;
  NodeList params;
  NodePtr body;
  std::optional<TypeAnnotation> return_type;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, decorators);
    VisitChild(f, computed_key);
    VisitChildren(f, params);
    VisitChild(f, body);
  }
};

struct ClassProperty {
  std::string key;
  NodePtr computed_key;
  bool is_static = false;
  NodeList decorators;
  NodePtr value;
  std::optional<TypeAnnotation> type;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, decorators);
    VisitChild(f, computed_key);
    VisitChild(f, value);
  }
};

struct Decorator {
  NodePtr expression;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, expression);
  }
};

// --------------------
// Statements
// --------------------
struct BlockStatement {
  NodeList body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, body);
  }
};

struct ExpressionStatement {
  NodePtr expression;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, expression);
  }
};

struct EmptyStatement : Leaf {};

struct IfStatement {
  NodePtr test;
  NodePtr consequent;
  NodePtr alternate;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, test);
    VisitChild(f, consequent);
    VisitChild(f, alternate);
  }
};

struct ForStatement {
  NodePtr init;
  NodePtr test;
  NodePtr update;
  NodePtr body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, init);
    VisitChild(f, test);
    VisitChild(f, update);
    VisitChild(f, body);
  }
};

struct ForInStatement {
  NodePtr left;
  NodePtr right;
  NodePtr body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, left);
    VisitChild(f, right);
    VisitChild(f, body);
  }
};

struct ForOfStatement {
  NodePtr left;
  NodePtr right;
  NodePtr body;
  bool is_await = false;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, left);
    VisitChild(f, right);
    VisitChild(f, body);
  }
};

struct WhileStatement {
  NodePtr test;
  NodePtr body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, test);
    VisitChild(f, body);
  }
};

struct DoWhileStatement {
  NodePtr body;
  NodePtr test;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, body);
    VisitChild(f, test);
  }
};

struct SwitchStatement {
  NodePtr discriminant;
  NodeList cases;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, discriminant);
    VisitChildren(f, cases);
  }
};

// `test` is null for `default:`.
struct SwitchCase {
  NodePtr test;
  NodeList consequent;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, test);
    VisitChildren(f, consequent);
  }
};

struct TryStatement {
  NodePtr block;
  NodePtr handler;
  NodePtr finalizer;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, block);
    VisitChild(f, handler);
    VisitChild(f, finalizer);
  }
};

struct CatchClause {
  NodePtr param;
  NodePtr body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, param);
    VisitChild(f, body);
  }
};

struct ReturnStatement {
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct ThrowStatement {
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct BreakStatement : Leaf {
  std::string label;
};

struct ContinueStatement : Leaf {
  std::string label;
};

struct LabeledStatement {
  std::string label;
  NodePtr body;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, body);
  }
};

// --------------------
// Expressions
// --------------------
enum class IdentifierRole { kReference, kBinding, kPropertyName };

struct Identifier : Leaf {
  std::string name;
  IdentifierRole role = IdentifierRole::kReference;
  std::optional<TypeAnnotation> type;
  bool optional = false;
};

struct StringLiteral : Leaf {
  std::string value;
};

struct NumericLiteral : Leaf {
  double value = 0.0;
  std::string raw;
};

struct BooleanLiteral : Leaf {
  bool value = false;
};

struct NullLiteral : Leaf {};

struct RegExpLiteral : Leaf {
  std::string pattern;
  std::string flags;
};

struct TemplateLiteral {
  std::vector<std::string> quasis;
  NodeList expressions;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, expressions);
  }
};

struct TaggedTemplateExpression {
  NodePtr tag;
  NodePtr quasi;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, tag);
    VisitChild(f, quasi);
  }
};

// Holes (`[a, , b]`) are null entries.
struct ArrayExpression {
  NodeList elements;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, elements);
  }
};

struct ObjectExpression {
  NodeList properties;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, properties);
  }
};

// Object literal member or object pattern member. Methods, getters and
// setters carry a FunctionExpression value.
struct ObjectProperty {
  NodePtr key;
  NodePtr value;
  bool computed = false;
  bool shorthand = false;
  bool method = false;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, key);
    VisitChild(f, value);
  }
};

struct SpreadElement {
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct ObjectPattern {
  NodeList properties;
  std::optional<TypeAnnotation> type;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, properties);
  }
};

struct ArrayPattern {
  NodeList elements;
  std::optional<TypeAnnotation> type;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, elements);
  }
};

struct AssignmentPattern {
  NodePtr left;
  NodePtr right;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, left);
    VisitChild(f, right);
  }
};

struct RestElement {
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct ThisExpression : Leaf {};
struct SuperExpression : Leaf {};

struct CallExpression {
  NodePtr callee;
  NodeList arguments;
  bool optional = false;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, callee);
    VisitChildren(f, arguments);
  }
};

struct NewExpression {
  NodePtr callee;
  NodeList arguments;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, callee);
    VisitChildren(f, arguments);
  }
};

// Non-computed properties are Identifiers with role kPropertyName.
struct MemberExpression {
  NodePtr object;
  NodePtr property;
  bool computed = false;
  bool optional = false;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, object);
    VisitChild(f, property);
  }
};

struct AssignmentExpression {
  std::string op;
  NodePtr left;
  NodePtr right;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, left);
    VisitChild(f, right);
  }
};

struct BinaryExpression {
  std::string op;
  NodePtr left;
  NodePtr right;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, left);
    VisitChild(f, right);
  }
};

// &&, || and ??
struct LogicalExpression {
  std::string op;
  NodePtr left;
  NodePtr right;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, left);
    VisitChild(f, right);
  }
};

struct UnaryExpression {
  std::string op;
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct UpdateExpression {
  std::string op;
  bool prefix = false;
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct ConditionalExpression {
  NodePtr test;
  NodePtr consequent;
  NodePtr alternate;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, test);
    VisitChild(f, consequent);
    VisitChild(f, alternate);
  }
};

struct AwaitExpression {
  NodePtr argument;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct YieldExpression {
  NodePtr argument;
  bool delegate = false;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, argument);
  }
};

struct SequenceExpression {
  NodeList expressions;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, expressions);
  }
};

// --------------------
// JSX
// --------------------
// Fragments have an empty name. Children are JsxElement, JsxText or the
// expression of an expression container.
struct JsxElement {
  std::string name;
  NodeList attributes;
  NodeList children;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChildren(f, attributes);
    VisitChildren(f, children);
  }
};

struct JsxAttribute {
  std::string name;
  NodePtr value;
  template <typename F> void ForEachChild(F &&f) const {
    VisitChild(f, value);
  }
};

struct JsxText : Leaf {
  std::string value;
};

using NodeData = std::variant<
    Program, ErrorNode, ImportDeclaration, ExportDeclaration, TypeDeclaration,
    VariableDeclaration, VariableDeclarator, FunctionDeclaration,
    ClassDeclaration, ClassMethod, ClassProperty, Decorator, BlockStatement,
    ExpressionStatement, EmptyStatement, IfStatement, ForStatement,
    ForInStatement, ForOfStatement, WhileStatement, DoWhileStatement,
    SwitchStatement, SwitchCase, TryStatement, CatchClause, ReturnStatement,
    ThrowStatement, BreakStatement, ContinueStatement, LabeledStatement,
    Identifier, StringLiteral, NumericLiteral, BooleanLiteral, NullLiteral,
    RegExpLiteral, TemplateLiteral, TaggedTemplateExpression, ArrayExpression,
    ObjectExpression, ObjectProperty, SpreadElement, ObjectPattern,
    ArrayPattern, AssignmentPattern, RestElement, FunctionExpression,
    ArrowFunctionExpression, ClassExpression, ThisExpression, SuperExpression,
    CallExpression, NewExpression, MemberExpression, AssignmentExpression,
    BinaryExpression, LogicalExpression, UnaryExpression, UpdateExpression,
    ConditionalExpression, AwaitExpression, YieldExpression,
    SequenceExpression, JsxElement, JsxAttribute, JsxText>;

struct Node {
  SourceSpan span;
  NodeData data;

  template <typename T> bool Is() const {
    return std::holds_alternative<T>(data);
  }
  template <typename T> const T *As() const { return std::get_if<T>(&data); }
  template <typename T> T *As() { return std::get_if<T>(&data); }

  template <typename F> void ForEachChild(F &&f) const {
    std::visit([&](const auto &value) { value.ForEachChild(f); }, data);
  }
};

template <typename T> NodePtr MakeNode(SourceSpan span, T value) {
  return std::make_unique<Node>(Node{span, NodeData{std::move(value)}});
}

// Name of an identifier node, empty for anything else.
std::string IdentifierName(const Node *node);

// `object.property` for member expressions whose parts are plain names;
// other parts render as "unknown".
std::string DottedName(const Node &member);

// Innermost object of a member chain (`fs` for `fs.promises.readFile`).
const Node *RootObject(const Node &member);

// Name of the called function: the identifier, or the member property.
std::string CalleeName(const Node &callee);

bool IsFunctionLike(const Node &node);
const Function *AsFunction(const Node &node);
const Class *AsClass(const Node &node);

// ECMAScript reserved words, which can never name a called function.
bool IsReservedWord(std::string_view word);

} // namespace intent::ast
