#pragma once

#include <intent/ast.h>

namespace intent::ast {

// One overload per node kind, each a no-op by default. Walk() dispatches with
// std::visit, so a node kind added to NodeData without an overload here does
// not compile. Subclasses should pull the base overloads in with
// `using AstVisitor::Visit;`.
class AstVisitor {
public:
  virtual ~AstVisitor() = default;

  virtual void Visit(const Node &, const Program &) {}
  virtual void Visit(const Node &, const ErrorNode &) {}
  virtual void Visit(const Node &, const ImportDeclaration &) {}
  virtual void Visit(const Node &, const ExportDeclaration &) {}
  virtual void Visit(const Node &, const TypeDeclaration &) {}
  virtual void Visit(const Node &, const VariableDeclaration &) {}
  virtual void Visit(const Node &, const VariableDeclarator &) {}
  virtual void Visit(const Node &, const FunctionDeclaration &) {}
  virtual void Visit(const Node &, const ClassDeclaration &) {}
  virtual void Visit(const Node &, const ClassMethod &) {}
  virtual void Visit(const Node &, const ClassProperty &) {}
  virtual void Visit(const Node &, const Decorator &) {}
  virtual void Visit(const Node &, const BlockStatement &) {}
  virtual void Visit(const Node &, const ExpressionStatement &) {}
  virtual void Visit(const Node &, const EmptyStatement &) {}
  virtual void Visit(const Node &, const IfStatement &) {}
  virtual void Visit(const Node &, const ForStatement &) {}
  virtual void Visit(const Node &, const ForInStatement &) {}
  virtual void Visit(const Node &, const ForOfStatement &) {}
  virtual void Visit(const Node &, const WhileStatement &) {}
  virtual void Visit(const Node &, const DoWhileStatement &) {}
  virtual void Visit(const Node &, const SwitchStatement &) {}
  virtual void Visit(const Node &, const SwitchCase &) {}
  virtual void Visit(const Node &, const TryStatement &) {}
  virtual void Visit(const Node &, const CatchClause &) {}
  virtual void Visit(const Node &, const ReturnStatement &) {}
  virtual void Visit(const Node &, const ThrowStatement &) {}
  virtual void Visit(const Node &, const BreakStatement &) {}
  virtual void Visit(const Node &, const ContinueStatement &) {}
  virtual void Visit(const Node &, const LabeledStatement &) {}
  virtual void Visit(const Node &, const Identifier &) {}
  virtual void Visit(const Node &, const StringLiteral &) {}
  virtual void Visit(const Node &, const NumericLiteral &) {}
  virtual void Visit(const Node &, const BooleanLiteral &) {}
  virtual void Visit(const Node &, const NullLiteral &) {}
  virtual void Visit(const Node &, const RegExpLiteral &) {}
  virtual void Visit(const Node &, const TemplateLiteral &) {}
  virtual void Visit(const Node &, const TaggedTemplateExpression &) {}
  virtual void Visit(const Node &, const ArrayExpression &) {}
  virtual void Visit(const Node &, const ObjectExpression &) {}
  virtual void Visit(const Node &, const ObjectProperty &) {}
  virtual void Visit(const Node &, const SpreadElement &) {}
  virtual void Visit(const Node &, const ObjectPattern &) {}
  virtual void Visit(const Node &, const ArrayPattern &) {}
  virtual void Visit(const Node &, const AssignmentPattern &) {}
  virtual void Visit(const Node &, const RestElement &) {}
  virtual void Visit(const Node &, const FunctionExpression &) {}
  virtual void Visit(const Node &, const ArrowFunctionExpression &) {}
  virtual void Visit(const Node &, const ClassExpression &) {}
  virtual void Visit(const Node &, const ThisExpression &) {}
  virtual void Visit(const Node &, const SuperExpression &) {}
  virtual void Visit(const Node &, const CallExpression &) {}
  virtual void Visit(const Node &, const NewExpression &) {}
  virtual void Visit(const Node &, const MemberExpression &) {}
  virtual void Visit(const Node &, const AssignmentExpression &) {}
  virtual void Visit(const Node &, const BinaryExpression &) {}
  virtual void Visit(const Node &, const LogicalExpression &) {}
  virtual void Visit(const Node &, const UnaryExpression &) {}
  virtual void Visit(const Node &, const UpdateExpression &) {}
  virtual void Visit(const Node &, const ConditionalExpression &) {}
  virtual void Visit(const Node &, const AwaitExpression &) {}
  virtual void Visit(const Node &, const YieldExpression &) {}
  virtual void Visit(const Node &, const SequenceExpression &) {}
  virtual void Visit(const Node &, const JsxElement &) {}
  virtual void Visit(const Node &, const JsxAttribute &) {}
  virtual void Visit(const Node &, const JsxText &) {}

  // Called once a node's subtree has been walked.
  virtual void Leave(const Node &) {}
};

// Pre-order walk in source order: Visit(node), children, Leave(node).
void Walk(const Node &root, AstVisitor &visitor);

} // namespace intent::ast
