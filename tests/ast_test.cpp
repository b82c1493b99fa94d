#include <intent/ast.h>
#include <intent/ast_visitor.h>
#include <intent/script_parser.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace intent {
namespace {

// Records the kinds it sees, with a marker when a subtree is left.
class TraceVisitor : public ast::AstVisitor {
public:
  using AstVisitor::Visit;

  void Visit(const ast::Node &, const ast::CallExpression &) override {
    trace.push_back("call");
  }
  void Visit(const ast::Node &, const ast::MemberExpression &) override {
    trace.push_back("member");
  }
  void Visit(const ast::Node &, const ast::Identifier &identifier) override {
    trace.push_back(identifier.name);
  }
  void Visit(const ast::Node &, const ast::StringLiteral &literal) override {
    trace.push_back("'" + literal.value + "'");
  }
  void Leave(const ast::Node &node) override {
    if (node.Is<ast::CallExpression>()) {
      trace.push_back("/call");
    }
  }

  std::vector<std::string> trace;
};

const ast::Node &FirstExpression(const ParseResult &result) {
  const auto &body = result.program->As<ast::Program>()->body;
  return *body.front()->As<ast::ExpressionStatement>()->expression;
}

TEST(AstTest, WalksInSourceOrderAndLeavesAfterChildren) {
  ScriptParser parser;
  const auto result = parser.Parse("logger.info('ready');");

  TraceVisitor visitor;
  ast::Walk(*result.program, visitor);

  EXPECT_EQ(visitor.trace,
            (std::vector<std::string>{"call", "member", "logger", "info",
                                      "'ready'", "/call"}));
}

TEST(AstTest, NamesMemberCallees) {
  ScriptParser parser;
  const auto result = parser.Parse("fs.promises.readFile(path);");

  const auto &call = FirstExpression(result);
  const auto &callee = *call.As<ast::CallExpression>()->callee;
  EXPECT_EQ(ast::CalleeName(callee), "readFile");
  EXPECT_EQ(ast::DottedName(callee), "unknown.readFile");
  EXPECT_EQ(ast::IdentifierName(ast::RootObject(callee)), "fs");
}

TEST(AstTest, DottedNameForPlainAndComputedMembers) {
  ScriptParser parser;
  const auto plain = parser.Parse("db.save;");
  EXPECT_EQ(ast::DottedName(FirstExpression(plain)), "db.save");

  const auto computed = parser.Parse("db[method];");
  EXPECT_EQ(ast::DottedName(FirstExpression(computed)), "db.unknown");
  EXPECT_EQ(ast::CalleeName(FirstExpression(computed)), "");

  const auto identifier = parser.Parse("fetch;");
  EXPECT_EQ(ast::DottedName(FirstExpression(identifier)), "fetch");
}

TEST(AstTest, IdentifierNameIgnoresOtherNodes) {
  EXPECT_EQ(ast::IdentifierName(nullptr), "");
  const auto literal = ast::MakeNode(ast::SourceSpan{}, ast::StringLiteral{});
  EXPECT_EQ(ast::IdentifierName(literal.get()), "");
}

TEST(AstTest, ClassifiesFunctionsAndClasses) {
  ScriptParser parser;
  const auto result = parser.Parse(
      "function a() {}\nconst b = () => 1;\nclass C {}\n");
  const auto &body = result.program->As<ast::Program>()->body;

  EXPECT_TRUE(ast::IsFunctionLike(*body[0]));
  const auto &init =
      *body[1]->As<ast::VariableDeclaration>()->declarators[0]
           ->As<ast::VariableDeclarator>()
           ->init;
  EXPECT_TRUE(ast::IsFunctionLike(init));
  EXPECT_FALSE(ast::IsFunctionLike(*body[2]));
  ASSERT_NE(ast::AsClass(*body[2]), nullptr);
  EXPECT_EQ(ast::AsClass(*body[2])->name, "C");
  EXPECT_EQ(ast::AsClass(*body[0]), nullptr);
}

} // namespace
} // namespace intent
