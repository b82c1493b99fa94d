#pragma once

#include <intent/interfaces.h>

namespace intent {

// Parses JavaScript and TypeScript with tree-sitter (the tsx grammar when
// JSX is enabled) and lowers the syntax tree into ast::Node. ERROR and
// MISSING nodes become ErrorNode plus a "parser" diagnostic. Input that
// recovery cannot make sense of throws ParseError.
// Creates a tree-sitter parser per call, so one instance may serve
// concurrent analyses.
class ScriptParser : public SourceParser {
public:
  explicit ScriptParser(ParseOptions options = {});

  ParseResult Parse(const std::string &source) override;

  const ParseOptions &options() const { return options_; }

private:
  ParseOptions options_;
};

} // namespace intent
