#include <intent/script_parser.h>

#include <intent/errors.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

extern "C" {
#include <tree_sitter/api.h>

const TSLanguage *tree_sitter_typescript();
const TSLanguage *tree_sitter_tsx();
}

namespace intent {
namespace {

using namespace ast;

using ParserHandle = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
using TreeHandle = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

constexpr std::size_t kMaxNesting = 1024;

constexpr const char *kTypeScriptDisabled = "TypeScript syntax is not enabled";
constexpr const char *kDecoratorsDisabled = "Decorators are not enabled";

// Node kinds the JavaScript subset of the grammar never produces.
const std::unordered_set<std::string_view> kTypeScriptKinds = {
    "type_annotation",        "type_arguments",
    "type_parameters",        "interface_declaration",
    "type_alias_declaration", "enum_declaration",
    "ambient_declaration",    "abstract_class_declaration",
    "function_signature",     "internal_module",
    "module",                 "as_expression",
    "satisfies_expression",   "non_null_expression",
    "type_assertion",         "accessibility_modifier",
    "override_modifier",      "optional_parameter",
    "index_signature",        "abstract_method_signature",
    "implements_clause",      "import_alias",
    "asserts_annotation",     "type_predicate_annotation"};

std::string_view Kind(TSNode node) {
  return ts_node_is_null(node) ? std::string_view{} : ts_node_type(node);
}

TSNode Field(TSNode node, const char *name) {
  if (ts_node_is_null(node)) {
    return node;
  }
  return ts_node_child_by_field_name(
      node, name, static_cast<std::uint32_t>(std::strlen(name)));
}

// Named children without the comments tree-sitter attaches as extras.
std::vector<TSNode> NamedChildren(TSNode node) {
  std::vector<TSNode> children;
  if (ts_node_is_null(node)) {
    return children;
  }
  const auto count = ts_node_named_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_named_child(node, i);
    if (Kind(child) != "comment") {
      children.push_back(child);
    }
  }
  return children;
}

TSNode FirstNamed(TSNode node) {
  const auto children = NamedChildren(node);
  return children.empty() ? TSNode{} : children.front();
}

bool HasChild(TSNode node, std::string_view kind) {
  if (ts_node_is_null(node)) {
    return false;
  }
  const auto count = ts_node_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    if (Kind(ts_node_child(node, i)) == kind) {
      return true;
    }
  }
  return false;
}

bool IsErrorSite(TSNode node) {
  return !ts_node_is_null(node) &&
         (ts_node_is_missing(node) || Kind(node) == "ERROR");
}

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char character) {
    return std::isspace(character) != 0;
  });
}

std::string TypeKeyword(std::string_view text) {
  if (text == "string" || text == "number" || text == "boolean" ||
      text == "object") {
    return std::string(text);
  }
  if (text.size() > 2 && text.substr(text.size() - 2) == "[]") {
    return "array";
  }
  return "";
}

double NumericValue(const std::string &raw) {
  std::string digits;
  for (const auto character : raw) {
    if (character != '_') {
      digits.push_back(character);
    }
  }
  if (!digits.empty() && digits.back() == 'n') {
    digits.pop_back();
  }
  if (digits.size() > 2 && digits[0] == '0') {
    const auto prefix =
        static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
    const int base = prefix == 'x' ? 16 : prefix == 'o' ? 8 : prefix == 'b' ? 2
                                                                            : 0;
    if (base != 0) {
      return static_cast<double>(
          std::strtoull(digits.c_str() + 2, nullptr, base));
    }
  }
  return std::strtod(digits.c_str(), nullptr);
}

void AppendUtf8(std::string &output, std::uint32_t code_point) {
  if (code_point < 0x80) {
    output.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    output.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    output.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    output.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool IsHex(std::string_view digits) {
  return !digits.empty() &&
         std::all_of(digits.begin(), digits.end(), [](unsigned char digit) {
           return std::isxdigit(digit) != 0;
         });
}

// Decodes the escape sequences of a string literal body.
std::string CookEscapes(std::string_view raw) {
  std::string value;
  value.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 == raw.size()) {
      value.push_back(raw[i]);
      continue;
    }
    const char escaped = raw[++i];
    switch (escaped) {
    case 'n':
      value.push_back('\n');
      break;
    case 't':
      value.push_back('\t');
      break;
    case 'r':
      value.push_back('\r');
      break;
    case 'b':
      value.push_back('\b');
      break;
    case 'f':
      value.push_back('\f');
      break;
    case 'v':
      value.push_back('\v');
      break;
    case '0':
      value.push_back('\0');
      break;
    case '\r':
      if (i + 1 < raw.size() && raw[i + 1] == '\n') {
        ++i;
      }
      break;
    case '\n':
      break;
    case 'x':
      if (IsHex(raw.substr(i + 1, 2)) && i + 2 < raw.size()) {
        AppendUtf8(value, static_cast<std::uint32_t>(std::strtoul(
                              std::string(raw.substr(i + 1, 2)).c_str(),
                              nullptr, 16)));
        i += 2;
      } else {
        value.push_back(escaped);
      }
      break;
    case 'u': {
      if (i + 1 < raw.size() && raw[i + 1] == '{') {
        const auto close = raw.find('}', i + 2);
        const auto digits = close == std::string_view::npos
                                ? std::string_view{}
                                : raw.substr(i + 2, close - i - 2);
        if (IsHex(digits)) {
          AppendUtf8(value, static_cast<std::uint32_t>(std::strtoul(
                                std::string(digits).c_str(), nullptr, 16)));
          i = close;
          break;
        }
      } else if (i + 4 < raw.size() && IsHex(raw.substr(i + 1, 4))) {
        AppendUtf8(value, static_cast<std::uint32_t>(std::strtoul(
                              std::string(raw.substr(i + 1, 4)).c_str(),
                              nullptr, 16)));
        i += 4;
        break;
      }
      value.push_back(escaped);
      break;
    }
    default:
      value.push_back(escaped);
      break;
    }
  }
  return value;
}

std::string KeyName(const Node *key) {
  if (key == nullptr) {
    return "";
  }
  if (const auto *identifier = key->As<Identifier>()) {
    return identifier->name;
  }
  if (const auto *text = key->As<StringLiteral>()) {
    return text->value;
  }
  if (const auto *number = key->As<NumericLiteral>()) {
    return number->raw;
  }
  return "";
}

void ApplyAnnotation(Node &target, std::optional<TypeAnnotation> annotation,
                     bool optional) {
  if (auto *rest = target.As<RestElement>()) {
    if (rest->argument) {
      ApplyAnnotation(*rest->argument, std::move(annotation), optional);
    }
  } else if (auto *identifier = target.As<Identifier>()) {
    identifier->type = std::move(annotation);
    identifier->optional = optional;
  } else if (auto *object = target.As<ObjectPattern>()) {
    object->type = std::move(annotation);
  } else if (auto *array = target.As<ArrayPattern>()) {
    array->type = std::move(annotation);
  }
}

void CollectDeclaredNames(const Node &declaration,
                          std::vector<std::string> &names) {
  if (const auto *function = declaration.As<FunctionDeclaration>()) {
    names.push_back(function->name);
  } else if (const auto *klass = declaration.As<ClassDeclaration>()) {
    names.push_back(klass->name);
  } else if (const auto *type = declaration.As<TypeDeclaration>()) {
    names.push_back(type->name);
  } else if (const auto *variables = declaration.As<VariableDeclaration>()) {
    for (const auto &declarator : variables->declarators) {
      const auto *item = declarator->As<VariableDeclarator>();
      const auto name = item != nullptr ? IdentifierName(item->id.get()) : "";
      if (!name.empty()) {
        names.push_back(name);
      }
    }
  }
}

class NestingGuard {
public:
  NestingGuard(std::size_t &depth, TSNode node) : depth_(depth) {
    if (++depth_ > kMaxNesting) {
      --depth_;
      const auto point = ts_node_start_point(node);
      throw ParseError("Nesting too deep", static_cast<int>(point.row) + 1,
                       static_cast<int>(point.column) + 1);
    }
  }
  ~NestingGuard() { --depth_; }
  NestingGuard(const NestingGuard &) = delete;
  NestingGuard &operator=(const NestingGuard &) = delete;

private:
  std::size_t &depth_;
};

// Turns a tree-sitter concrete syntax tree into the analyzer's AST.
// Scan() runs first: it records diagnostics for ERROR and MISSING nodes,
// counts comments and notes TypeScript syntax, and throws ParseError for
// input that recovery cannot make sense of.
class TreeLowering {
public:
  TreeLowering(const std::string &source, const ParseOptions &options);

  void Scan(TSNode node, std::size_t depth = 0);
  NodePtr LowerProgram(TSNode root);

  std::vector<Diagnostic> TakeDiagnostics() { return std::move(diagnostics_); }
  bool has_type_annotations() const { return has_type_annotations_; }
  std::size_t comment_count() const { return comment_count_; }

private:
  std::string Text(TSNode node) const;
  SourceSpan Span(TSNode node) const;
  std::string DescribeError(TSNode node) const;
  void Report(TSNode node, const std::string &message);
  void ReportErrorSite(TSNode node);
  void RejectUnterminated(TSNode site) const;

  NodeList LowerStatements(TSNode parent);
  NodePtr LowerStatement(TSNode node);
  NodePtr LowerBlock(TSNode node);
  NodePtr LowerVariableDeclaration(TSNode node);
  NodePtr LowerIf(TSNode node);
  NodePtr LowerFor(TSNode node);
  NodePtr LowerForClause(TSNode node);
  NodePtr LowerForIn(TSNode node);
  NodePtr LowerSwitch(TSNode node);
  NodePtr LowerTry(TSNode node);
  NodePtr LowerImport(TSNode node);
  void LowerImportClause(TSNode clause, ImportDeclaration &declaration) const;
  NodePtr LowerExport(TSNode node);
  NodePtr LowerTypeDeclaration(TSNode node, std::string kind);
  NodePtr LowerNamespace(TSNode node);
  std::string ModuleExportName(TSNode node) const;
  std::string StringValue(TSNode node) const;

  template <typename FunctionKind> NodePtr LowerFunction(TSNode node);
  NodePtr LowerArrow(TSNode node);
  NodeList LowerParameters(TSNode node);
  std::optional<TypeAnnotation> LowerAnnotation(TSNode node) const;
  template <typename ClassKind>
  NodePtr LowerClass(TSNode node, NodeList decorators);
  NodePtr LowerHeritage(TSNode node);
  NodePtr LowerMethod(TSNode node, NodeList decorators);
  NodePtr LowerField(TSNode node, NodeList decorators);
  NodeList LowerDecorators(TSNode node);
  NodePtr LowerDecorator(TSNode node);

  NodePtr LowerExpression(TSNode node);
  NodePtr LowerCall(TSNode node);
  NodeList LowerArguments(TSNode node);
  NodePtr LowerMember(TSNode node);
  NodePtr LowerBinary(TSNode node);
  void LowerSequence(TSNode node, NodeList &expressions);
  NodePtr LowerTemplate(TSNode node);
  NodePtr LowerObject(TSNode node);
  NodePtr LowerArray(TSNode node);
  NodePtr LowerPropertyKey(TSNode node, bool &computed);
  NodePtr LowerPattern(TSNode node, IdentifierRole role);
  NodePtr LowerObjectPattern(TSNode node, IdentifierRole role);
  NodePtr LowerArrayPattern(TSNode node, IdentifierRole role);
  NodePtr LowerAssignmentTarget(TSNode node);
  NodePtr LowerJsx(TSNode node);
  NodePtr LowerJsxAttribute(TSNode node);
  NodePtr LowerJsxExpression(TSNode node);

  NodePtr MakeIdentifier(TSNode node, IdentifierRole role) const;
  NodePtr MakeError(TSNode node) const;

  const std::string &source_;
  const ParseOptions &options_;
  std::size_t trimmed_end_ = 0;
  std::size_t depth_ = 0;
  std::vector<Diagnostic> diagnostics_;
  bool has_type_annotations_ = false;
  std::size_t comment_count_ = 0;
};

TreeLowering::TreeLowering(const std::string &source,
                           const ParseOptions &options)
    : source_(source), options_(options) {
  const auto last = source_.find_last_not_of(" \t\r\n");
  trimmed_end_ = last == std::string::npos ? 0 : last + 1;
}

std::string TreeLowering::Text(TSNode node) const {
  if (ts_node_is_null(node)) {
    return "";
  }
  const auto begin = std::min<std::size_t>(ts_node_start_byte(node),
                                           source_.size());
  const auto end =
      std::min<std::size_t>(ts_node_end_byte(node), source_.size());
  return end > begin ? source_.substr(begin, end - begin) : "";
}

SourceSpan TreeLowering::Span(TSNode node) const {
  const auto begin = ts_node_start_byte(node);
  const auto end = ts_node_end_byte(node);
  const auto point = ts_node_start_point(node);
  return SourceSpan{begin, end > begin ? end - begin : 0,
                    static_cast<int>(point.row) + 1,
                    static_cast<int>(point.column) + 1};
}

std::string TreeLowering::DescribeError(TSNode node) const {
  if (ts_node_is_missing(node)) {
    return "Missing '" + std::string(Kind(node)) + "'";
  }
  auto text = Text(node);
  const auto line_end = text.find('\n');
  if (line_end != std::string::npos) {
    text.erase(line_end);
  }
  if (text.size() > 24) {
    text = text.substr(0, 24) + "...";
  }
  return text.empty() ? "Unexpected syntax" : "Unexpected '" + text + "'";
}

void TreeLowering::Report(TSNode node, const std::string &message) {
  const auto span = Span(node);
  Diagnostic diagnostic;
  diagnostic.facet = "parser";
  diagnostic.severity = DiagnosticSeverity::kWarning;
  diagnostic.message = message;
  diagnostic.line = span.line;
  diagnostic.column = span.column;
  diagnostics_.push_back(std::move(diagnostic));
  if (diagnostics_.size() > options_.max_recovered_errors) {
    throw ParseError("Too many syntax errors", span.line, span.column);
  }
}

// A quote token left bare inside an error region is an unterminated
// string or template literal.
void TreeLowering::RejectUnterminated(TSNode site) const {
  const auto reject = [this](TSNode token) {
    const auto kind = Kind(token);
    if (kind != "'" && kind != "\"" && kind != "`") {
      return;
    }
    const auto span = Span(token);
    throw ParseError(kind == "`" ? "Unterminated template literal"
                                 : "Unterminated string literal",
                     span.line, span.column);
  };
  reject(site);
  const auto count = ts_node_child_count(site);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(site, i);
    if (Kind(child) == "ERROR") {
      RejectUnterminated(child);
    } else if (!ts_node_is_named(child) || ts_node_is_missing(child)) {
      reject(child);
    }
  }
}

void TreeLowering::ReportErrorSite(TSNode node) {
  RejectUnterminated(node);
  if (ts_node_end_byte(node) >= trimmed_end_) {
    const auto span = Span(node);
    throw ParseError("Unexpected end of input", span.line, span.column);
  }
  Report(node, DescribeError(node));
}

void TreeLowering::Scan(TSNode node, std::size_t depth) {
  if (depth > kMaxNesting) {
    const auto span = Span(node);
    throw ParseError("Nesting too deep", span.line, span.column);
  }
  const auto kind = Kind(node);
  if (kind == "comment") {
    ++comment_count_;
    return;
  }
  if (IsErrorSite(node)) {
    ReportErrorSite(node);
    return;
  }
  if (kTypeScriptKinds.count(kind) > 0) {
    if (!options_.typescript) {
      Report(node, kTypeScriptDisabled);
      return;
    }
    has_type_annotations_ = true;
  }
  if (kind == "decorator" && !options_.decorators) {
    Report(node, kDecoratorsDisabled);
    return;
  }
  const auto count = ts_node_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    Scan(ts_node_child(node, i), depth + 1);
  }
}

NodePtr TreeLowering::MakeIdentifier(TSNode node, IdentifierRole role) const {
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  if (IsErrorSite(node)) {
    return MakeError(node);
  }
  Identifier identifier;
  identifier.name = Text(node);
  identifier.role = role;
  return MakeNode(Span(node), std::move(identifier));
}

NodePtr TreeLowering::MakeError(TSNode node) const {
  ErrorNode error;
  error.message = DescribeError(node);
  return MakeNode(Span(node), std::move(error));
}

std::string TreeLowering::StringValue(TSNode node) const {
  const auto text = Text(node);
  if (Kind(node) != "string" || text.size() < 2) {
    return text;
  }
  return CookEscapes(std::string_view(text).substr(1, text.size() - 2));
}

std::string TreeLowering::ModuleExportName(TSNode node) const {
  return Kind(node) == "string" ? StringValue(node) : Text(node);
}

std::optional<TypeAnnotation>
TreeLowering::LowerAnnotation(TSNode node) const {
  if (ts_node_is_null(node) || !options_.typescript) {
    return std::nullopt;
  }
  std::string text;
  if (Kind(node) == "type_annotation") {
    text = Text(FirstNamed(node));
  } else {
    text = Text(node);
    const auto colon = text.find_first_not_of(" \t");
    if (colon != std::string::npos && text[colon] == ':') {
      text.erase(0, colon + 1);
    }
    const auto first = text.find_first_not_of(" \t\r\n");
    text.erase(0, first == std::string::npos ? text.size() : first);
  }
  auto keyword = TypeKeyword(text);
  return TypeAnnotation{std::move(text), std::move(keyword)};
}

// --------------------
// Statements
// --------------------
NodePtr TreeLowering::LowerProgram(TSNode root) {
  Program program;
  program.body = LowerStatements(root);
  return MakeNode(Span(root), std::move(program));
}

NodeList TreeLowering::LowerStatements(TSNode parent) {
  NodeList body;
  for (const auto child : NamedChildren(parent)) {
    if (auto statement = LowerStatement(child)) {
      body.push_back(std::move(statement));
    }
  }
  return body;
}

NodePtr TreeLowering::LowerBlock(TSNode node) {
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  if (IsErrorSite(node)) {
    return MakeError(node);
  }
  BlockStatement block;
  block.body = LowerStatements(node);
  return MakeNode(Span(node), std::move(block));
}

NodePtr TreeLowering::LowerStatement(TSNode node) {
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  NestingGuard guard(depth_, node);
  if (IsErrorSite(node)) {
    return MakeError(node);
  }
  const auto kind = Kind(node);
  const auto span = Span(node);

  if (kTypeScriptKinds.count(kind) > 0 && !options_.typescript) {
    ErrorNode error;
    error.message = kTypeScriptDisabled;
    return MakeNode(span, std::move(error));
  }

  if (kind == "expression_statement") {
    const auto inner = FirstNamed(node);
    if (!ts_node_is_null(inner) &&
        (Kind(inner) == "internal_module" || Kind(inner) == "module")) {
      return LowerNamespace(inner);
    }
    return MakeNode(span, ExpressionStatement{LowerExpression(inner)});
  }
  if (kind == "lexical_declaration" || kind == "variable_declaration") {
    return LowerVariableDeclaration(node);
  }
  if (kind == "function_declaration" ||
      kind == "generator_function_declaration") {
    return LowerFunction<FunctionDeclaration>(node);
  }
  if (kind == "class_declaration" || kind == "abstract_class_declaration") {
    return LowerClass<ClassDeclaration>(node, {});
  }
  if (kind == "statement_block") {
    return LowerBlock(node);
  }
  if (kind == "if_statement") {
    return LowerIf(node);
  }
  if (kind == "for_statement") {
    return LowerFor(node);
  }
  if (kind == "for_in_statement") {
    return LowerForIn(node);
  }
  if (kind == "while_statement") {
    return MakeNode(span,
                    WhileStatement{LowerExpression(Field(node, "condition")),
                                   LowerStatement(Field(node, "body"))});
  }
  if (kind == "do_statement") {
    return MakeNode(span,
                    DoWhileStatement{LowerStatement(Field(node, "body")),
                                     LowerExpression(Field(node, "condition"))});
  }
  if (kind == "switch_statement") {
    return LowerSwitch(node);
  }
  if (kind == "try_statement") {
    return LowerTry(node);
  }
  if (kind == "return_statement") {
    return MakeNode(span, ReturnStatement{LowerExpression(FirstNamed(node))});
  }
  if (kind == "throw_statement") {
    return MakeNode(span, ThrowStatement{LowerExpression(FirstNamed(node))});
  }
  if (kind == "break_statement") {
    BreakStatement jump;
    jump.label = Text(Field(node, "label"));
    return MakeNode(span, std::move(jump));
  }
  if (kind == "continue_statement") {
    ContinueStatement jump;
    jump.label = Text(Field(node, "label"));
    return MakeNode(span, std::move(jump));
  }
  if (kind == "labeled_statement") {
    return MakeNode(span, LabeledStatement{Text(Field(node, "label")),
                                           LowerStatement(Field(node, "body"))});
  }
  if (kind == "empty_statement" || kind == "debugger_statement") {
    return MakeNode(span, EmptyStatement{});
  }
  if (kind == "with_statement") {
    BlockStatement block;
    block.body.push_back(MakeNode(
        span, ExpressionStatement{LowerExpression(Field(node, "object"))}));
    if (auto body = LowerStatement(Field(node, "body"))) {
      block.body.push_back(std::move(body));
    }
    return MakeNode(span, std::move(block));
  }
  if (kind == "import_statement") {
    return LowerImport(node);
  }
  if (kind == "export_statement") {
    return LowerExport(node);
  }
  if (kind == "interface_declaration") {
    return LowerTypeDeclaration(node, "interface");
  }
  if (kind == "type_alias_declaration") {
    return LowerTypeDeclaration(node, "type");
  }
  if (kind == "enum_declaration") {
    return LowerTypeDeclaration(node, "enum");
  }
  if (kind == "function_signature") {
    return LowerTypeDeclaration(node, "function");
  }
  if (kind == "ambient_declaration") {
    return LowerTypeDeclaration(node, "declare");
  }
  if (kind == "internal_module" || kind == "module") {
    return LowerNamespace(node);
  }
  if (kind == "import_alias") {
    // import Name = Other.Name
    ImportDeclaration declaration;
    declaration.specifiers.push_back(
        ImportSpecifier{"default", Text(FirstNamed(node))});
    return MakeNode(span, std::move(declaration));
  }
  if (kind == "hash_bang_line") {
    return nullptr;
  }
  return MakeNode(span, ExpressionStatement{LowerExpression(node)});
}

NodePtr TreeLowering::LowerVariableDeclaration(TSNode node) {
  VariableDeclaration declaration;
  const auto kind = Field(node, "kind");
  declaration.kind = ts_node_is_null(kind) ? "var" : Text(kind);
  for (const auto child : NamedChildren(node)) {
    if (Kind(child) != "variable_declarator") {
      continue;
    }
    VariableDeclarator declarator;
    declarator.id = LowerPattern(Field(child, "name"), IdentifierRole::kBinding);
    if (declarator.id) {
      ApplyAnnotation(*declarator.id, LowerAnnotation(Field(child, "type")),
                      false);
    }
    declarator.init = LowerExpression(Field(child, "value"));
    declaration.declarators.push_back(
        MakeNode(Span(child), std::move(declarator)));
  }
  return MakeNode(Span(node), std::move(declaration));
}

NodePtr TreeLowering::LowerIf(TSNode node) {
  IfStatement statement;
  statement.test = LowerExpression(Field(node, "condition"));
  statement.consequent = LowerStatement(Field(node, "consequence"));
  const auto alternative = Field(node, "alternative");
  if (!ts_node_is_null(alternative)) {
    statement.alternate = Kind(alternative) == "else_clause"
                              ? LowerStatement(FirstNamed(alternative))
                              : LowerStatement(alternative);
  }
  return MakeNode(Span(node), std::move(statement));
}

// Initializer or condition of a C-style for loop.
NodePtr TreeLowering::LowerForClause(TSNode node) {
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  const auto kind = Kind(node);
  if (kind == "empty_statement" || kind == ";") {
    return nullptr;
  }
  if (kind == "lexical_declaration" || kind == "variable_declaration") {
    return LowerVariableDeclaration(node);
  }
  if (kind == "expression_statement") {
    return LowerExpression(FirstNamed(node));
  }
  return LowerExpression(node);
}

NodePtr TreeLowering::LowerFor(TSNode node) {
  ForStatement statement;
  statement.init = LowerForClause(Field(node, "initializer"));
  statement.test = LowerForClause(Field(node, "condition"));
  statement.update = LowerExpression(Field(node, "increment"));
  statement.body = LowerStatement(Field(node, "body"));
  return MakeNode(Span(node), std::move(statement));
}

NodePtr TreeLowering::LowerForIn(TSNode node) {
  const auto left = Field(node, "left");
  const auto kind = Field(node, "kind");
  NodePtr target;
  if (!ts_node_is_null(kind)) {
    VariableDeclarator declarator;
    declarator.id = LowerPattern(left, IdentifierRole::kBinding);
    VariableDeclaration declaration;
    declaration.kind = Text(kind);
    declaration.declarators.push_back(
        MakeNode(Span(left), std::move(declarator)));
    target = MakeNode(Span(left), std::move(declaration));
  } else {
    target = LowerAssignmentTarget(left);
  }
  auto right = LowerExpression(Field(node, "right"));
  auto body = LowerStatement(Field(node, "body"));

  const auto op = Field(node, "operator");
  const bool is_of =
      ts_node_is_null(op) ? HasChild(node, "of") : Text(op) == "of";
  if (is_of) {
    ForOfStatement statement;
    statement.left = std::move(target);
    statement.right = std::move(right);
    statement.body = std::move(body);
    statement.is_await = HasChild(node, "await");
    return MakeNode(Span(node), std::move(statement));
  }
  return MakeNode(Span(node), ForInStatement{std::move(target),
                                             std::move(right),
                                             std::move(body)});
}

NodePtr TreeLowering::LowerSwitch(TSNode node) {
  SwitchStatement statement;
  statement.discriminant = LowerExpression(Field(node, "value"));
  for (const auto clause : NamedChildren(Field(node, "body"))) {
    if (IsErrorSite(clause)) {
      statement.cases.push_back(MakeError(clause));
      continue;
    }
    SwitchCase branch;
    const auto value = Field(clause, "value");
    if (Kind(clause) == "switch_case") {
      branch.test = LowerExpression(value);
    }
    for (const auto child : NamedChildren(clause)) {
      if (!ts_node_is_null(value) && ts_node_eq(child, value)) {
        continue;
      }
      if (auto consequent = LowerStatement(child)) {
        branch.consequent.push_back(std::move(consequent));
      }
    }
    statement.cases.push_back(MakeNode(Span(clause), std::move(branch)));
  }
  return MakeNode(Span(node), std::move(statement));
}

NodePtr TreeLowering::LowerTry(TSNode node) {
  TryStatement statement;
  statement.block = LowerBlock(Field(node, "body"));
  const auto handler = Field(node, "handler");
  if (!ts_node_is_null(handler)) {
    CatchClause clause;
    clause.param =
        LowerPattern(Field(handler, "parameter"), IdentifierRole::kBinding);
    clause.body = LowerBlock(Field(handler, "body"));
    statement.handler = MakeNode(Span(handler), std::move(clause));
  }
  const auto finalizer = Field(node, "finalizer");
  if (!ts_node_is_null(finalizer)) {
    statement.finalizer = LowerBlock(Field(finalizer, "body"));
  }
  return MakeNode(Span(node), std::move(statement));
}

NodePtr TreeLowering::LowerImport(TSNode node) {
  ImportDeclaration declaration;
  declaration.type_only = HasChild(node, "type") || HasChild(node, "typeof");
  const auto source = Field(node, "source");
  if (!ts_node_is_null(source)) {
    declaration.source = StringValue(source);
  }
  for (const auto child : NamedChildren(node)) {
    const auto kind = Kind(child);
    if (kind == "import_clause") {
      LowerImportClause(child, declaration);
    } else if (kind == "import_require_clause") {
      // import fs = require("fs")
      declaration.specifiers.push_back(
          ImportSpecifier{"default", Text(FirstNamed(child))});
      const auto required = Field(child, "source");
      if (!ts_node_is_null(required)) {
        declaration.source = StringValue(required);
      }
    }
  }
  return MakeNode(Span(node), std::move(declaration));
}

void TreeLowering::LowerImportClause(TSNode clause,
                                     ImportDeclaration &declaration) const {
  for (const auto part : NamedChildren(clause)) {
    const auto kind = Kind(part);
    if (kind == "identifier") {
      declaration.specifiers.push_back(ImportSpecifier{"default", Text(part)});
    } else if (kind == "namespace_import") {
      declaration.specifiers.push_back(
          ImportSpecifier{"*", Text(FirstNamed(part))});
    } else if (kind == "named_imports") {
      for (const auto specifier : NamedChildren(part)) {
        if (Kind(specifier) != "import_specifier") {
          continue;
        }
        const auto alias = Field(specifier, "alias");
        ImportSpecifier imported;
        imported.imported = ModuleExportName(Field(specifier, "name"));
        imported.local =
            ts_node_is_null(alias) ? imported.imported : Text(alias);
        declaration.specifiers.push_back(std::move(imported));
      }
    }
  }
}

NodePtr TreeLowering::LowerExport(TSNode node) {
  ExportDeclaration declaration;
  auto decorators = LowerDecorators(node);
  const auto source = Field(node, "source");
  if (!ts_node_is_null(source)) {
    declaration.source = StringValue(source);
  }
  if (HasChild(node, "default")) {
    declaration.is_default = true;
    declaration.exported.push_back("default");
  }

  const auto inner = Field(node, "declaration");
  const auto value = Field(node, "value");
  if (!ts_node_is_null(inner)) {
    const auto kind = Kind(inner);
    declaration.declaration =
        kind == "class_declaration" || kind == "abstract_class_declaration"
            ? LowerClass<ClassDeclaration>(inner, std::move(decorators))
            : LowerStatement(inner);
    if (!declaration.is_default && declaration.declaration) {
      CollectDeclaredNames(*declaration.declaration, declaration.exported);
    }
  } else if (!ts_node_is_null(value)) {
    const auto kind = Kind(value);
    if (kind == "function_expression" || kind == "function" ||
        kind == "generator_function") {
      declaration.declaration = LowerFunction<FunctionDeclaration>(value);
    } else if (kind == "class") {
      declaration.declaration =
          LowerClass<ClassDeclaration>(value, std::move(decorators));
    } else {
      declaration.declaration = LowerExpression(value);
    }
  } else if (HasChild(node, "=")) {
    // export = expression
    declaration.is_default = true;
    for (const auto child : NamedChildren(node)) {
      if (Kind(child) != "decorator") {
        declaration.declaration = LowerExpression(child);
        break;
      }
    }
  }

  for (const auto child : NamedChildren(node)) {
    const auto kind = Kind(child);
    if (kind == "export_clause") {
      for (const auto specifier : NamedChildren(child)) {
        if (Kind(specifier) != "export_specifier") {
          continue;
        }
        const auto alias = Field(specifier, "alias");
        declaration.exported.push_back(
            ModuleExportName(ts_node_is_null(alias)
                                 ? Field(specifier, "name")
                                 : alias));
      }
    } else if (kind == "namespace_export") {
      declaration.exported.push_back(ModuleExportName(FirstNamed(child)));
    }
  }
  return MakeNode(Span(node), std::move(declaration));
}

// interface, type alias, enum, overload signature and `declare` forms are
// recorded by name only.
NodePtr TreeLowering::LowerTypeDeclaration(TSNode node, std::string kind) {
  TypeDeclaration declaration;
  declaration.kind = std::move(kind);
  auto named = node;
  if (declaration.kind == "declare") {
    named = FirstNamed(node);
    const auto inner = Kind(named);
    if (inner == "lexical_declaration" || inner == "variable_declaration") {
      named = FirstNamed(named);
    }
  }
  const auto name = Field(named, "name");
  declaration.name = ts_node_is_null(name) ? "" : ModuleExportName(name);
  if (declaration.name.empty() && declaration.kind == "declare" &&
      Kind(named) == "statement_block") {
    declaration.name = "global";
  }
  return MakeNode(Span(node), std::move(declaration));
}

// `namespace A.B { ... }` keeps its body as a plain block.
NodePtr TreeLowering::LowerNamespace(TSNode node) {
  return LowerBlock(Field(node, "body"));
}

// --------------------
// Functions and classes
// --------------------
template <typename FunctionKind>
NodePtr TreeLowering::LowerFunction(TSNode node) {
  FunctionKind function;
  const auto name = Field(node, "name");
  if (!ts_node_is_null(name)) {
    function.name = Text(name);
  }
  function.is_async = HasChild(node, "async");
  function.is_generator = HasChild(node, "*");
  function.params = LowerParameters(Field(node, "parameters"));
  function.return_type = LowerAnnotation(Field(node, "return_type"));
  function.body = LowerBlock(Field(node, "body"));
  return MakeNode(Span(node), std::move(function));
}

NodePtr TreeLowering::LowerArrow(TSNode node) {
  ArrowFunctionExpression arrow;
  arrow.is_async = HasChild(node, "async");
  const auto parameter = Field(node, "parameter");
  if (!ts_node_is_null(parameter)) {
    arrow.params.push_back(MakeIdentifier(parameter, IdentifierRole::kBinding));
  } else {
    arrow.params = LowerParameters(Field(node, "parameters"));
  }
  arrow.return_type = LowerAnnotation(Field(node, "return_type"));
  const auto body = Field(node, "body");
  if (!ts_node_is_null(body) && Kind(body) == "statement_block") {
    arrow.body = LowerBlock(body);
  } else {
    arrow.body = LowerExpression(body);
    arrow.expression_body = true;
  }
  return MakeNode(Span(node), std::move(arrow));
}

NodeList TreeLowering::LowerParameters(TSNode node) {
  NodeList params;
  for (const auto child : NamedChildren(node)) {
    const auto kind = Kind(child);
    if (kind == "required_parameter" || kind == "optional_parameter") {
      const auto pattern = Field(child, "pattern");
      if (ts_node_is_null(pattern) || Kind(pattern) == "this") {
        continue;
      }
      auto target = LowerPattern(pattern, IdentifierRole::kBinding);
      ApplyAnnotation(*target, LowerAnnotation(Field(child, "type")),
                      kind == "optional_parameter");
      const auto value = Field(child, "value");
      if (!ts_node_is_null(value)) {
        target = MakeNode(Span(child),
                          AssignmentPattern{std::move(target),
                                            LowerExpression(value)});
      }
      params.push_back(std::move(target));
    } else if (kind != "decorator") {
      params.push_back(LowerPattern(child, IdentifierRole::kBinding));
    }
  }
  return params;
}

template <typename ClassKind>
NodePtr TreeLowering::LowerClass(TSNode node, NodeList decorators) {
  ClassKind klass;
  klass.decorators = std::move(decorators);
  for (auto &decorator : LowerDecorators(node)) {
    klass.decorators.push_back(std::move(decorator));
  }
  const auto name = Field(node, "name");
  if (!ts_node_is_null(name)) {
    klass.name = Text(name);
  }
  for (const auto child : NamedChildren(node)) {
    if (Kind(child) == "class_heritage") {
      klass.super_class = LowerHeritage(child);
    }
  }

  // Member decorators precede their member inside the class body.
  NodeList pending;
  for (const auto member : NamedChildren(Field(node, "body"))) {
    const auto kind = Kind(member);
    if (kind == "decorator") {
      if (options_.decorators) {
        pending.push_back(LowerDecorator(member));
      }
      continue;
    }
    if (kind == "method_definition") {
      klass.members.push_back(LowerMethod(member, std::move(pending)));
    } else if (kind == "public_field_definition" ||
               kind == "field_definition") {
      klass.members.push_back(LowerField(member, std::move(pending)));
    } else if (kind == "class_static_block") {
      ClassMethod block;
      block.key = "static";
      block.is_static = true;
      block.body = LowerBlock(Field(member, "body"));
      klass.members.push_back(MakeNode(Span(member), std::move(block)));
    } else if (IsErrorSite(member)) {
      klass.members.push_back(MakeError(member));
    }
    pending = NodeList{};
  }
  return MakeNode(Span(node), std::move(klass));
}

NodePtr TreeLowering::LowerHeritage(TSNode node) {
  for (const auto clause : NamedChildren(node)) {
    const auto kind = Kind(clause);
    if (kind == "extends_clause") {
      const auto value = Field(clause, "value");
      return LowerExpression(ts_node_is_null(value) ? FirstNamed(clause)
                                                    : value);
    }
    if (kind != "implements_clause") {
      return LowerExpression(clause);
    }
  }
  return nullptr;
}

NodePtr TreeLowering::LowerMethod(TSNode node, NodeList decorators) {
  ClassMethod method;
  bool computed = false;
  auto key = LowerPropertyKey(Field(node, "name"), computed);
  if (computed) {
    method.computed_key = std::move(key);
  } else {
    method.key = KeyName(key.get());
  }
  if (!computed && method.key == "constructor") {
    method.kind = MethodKind::kConstructor;
  } else if (HasChild(node, "get")) {
    method.kind = MethodKind::kGetter;
  } else if (HasChild(node, "set")) {
    method.kind = MethodKind::kSetter;
  }
  method.is_static = HasChild(node, "static");
  method.is_async = HasChild(node, "async");
  method.is_generator = HasChild(node, "*");
  method.decorators = std::move(decorators);
  for (auto &decorator : LowerDecorators(node)) {
    method.decorators.push_back(std::move(decorator));
  }
  method.params = LowerParameters(Field(node, "parameters"));
  method.return_type = LowerAnnotation(Field(node, "return_type"));
  method.body = LowerBlock(Field(node, "body"));
  return MakeNode(Span(node), std::move(method));
}

NodePtr TreeLowering::LowerField(TSNode node, NodeList decorators) {
  ClassProperty property;
  auto name = Field(node, "name");
  if (ts_node_is_null(name)) {
    name = Field(node, "property");
  }
  bool computed = false;
  auto key = LowerPropertyKey(name, computed);
  if (computed) {
    property.computed_key = std::move(key);
  } else {
    property.key = KeyName(key.get());
  }
  property.is_static = HasChild(node, "static");
  property.decorators = std::move(decorators);
  for (auto &decorator : LowerDecorators(node)) {
    property.decorators.push_back(std::move(decorator));
  }
  property.type = LowerAnnotation(Field(node, "type"));
  property.value = LowerExpression(Field(node, "value"));
  return MakeNode(Span(node), std::move(property));
}

NodeList TreeLowering::LowerDecorators(TSNode node) {
  NodeList decorators;
  if (!options_.decorators) {
    return decorators;
  }
  for (const auto child : NamedChildren(node)) {
    if (Kind(child) == "decorator") {
      decorators.push_back(LowerDecorator(child));
    }
  }
  return decorators;
}

NodePtr TreeLowering::LowerDecorator(TSNode node) {
  return MakeNode(Span(node), Decorator{LowerExpression(FirstNamed(node))});
}

// --------------------
// Expressions
// --------------------
NodePtr TreeLowering::LowerExpression(TSNode node) {
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  NestingGuard guard(depth_, node);
  if (IsErrorSite(node)) {
    return MakeError(node);
  }
  const auto kind = Kind(node);
  const auto span = Span(node);

  if (kind == "identifier" || kind == "undefined" || kind == "import" ||
      kind == "property_identifier" ||
      kind == "private_property_identifier" ||
      kind == "shorthand_property_identifier" || kind == "meta_property") {
    return MakeIdentifier(node, IdentifierRole::kReference);
  }
  if (kind == "this") {
    return MakeNode(span, ThisExpression{});
  }
  if (kind == "super") {
    return MakeNode(span, SuperExpression{});
  }
  if (kind == "true" || kind == "false") {
    BooleanLiteral literal;
    literal.value = kind == "true";
    return MakeNode(span, literal);
  }
  if (kind == "null") {
    return MakeNode(span, NullLiteral{});
  }
  if (kind == "number") {
    NumericLiteral literal;
    literal.raw = Text(node);
    literal.value = NumericValue(literal.raw);
    return MakeNode(span, std::move(literal));
  }
  if (kind == "string") {
    StringLiteral literal;
    literal.value = StringValue(node);
    return MakeNode(span, std::move(literal));
  }
  if (kind == "template_string") {
    return LowerTemplate(node);
  }
  if (kind == "regex") {
    RegExpLiteral literal;
    literal.pattern = Text(Field(node, "pattern"));
    literal.flags = Text(Field(node, "flags"));
    return MakeNode(span, std::move(literal));
  }
  if (kind == "parenthesized_expression") {
    return LowerExpression(FirstNamed(node));
  }
  if (kind == "call_expression") {
    return LowerCall(node);
  }
  if (kind == "new_expression") {
    NewExpression expression;
    expression.callee = LowerExpression(Field(node, "constructor"));
    expression.arguments = LowerArguments(Field(node, "arguments"));
    return MakeNode(span, std::move(expression));
  }
  if (kind == "member_expression" || kind == "subscript_expression") {
    return LowerMember(node);
  }
  if (kind == "assignment_expression") {
    return MakeNode(span,
                    AssignmentExpression{"=",
                                         LowerAssignmentTarget(
                                             Field(node, "left")),
                                         LowerExpression(Field(node, "right"))});
  }
  if (kind == "augmented_assignment_expression") {
    return MakeNode(span,
                    AssignmentExpression{Text(Field(node, "operator")),
                                         LowerExpression(Field(node, "left")),
                                         LowerExpression(Field(node, "right"))});
  }
  if (kind == "binary_expression") {
    return LowerBinary(node);
  }
  if (kind == "unary_expression") {
    return MakeNode(span,
                    UnaryExpression{Text(Field(node, "operator")),
                                    LowerExpression(Field(node, "argument"))});
  }
  if (kind == "update_expression") {
    const auto op = Field(node, "operator");
    const auto argument = Field(node, "argument");
    UpdateExpression update;
    update.op = Text(op);
    update.prefix = !ts_node_is_null(op) && !ts_node_is_null(argument) &&
                    ts_node_start_byte(op) < ts_node_start_byte(argument);
    update.argument = LowerExpression(argument);
    return MakeNode(span, std::move(update));
  }
  if (kind == "ternary_expression") {
    return MakeNode(span,
                    ConditionalExpression{
                        LowerExpression(Field(node, "condition")),
                        LowerExpression(Field(node, "consequence")),
                        LowerExpression(Field(node, "alternative"))});
  }
  if (kind == "await_expression") {
    return MakeNode(span, AwaitExpression{LowerExpression(FirstNamed(node))});
  }
  if (kind == "yield_expression") {
    YieldExpression expression;
    expression.argument = LowerExpression(FirstNamed(node));
    expression.delegate = HasChild(node, "*");
    return MakeNode(span, std::move(expression));
  }
  if (kind == "sequence_expression") {
    SequenceExpression sequence;
    LowerSequence(node, sequence.expressions);
    return MakeNode(span, std::move(sequence));
  }
  if (kind == "arrow_function") {
    return LowerArrow(node);
  }
  if (kind == "function_expression" || kind == "function" ||
      kind == "generator_function") {
    return LowerFunction<FunctionExpression>(node);
  }
  if (kind == "class") {
    return LowerClass<ClassExpression>(node, {});
  }
  if (kind == "object") {
    return LowerObject(node);
  }
  if (kind == "array") {
    return LowerArray(node);
  }
  if (kind == "spread_element") {
    return MakeNode(span, SpreadElement{LowerExpression(FirstNamed(node))});
  }
  if (kind == "object_pattern" || kind == "array_pattern") {
    return LowerPattern(node, IdentifierRole::kReference);
  }
  if (kind == "as_expression" || kind == "satisfies_expression" ||
      kind == "non_null_expression" || kind == "instantiation_expression") {
    return LowerExpression(FirstNamed(node));
  }
  if (kind == "type_assertion") {
    const auto children = NamedChildren(node);
    return children.empty() ? nullptr : LowerExpression(children.back());
  }
  if (kind == "jsx_element" || kind == "jsx_self_closing_element" ||
      kind == "jsx_fragment") {
    return LowerJsx(node);
  }
  if (kind == "internal_module") {
    return LowerNamespace(node);
  }
  ErrorNode error;
  error.message = "Unsupported syntax '" + std::string(kind) + "'";
  return MakeNode(span, std::move(error));
}

NodePtr TreeLowering::LowerCall(TSNode node) {
  const auto function = Field(node, "function");
  const auto arguments = Field(node, "arguments");
  if (!ts_node_is_null(arguments) && Kind(arguments) == "template_string") {
    return MakeNode(Span(node),
                    TaggedTemplateExpression{LowerExpression(function),
                                             LowerTemplate(arguments)});
  }
  CallExpression call;
  call.callee = LowerExpression(function);
  call.arguments = LowerArguments(arguments);
  call.optional = HasChild(node, "optional_chain") || HasChild(node, "?.");
  return MakeNode(Span(node), std::move(call));
}

NodeList TreeLowering::LowerArguments(TSNode node) {
  NodeList arguments;
  for (const auto child : NamedChildren(node)) {
    arguments.push_back(LowerExpression(child));
  }
  return arguments;
}

NodePtr TreeLowering::LowerMember(TSNode node) {
  MemberExpression member;
  member.object = LowerExpression(Field(node, "object"));
  if (Kind(node) == "subscript_expression") {
    member.property = LowerExpression(Field(node, "index"));
    member.computed = true;
  } else {
    member.property =
        MakeIdentifier(Field(node, "property"), IdentifierRole::kPropertyName);
  }
  member.optional = HasChild(node, "optional_chain") || HasChild(node, "?.");
  return MakeNode(Span(node), std::move(member));
}

NodePtr TreeLowering::LowerBinary(TSNode node) {
  auto op = Text(Field(node, "operator"));
  auto left = LowerExpression(Field(node, "left"));
  auto right = LowerExpression(Field(node, "right"));
  if (op == "&&" || op == "||" || op == "??") {
    return MakeNode(Span(node), LogicalExpression{std::move(op),
                                                  std::move(left),
                                                  std::move(right)});
  }
  return MakeNode(Span(node), BinaryExpression{std::move(op), std::move(left),
                                               std::move(right)});
}

void TreeLowering::LowerSequence(TSNode node, NodeList &expressions) {
  for (const auto child : NamedChildren(node)) {
    if (Kind(child) == "sequence_expression") {
      LowerSequence(child, expressions);
    } else {
      expressions.push_back(LowerExpression(child));
    }
  }
}

// Quasis are the raw source between substitutions.
NodePtr TreeLowering::LowerTemplate(TSNode node) {
  TemplateLiteral literal;
  std::size_t position = ts_node_start_byte(node) + 1;
  const std::size_t end =
      std::max<std::size_t>(position, ts_node_end_byte(node) - 1);
  for (const auto child : NamedChildren(node)) {
    if (Kind(child) != "template_substitution") {
      continue;
    }
    const std::size_t start = ts_node_start_byte(child);
    literal.quasis.push_back(
        start > position ? source_.substr(position, start - position) : "");
    position = ts_node_end_byte(child);
    const auto inner = FirstNamed(child);
    literal.expressions.push_back(ts_node_is_null(inner)
                                      ? MakeError(child)
                                      : LowerExpression(inner));
  }
  literal.quasis.push_back(
      end > position ? source_.substr(position, end - position) : "");
  return MakeNode(Span(node), std::move(literal));
}

NodePtr TreeLowering::LowerObject(TSNode node) {
  ObjectExpression object;
  for (const auto member : NamedChildren(node)) {
    const auto kind = Kind(member);
    ObjectProperty property;
    if (kind == "pair") {
      property.key = LowerPropertyKey(Field(member, "key"), property.computed);
      property.value = LowerExpression(Field(member, "value"));
    } else if (kind == "shorthand_property_identifier") {
      property.key = MakeIdentifier(member, IdentifierRole::kPropertyName);
      property.value = MakeIdentifier(member, IdentifierRole::kReference);
      property.shorthand = true;
    } else if (kind == "method_definition") {
      property.key = LowerPropertyKey(Field(member, "name"), property.computed);
      FunctionExpression function;
      function.is_async = HasChild(member, "async");
      function.is_generator = HasChild(member, "*");
      function.params = LowerParameters(Field(member, "parameters"));
      function.return_type = LowerAnnotation(Field(member, "return_type"));
      function.body = LowerBlock(Field(member, "body"));
      property.value = MakeNode(Span(member), std::move(function));
      property.method = true;
    } else {
      object.properties.push_back(LowerExpression(member));
      continue;
    }
    object.properties.push_back(MakeNode(Span(member), std::move(property)));
  }
  return MakeNode(Span(node), std::move(object));
}

NodePtr TreeLowering::LowerArray(TSNode node) {
  ArrayExpression array;
  bool expecting_element = true;
  const auto count = ts_node_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(node, i);
    const auto kind = Kind(child);
    if (kind == "comment" || kind == "[" || kind == "]") {
      continue;
    }
    if (kind == ",") {
      if (expecting_element) {
        array.elements.push_back(nullptr);
      }
      expecting_element = true;
      continue;
    }
    array.elements.push_back(LowerExpression(child));
    expecting_element = false;
  }
  return MakeNode(Span(node), std::move(array));
}

NodePtr TreeLowering::LowerPropertyKey(TSNode node, bool &computed) {
  computed = false;
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  const auto kind = Kind(node);
  if (kind == "computed_property_name") {
    computed = true;
    return LowerExpression(FirstNamed(node));
  }
  if (kind == "string" || kind == "number") {
    return LowerExpression(node);
  }
  return MakeIdentifier(node, IdentifierRole::kPropertyName);
}

// --------------------
// Patterns
// --------------------
NodePtr TreeLowering::LowerPattern(TSNode node, IdentifierRole role) {
  if (ts_node_is_null(node)) {
    return nullptr;
  }
  NestingGuard guard(depth_, node);
  if (IsErrorSite(node)) {
    return MakeError(node);
  }
  const auto kind = Kind(node);
  if (kind == "identifier" || kind == "shorthand_property_identifier_pattern" ||
      kind == "undefined") {
    return MakeIdentifier(node, role);
  }
  if (kind == "object_pattern") {
    return LowerObjectPattern(node, role);
  }
  if (kind == "array_pattern") {
    return LowerArrayPattern(node, role);
  }
  if (kind == "assignment_pattern") {
    return MakeNode(Span(node),
                    AssignmentPattern{LowerPattern(Field(node, "left"), role),
                                      LowerExpression(Field(node, "right"))});
  }
  if (kind == "rest_pattern") {
    return MakeNode(Span(node),
                    RestElement{LowerPattern(FirstNamed(node), role)});
  }
  return LowerExpression(node);
}

NodePtr TreeLowering::LowerObjectPattern(TSNode node, IdentifierRole role) {
  ObjectPattern pattern;
  for (const auto member : NamedChildren(node)) {
    const auto kind = Kind(member);
    ObjectProperty property;
    if (kind == "pair_pattern") {
      property.key = LowerPropertyKey(Field(member, "key"), property.computed);
      property.value = LowerPattern(Field(member, "value"), role);
    } else if (kind == "shorthand_property_identifier_pattern") {
      property.key = MakeIdentifier(member, IdentifierRole::kPropertyName);
      property.value = MakeIdentifier(member, role);
      property.shorthand = true;
    } else if (kind == "object_assignment_pattern") {
      const auto left = Field(member, "left");
      auto defaulted = MakeNode(
          Span(member), AssignmentPattern{LowerPattern(left, role),
                                          LowerExpression(Field(member,
                                                                "right"))});
      if (ts_node_is_null(left) ||
          Kind(left) != "shorthand_property_identifier_pattern") {
        pattern.properties.push_back(std::move(defaulted));
        continue;
      }
      property.key = MakeIdentifier(left, IdentifierRole::kPropertyName);
      property.value = std::move(defaulted);
      property.shorthand = true;
    } else {
      pattern.properties.push_back(LowerPattern(member, role));
      continue;
    }
    pattern.properties.push_back(MakeNode(Span(member), std::move(property)));
  }
  return MakeNode(Span(node), std::move(pattern));
}

NodePtr TreeLowering::LowerArrayPattern(TSNode node, IdentifierRole role) {
  ArrayPattern pattern;
  bool expecting_element = true;
  const auto count = ts_node_child_count(node);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(node, i);
    const auto kind = Kind(child);
    if (kind == "comment" || kind == "[" || kind == "]") {
      continue;
    }
    if (kind == ",") {
      if (expecting_element) {
        pattern.elements.push_back(nullptr);
      }
      expecting_element = true;
      continue;
    }
    pattern.elements.push_back(LowerPattern(child, role));
    expecting_element = false;
  }
  return MakeNode(Span(node), std::move(pattern));
}

// Destructuring on the left of `=` or in `for (x of ...)` assigns to
// existing names.
NodePtr TreeLowering::LowerAssignmentTarget(TSNode node) {
  if (!ts_node_is_null(node) &&
      (Kind(node) == "object_pattern" || Kind(node) == "array_pattern")) {
    return LowerPattern(node, IdentifierRole::kReference);
  }
  return LowerExpression(node);
}

// --------------------
// JSX
// --------------------
NodePtr TreeLowering::LowerJsx(TSNode node) {
  JsxElement element;
  const auto kind = Kind(node);
  const auto tag = kind == "jsx_element" ? Field(node, "open_tag") : node;
  if (!ts_node_is_null(tag) && kind != "jsx_fragment") {
    element.name = Text(Field(tag, "name"));
    for (const auto attribute : NamedChildren(tag)) {
      const auto attribute_kind = Kind(attribute);
      if (attribute_kind == "jsx_attribute") {
        element.attributes.push_back(LowerJsxAttribute(attribute));
      } else if (attribute_kind == "jsx_expression") {
        if (auto spread = LowerJsxExpression(attribute)) {
          element.attributes.push_back(std::move(spread));
        }
      }
    }
  }
  if (kind == "jsx_self_closing_element") {
    return MakeNode(Span(node), std::move(element));
  }

  for (const auto child : NamedChildren(node)) {
    const auto child_kind = Kind(child);
    if (child_kind == "jsx_opening_element" ||
        child_kind == "jsx_closing_element") {
      continue;
    }
    if (child_kind == "jsx_text" || child_kind == "html_character_reference") {
      auto text = Text(child);
      if (!IsBlank(text)) {
        JsxText node_text;
        node_text.value = std::move(text);
        element.children.push_back(MakeNode(Span(child), std::move(node_text)));
      }
    } else if (child_kind == "jsx_expression") {
      if (auto expression = LowerJsxExpression(child)) {
        element.children.push_back(std::move(expression));
      }
    } else {
      element.children.push_back(LowerExpression(child));
    }
  }
  return MakeNode(Span(node), std::move(element));
}

NodePtr TreeLowering::LowerJsxAttribute(TSNode node) {
  JsxAttribute attribute;
  const auto parts = NamedChildren(node);
  if (!parts.empty()) {
    attribute.name = Text(parts.front());
  }
  if (parts.size() > 1) {
    const auto value = parts[1];
    const auto kind = Kind(value);
    if (kind == "string") {
      // JSX attribute strings carry no escape sequences.
      const auto text = Text(value);
      StringLiteral literal;
      literal.value = text.size() >= 2 ? text.substr(1, text.size() - 2) : "";
      attribute.value = MakeNode(Span(value), std::move(literal));
    } else if (kind == "jsx_expression") {
      attribute.value = LowerJsxExpression(value);
    } else {
      attribute.value = LowerExpression(value);
    }
  }
  return MakeNode(Span(node), std::move(attribute));
}

// `{expression}`, `{...spread}` or an empty `{}`.
NodePtr TreeLowering::LowerJsxExpression(TSNode node) {
  const auto inner = FirstNamed(node);
  return ts_node_is_null(inner) ? nullptr : LowerExpression(inner);
}

} // namespace

ScriptParser::ScriptParser(ParseOptions options)
    : options_(std::move(options)) {}

ParseResult ScriptParser::Parse(const std::string &source) {
  ParserHandle parser(ts_parser_new(), ts_parser_delete);
  const TSLanguage *language =
      options_.jsx ? tree_sitter_tsx() : tree_sitter_typescript();
  if (!ts_parser_set_language(parser.get(), language)) {
    throw std::runtime_error("tree-sitter grammar version is incompatible "
                             "with the linked runtime");
  }

  TreeHandle tree(ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                         static_cast<std::uint32_t>(
                                             source.size())),
                  ts_tree_delete);
  if (!tree) {
    throw ParseError("Parser produced no syntax tree", 1, 1);
  }

  const auto root = ts_tree_root_node(tree.get());
  TreeLowering lowering(source, options_);
  lowering.Scan(root);

  ParseResult result;
  result.program = lowering.LowerProgram(root);
  result.diagnostics = lowering.TakeDiagnostics();
  result.has_type_annotations = lowering.has_type_annotations();
  result.comment_count = lowering.comment_count();
  return result;
}

} // namespace intent
