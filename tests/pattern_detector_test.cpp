#include <intent/pattern_detector.h>
#include <intent/registry.h>
#include <intent/script_parser.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <regex>
#include <string>

namespace intent {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

class PatternDetectorTest : public ::testing::Test {
protected:
  std::vector<std::string> Patterns(const std::string &code) {
    const auto result = parser_.Parse(code);
    return patterns_.Detect(*result.program, code);
  }

  std::vector<std::string> AntiPatterns(const std::string &code) {
    const auto result = parser_.Parse(code);
    return anti_patterns_.Detect(*result.program, code);
  }

  ScriptParser parser_;
  PatternDetector patterns_{DefaultAnalysisRegistry()};
  AntiPatternDetector anti_patterns_{DefaultAnalysisRegistry()};
};

TEST_F(PatternDetectorTest, RepositoryClassIsRecognised) {
  EXPECT_THAT(Patterns("class UserRepository {}"), ElementsAre("Repository"));
}

TEST_F(PatternDetectorTest, ReportsPatternsInFixedOrder) {
  const auto patterns = Patterns(
      "class Cache {\n"
      "  static getInstance() { return new Cache(); }\n"
      "}\n"
      "class Mailer {\n"
      "  constructor(transport) { this.transport = transport; }\n"
      "  send() { this.transport.emit('mail'); }\n"
      "}\n"
      "class OrderRepository {}\n"
      "function createOrder() { return new QueryBuilder().withLimit(5).build(); }\n"
      "function guard(req, res, next) { next(); }");

  EXPECT_THAT(patterns,
              ElementsAre("Singleton", "Factory", "Observer/EventEmitter",
                          "Repository", "Dependency Injection", "Builder",
                          "Middleware"));
}

TEST_F(PatternDetectorTest, ConstructorWithoutParametersIsNotInjection) {
  EXPECT_THAT(Patterns("class Clock { constructor() { this.t = 0; } }"),
              Not(Contains("Dependency Injection")));
  EXPECT_THAT(Patterns("const Store = class { constructor(db) {} };"),
              Contains("Dependency Injection"));
}

TEST_F(PatternDetectorTest, FactoryNeedsMatchingFunctionName) {
  EXPECT_THAT(Patterns("function makeWidget() {}"), Contains("Factory"));
  EXPECT_THAT(Patterns("function created() {}"), IsEmpty());
}

TEST_F(PatternDetectorTest, InvalidRegistryPatternThrows) {
  auto registry = MakeDefaultAnalysisRegistry();
  registry.observer_pattern = "(unclosed";

  const auto shared =
      std::make_shared<const AnalysisRegistry>(std::move(registry));

  EXPECT_THROW(PatternDetector detector(shared), std::regex_error);
}

TEST_F(PatternDetectorTest, CleanCodeHasNoAntiPatterns) {
  EXPECT_THAT(AntiPatterns("function add(a, b) { return a + b; }"),
              IsEmpty());
}

TEST_F(PatternDetectorTest, DetectsGodObject) {
  std::string code = "class Everything {\n";
  for (int i = 0; i < 21; ++i) {
    code += "  method" + std::to_string(i) + "() { return this.state; }\n";
  }
  code += "}\nclass Small { a() {} }";

  EXPECT_THAT(AntiPatterns(code),
              ElementsAre("God Object - too many responsibilities"));
}

TEST_F(PatternDetectorTest, DetectsCallbackHell) {
  EXPECT_THAT(
      AntiPatterns(
          "a(() => b(() => c(() => d(() => e(() => f(() => ok))))));"),
      ElementsAre("Callback Hell - use async/await"));
}

TEST_F(PatternDetectorTest, DetectsMagicNumbers) {
  EXPECT_THAT(AntiPatterns("use([3, 7, 42, 99, 365, 1024]);"),
              ElementsAre("Magic Numbers - use named constants"));
  EXPECT_THAT(AntiPatterns("use([0, 1, -1, 10, 100, 3]);"), IsEmpty());
}

TEST_F(PatternDetectorTest, DetectsLongParameterListAndDeepNesting) {
  EXPECT_THAT(AntiPatterns("function f(a, b, c, d, e) { run(a, b, c, d, e); }"),
              ElementsAre("Long Parameter List - use object parameters"));
  EXPECT_THAT(
      AntiPatterns("function f(x) { if (x) { if (x) { if (x) { if (x) { "
                   "run(); } } } } }"),
      ElementsAre("Deep Nesting - simplify logic"));
}

TEST_F(PatternDetectorTest, DetectsUnusedVariables) {
  EXPECT_THAT(AntiPatterns("let a;\nlet b;\nlet c;\nuse(a);"), IsEmpty());
  EXPECT_THAT(AntiPatterns("let a;\nlet b;\nlet c;\nlet d;\nuse(a);"),
              ElementsAre("Unused Variables - remove dead code"));
}

TEST_F(PatternDetectorTest, CountsEachUnusedNameOnce) {
  const auto anti_patterns = AntiPatterns("function a() { const tmp = 0; }\n"
                                          "function b() { const tmp = 0; }\n"
                                          "function c() { const tmp = 0; }\n");

  EXPECT_THAT(anti_patterns,
              Not(Contains("Unused Variables - remove dead code")));
}

TEST(DuplicatedLinesTest, FindsRepeatedFiveLineWindows) {
  const std::string block = "a();\nb();\nc();\nd();\ne();\n";

  EXPECT_TRUE(HasDuplicatedLines(block + block));
  EXPECT_FALSE(HasDuplicatedLines(block + "f();\n"));
  EXPECT_FALSE(HasDuplicatedLines(""));
}

} // namespace
} // namespace intent
