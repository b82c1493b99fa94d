#include <intent/intent_json.h>
#include <intent/intent_reporter.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace intent {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

CodeIntent MakeReportedIntent() {
  CodeIntent intent;
  intent.purpose = "Controller + API endpoint";
  intent.category = Category::kBusiness;
  intent.actions = {"Calls fetch"};

  DataFlow input;
  input.name = "token";
  input.type = "string";
  input.validation = {"verifyToken", "schema.validate"};
  input.sensitivity = Sensitivity::kSensitive;
  intent.inputs.push_back(input);

  SideEffect effect;
  effect.type = SideEffectType::kNetwork;
  effect.action = "HTTP request";
  effect.target = "https://api.example.com";
  effect.risk = Risk::kHigh;
  intent.side_effects.push_back(effect);

  Dependency dependency;
  dependency.name = "jsonwebtoken";
  dependency.type = DependencyType::kExternal;
  dependency.purpose = "Authentication";
  dependency.critical = true;
  intent.dependencies.push_back(dependency);

  intent.complexity = ComplexityAnalysis{3, 4, 2, 1, 100};
  intent.suggestions = {"Add error handling for network requests"};
  intent.confidence = 0.8125;

  Diagnostic diagnostic;
  diagnostic.facet = "parser";
  diagnostic.message = "Unexpected token";
  diagnostic.line = 3;
  diagnostic.column = 7;
  intent.diagnostics.push_back(diagnostic);
  return intent;
}

TEST(IntentReporterTest, RendersEverySection) {
  IntentReporter reporter;
  const auto report = reporter.Render(
      MakeReportedIntent(), ReportOptions{"auth.ts", {"markdown", "json"}});

  EXPECT_THAT(report.markdown, StartsWith("# Code Intent Report\n"));
  EXPECT_THAT(report.markdown, HasSubstr("## Analysis Header"));
  EXPECT_THAT(report.markdown, HasSubstr("| Source | auth.ts |"));
  EXPECT_THAT(report.markdown,
              HasSubstr("| Purpose | Controller + API endpoint |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Category | business |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Confidence | 0.81 |"));
  EXPECT_THAT(report.markdown, HasSubstr("## Actions\n\n- Calls fetch\n"));
  EXPECT_THAT(report.markdown,
              HasSubstr("| token | string | parameter | sensitive | "
                        "verifyToken<br>schema.validate | - |"));
  EXPECT_THAT(report.markdown,
              HasSubstr("| network | HTTP request | https://api.example.com "
                        "| high |"));
  EXPECT_THAT(report.markdown,
              HasSubstr("| jsonwebtoken | external | Authentication | yes |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Cyclomatic | 4 |"));
  EXPECT_THAT(report.markdown, HasSubstr("| parser | warning | 3:7 | "
                                         "Unexpected token |"));
}

TEST(IntentReporterTest, MarksEmptySectionsAsNone) {
  IntentReporter reporter;
  CodeIntent intent;
  intent.purpose = "General purpose function";

  const auto report = reporter.Render(intent, ReportOptions{"", {}});

  EXPECT_THAT(report.markdown, HasSubstr("| Source | - |"));
  EXPECT_THAT(report.markdown, HasSubstr("## Patterns\n\n- None\n"));
  EXPECT_THAT(report.markdown, HasSubstr("## Anti-Patterns\n\n- None\n"));
  EXPECT_THAT(report.markdown, HasSubstr("## Suggestions\n\n- None\n"));
  EXPECT_THAT(report.markdown, HasSubstr("| None | - | - | - | - | - |"));
  EXPECT_THAT(report.markdown, HasSubstr("## Diagnostics"));
}

TEST(IntentReporterTest, RendersOnlyMarkdownWhenNoFormatIsRequested) {
  IntentReporter reporter;

  const auto report =
      reporter.Render(MakeReportedIntent(), ReportOptions{"auth.ts", {}});

  EXPECT_FALSE(report.markdown.empty());
  EXPECT_TRUE(report.json.empty());
}

TEST(IntentReporterTest, RendersOnlyJsonWhenRequested) {
  IntentReporter reporter;

  const auto report =
      reporter.Render(MakeReportedIntent(), ReportOptions{"auth.ts", {"json"}});

  EXPECT_TRUE(report.markdown.empty());
  EXPECT_THAT(report.json, StartsWith("{\"analysis_header\": {"));
  EXPECT_THAT(report.json, HasSubstr("\"generated_on\": \""));
  EXPECT_THAT(report.json, HasSubstr("\"source\": \"auth.ts\"}"));
}

TEST(IntentReporterTest, EmbedsSerializedIntentInJson) {
  IntentReporter reporter;
  const auto intent = MakeReportedIntent();

  const auto report = reporter.Render(intent, ReportOptions{"auth.ts", {"json"}});

  EXPECT_THAT(report.json,
              HasSubstr("\"intent\": " + SerializeIntent(intent) + "}"));
}

TEST(IntentReporterTest, EscapesTableCells) {
  IntentReporter reporter;
  CodeIntent intent;
  intent.purpose = "Handles a|b\nchoices";

  const auto report = reporter.Render(intent, ReportOptions{"src|x.ts", {}});

  EXPECT_THAT(report.markdown, HasSubstr("| Source | src\\|x.ts |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Purpose | Handles a\\|b<br>choices |"));
  EXPECT_THAT(report.markdown, Not(HasSubstr("a|b")));
}

TEST(IntentReporterTest, ShowsUnlocatedDiagnosticsWithDash) {
  IntentReporter reporter;
  CodeIntent intent;
  Diagnostic diagnostic;
  diagnostic.facet = "complexity";
  diagnostic.severity = DiagnosticSeverity::kError;
  diagnostic.message = "relatedness unavailable";
  intent.diagnostics.push_back(diagnostic);

  const auto report = reporter.Render(intent, ReportOptions{"x.js", {}});

  EXPECT_THAT(report.markdown,
              HasSubstr("| complexity | error | - | relatedness unavailable |"));
}

} // namespace
} // namespace intent
