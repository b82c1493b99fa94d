#include <intent/registry.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace intent {
namespace {

bool Has(const KeywordList &list, const std::string &value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

TEST(RegistryTest, DefaultTablesCarryKnownSignals) {
  const auto registry = DefaultAnalysisRegistry();

  EXPECT_TRUE(Has(registry->sensitive_keywords, "password"));
  EXPECT_TRUE(Has(registry->critical_keywords, "payment"));
  EXPECT_TRUE(Has(registry->builtin_modules, "fs"));
  EXPECT_TRUE(Has(registry->api_decorators, "Controller"));
  ASSERT_TRUE(static_cast<bool>(registry->functions_related));
  EXPECT_EQ(registry, DefaultAnalysisRegistry());
}

TEST(RegistryTest, OverridesExtendTablesWithoutDuplicates) {
  RegistryOverrides overrides;
  overrides.tables["sensitive_keywords"] = {"pin", "password"};

  const auto registry =
      ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), overrides);

  EXPECT_TRUE(Has(registry.sensitive_keywords, "pin"));
  EXPECT_EQ(std::count(registry.sensitive_keywords.begin(),
                       registry.sensitive_keywords.end(), "password"),
            1);
  EXPECT_EQ(registry.sensitive_keywords.back(), "pin");
}

TEST(RegistryTest, ReplaceSubstitutesWholeTables) {
  RegistryOverrides overrides;
  overrides.replace = true;
  overrides.tables["network_identifiers"] = {"got"};

  const auto registry =
      ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), overrides);

  EXPECT_EQ(registry.network_identifiers, KeywordList{"got"});
  EXPECT_TRUE(Has(registry.database_write_methods, "save"));
}

TEST(RegistryTest, DependencyPurposesUseNeedleEqualsLabel) {
  RegistryOverrides overrides;
  overrides.tables["dependency_purposes"] = {"express=HTTP server",
                                             "stripe=Payments"};

  const auto registry =
      ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), overrides);

  const auto &table = registry.dependency_purposes;
  const auto express =
      std::find_if(table.begin(), table.end(),
                   [](const auto &entry) { return entry.first == "express"; });
  ASSERT_NE(express, table.end());
  EXPECT_EQ(express->second, "HTTP server");
  EXPECT_EQ(table.back(), (std::pair<std::string, std::string>{
                              "stripe", "Payments"}));
}

TEST(RegistryTest, RejectsMalformedOverrides) {
  RegistryOverrides unknown;
  unknown.tables["colours"] = {"red"};
  EXPECT_THROW(ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), unknown),
               std::invalid_argument);

  RegistryOverrides empty_entry;
  empty_entry.tables["critical_keywords"] = {""};
  EXPECT_THROW(
      ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), empty_entry),
      std::invalid_argument);

  RegistryOverrides bad_label;
  bad_label.tables["dependency_purposes"] = {"express"};
  EXPECT_THROW(ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), bad_label),
               std::invalid_argument);
}

TEST(RegistryTest, SupportedKeysAreAllAccepted) {
  for (const auto &key : SupportedRegistryKeys()) {
    RegistryOverrides overrides;
    overrides.tables[key] = {"needle=label"};
    EXPECT_NO_THROW(
        ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), overrides))
        << key;
  }
}

} // namespace
} // namespace intent
