#pragma once

#include <intent/ast.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace intent {

using KeywordList = std::vector<std::string>;
// Ordered (needle, label) pairs; the first matching needle wins.
using LabelTable = std::vector<std::pair<std::string, std::string>>;

// Keyword and pattern tables read by the extractors. Built once and shared
// read-only between concurrent analyses.
struct AnalysisRegistry {
  // Purpose signals
  KeywordList api_decorators;
  KeywordList database_purpose_methods;
  KeywordList auth_functions;
  KeywordList validation_keywords;
  KeywordList event_handler_prefixes;
  LabelTable class_purposes;
  LabelTable file_name_purposes;

  // Data sensitivity tiers, most severe first
  KeywordList critical_keywords;
  KeywordList sensitive_keywords;
  KeywordList private_keywords;

  // Side effects
  KeywordList database_write_methods;
  KeywordList filesystem_modules;
  KeywordList network_identifiers;
  KeywordList console_methods;
  KeywordList global_objects;

  // Dependencies
  KeywordList builtin_modules;
  LabelTable dependency_purposes;
  KeywordList critical_dependency_keywords;

  // Complexity and patterns
  KeywordList builtin_receivers;
  std::vector<double> ordinary_numbers;
  std::string singleton_pattern;
  std::string factory_name_pattern;
  std::string observer_pattern;

  // Decides whether a function participates in the unit's cohesion.
  std::function<bool(const ast::Node &)> functions_related;
};

// Table edits read from configuration. Keys are the list names accepted by
// SupportedRegistryKeys(); "dependency_purposes" entries are "needle=label".
struct RegistryOverrides {
  bool replace = false;
  std::map<std::string, std::vector<std::string>> tables;
};

AnalysisRegistry MakeDefaultAnalysisRegistry();
std::shared_ptr<const AnalysisRegistry> DefaultAnalysisRegistry();

const std::vector<std::string> &SupportedRegistryKeys();

// Extends (or, with `replace`, substitutes) the named tables. Throws
// std::invalid_argument for unknown keys or malformed entries.
AnalysisRegistry ApplyRegistryOverrides(AnalysisRegistry registry,
                                        const RegistryOverrides &overrides);

} // namespace intent
