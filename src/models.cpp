#include <intent/models.h>

#include <stdexcept>
#include <utility>

namespace intent {
namespace {

template <typename Enum, std::size_t N>
Enum ParseEnum(const std::pair<Enum, const char *> (&names)[N],
               const std::string &value, const char *kind) {
  for (const auto &[candidate, name] : names) {
    if (value == name) {
      return candidate;
    }
  }
  throw std::invalid_argument("Unknown " + std::string(kind) + ": " + value);
}

template <typename Enum, std::size_t N>
std::string NameOf(const std::pair<Enum, const char *> (&names)[N],
                   Enum value) {
  for (const auto &[candidate, name] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

const std::pair<Category, const char *> kCategoryNames[] = {
    {Category::kBusiness, "business"},
    {Category::kInfrastructure, "infrastructure"},
    {Category::kUtility, "utility"},
    {Category::kSecurity, "security"},
    {Category::kData, "data"}};

const std::pair<FlowSource, const char *> kFlowSourceNames[] = {
    {FlowSource::kParameter, "parameter"}, {FlowSource::kDatabase, "database"},
    {FlowSource::kApi, "api"},             {FlowSource::kFile, "file"},
    {FlowSource::kUser, "user"},           {FlowSource::kInternal, "internal"}};

const std::pair<Sensitivity, const char *> kSensitivityNames[] = {
    {Sensitivity::kPublic, "public"},
    {Sensitivity::kPrivate, "private"},
    {Sensitivity::kSensitive, "sensitive"},
    {Sensitivity::kCritical, "critical"}};

const std::pair<SideEffectType, const char *> kSideEffectNames[] = {
    {SideEffectType::kDatabase, "database"},
    {SideEffectType::kFile, "file"},
    {SideEffectType::kNetwork, "network"},
    {SideEffectType::kConsole, "console"},
    {SideEffectType::kGlobal, "global"},
    {SideEffectType::kAsync, "async"}};

const std::pair<Risk, const char *> kRiskNames[] = {
    {Risk::kLow, "low"}, {Risk::kMedium, "medium"}, {Risk::kHigh, "high"}};

const std::pair<DependencyType, const char *> kDependencyTypeNames[] = {
    {DependencyType::kInternal, "internal"},
    {DependencyType::kExternal, "external"},
    {DependencyType::kSystem, "system"}};

const std::pair<DiagnosticSeverity, const char *> kSeverityNames[] = {
    {DiagnosticSeverity::kWarning, "warning"},
    {DiagnosticSeverity::kError, "error"}};

} // namespace

Risk RiskFor(SideEffectType type) {
  switch (type) {
  case SideEffectType::kNetwork:
  case SideEffectType::kGlobal:
    return Risk::kHigh;
  case SideEffectType::kDatabase:
  case SideEffectType::kFile:
    return Risk::kMedium;
  case SideEffectType::kConsole:
  case SideEffectType::kAsync:
    return Risk::kLow;
  }
  return Risk::kLow;
}

std::string ToString(Category category) {
  return NameOf(kCategoryNames, category);
}

std::string ToString(FlowSource source) {
  return NameOf(kFlowSourceNames, source);
}

std::string ToString(Sensitivity sensitivity) {
  return NameOf(kSensitivityNames, sensitivity);
}

std::string ToString(SideEffectType type) {
  return NameOf(kSideEffectNames, type);
}

std::string ToString(Risk risk) { return NameOf(kRiskNames, risk); }

std::string ToString(DependencyType type) {
  return NameOf(kDependencyTypeNames, type);
}

std::string ToString(DiagnosticSeverity severity) {
  return NameOf(kSeverityNames, severity);
}

Category ParseCategory(const std::string &value) {
  return ParseEnum(kCategoryNames, value, "category");
}

FlowSource ParseFlowSource(const std::string &value) {
  return ParseEnum(kFlowSourceNames, value, "data flow source");
}

Sensitivity ParseSensitivity(const std::string &value) {
  return ParseEnum(kSensitivityNames, value, "sensitivity");
}

SideEffectType ParseSideEffectType(const std::string &value) {
  return ParseEnum(kSideEffectNames, value, "side effect type");
}

Risk ParseRisk(const std::string &value) {
  return ParseEnum(kRiskNames, value, "risk");
}

DependencyType ParseDependencyType(const std::string &value) {
  return ParseEnum(kDependencyTypeNames, value, "dependency type");
}

DiagnosticSeverity ParseDiagnosticSeverity(const std::string &value) {
  return ParseEnum(kSeverityNames, value, "diagnostic severity");
}

} // namespace intent
