#include <intent/intent_json.h>

#include <intent/escaping.h>

#include <yaml-cpp/yaml.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace intent {
namespace {

std::string Quote(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string FormatDouble(double value) {
  std::ostringstream stream;
  stream << std::setprecision(15) << value;
  return stream.str();
}

template <typename Collection, typename Formatter>
std::string JsonArray(const Collection &items, Formatter formatter) {
  std::ostringstream output;
  output << "[";
  bool first = true;
  for (const auto &item : items) {
    if (!first) {
      output << ", ";
    }
    output << formatter(item);
    first = false;
  }
  output << "]";
  return output.str();
}

std::string StringArray(const std::vector<std::string> &values) {
  return JsonArray(values, Quote);
}

std::string SerializeDataFlow(const DataFlow &flow) {
  std::ostringstream output;
  output << "{\"name\": " << Quote(flow.name)
         << ", \"type\": " << Quote(flow.type)
         << ", \"source\": " << Quote(ToString(flow.source))
         << ", \"validation\": " << StringArray(flow.validation)
         << ", \"transformations\": " << StringArray(flow.transformations)
         << ", \"sensitivity\": " << Quote(ToString(flow.sensitivity)) << "}";
  return output.str();
}

std::string SerializeDependency(const Dependency &dependency) {
  std::ostringstream output;
  output << "{\"name\": " << Quote(dependency.name)
         << ", \"type\": " << Quote(ToString(dependency.type))
         << ", \"purpose\": " << Quote(dependency.purpose)
         << ", \"critical\": " << (dependency.critical ? "true" : "false")
         << "}";
  return output.str();
}

std::string SerializeComplexity(const ComplexityAnalysis &complexity) {
  std::ostringstream output;
  output << "{\"cognitive\": " << complexity.cognitive
         << ", \"cyclomatic\": " << complexity.cyclomatic
         << ", \"depth\": " << complexity.depth
         << ", \"coupling\": " << complexity.coupling
         << ", \"cohesion\": " << complexity.cohesion << "}";
  return output.str();
}

std::string OptionalInt(const std::optional<int> &value) {
  return value ? std::to_string(*value) : "null";
}

std::string SerializeDiagnostic(const Diagnostic &diagnostic) {
  std::ostringstream output;
  output << "{\"facet\": " << Quote(diagnostic.facet)
         << ", \"severity\": " << Quote(ToString(diagnostic.severity))
         << ", \"message\": " << Quote(diagnostic.message)
         << ", \"line\": " << OptionalInt(diagnostic.line)
         << ", \"column\": " << OptionalInt(diagnostic.column) << "}";
  return output.str();
}

// --------------------
// Reading
// --------------------
YAML::Node Field(const YAML::Node &object, const char *key) {
  return object[key];
}

bool Present(const YAML::Node &node) {
  return node.IsDefined() && !node.IsNull();
}

std::string ReadString(const YAML::Node &object, const char *key) {
  const auto node = Field(object, key);
  return Present(node) ? node.as<std::string>() : std::string{};
}

std::string RequireString(const YAML::Node &object, const char *key) {
  const auto node = Field(object, key);
  if (!Present(node)) {
    throw std::invalid_argument(std::string("Intent JSON is missing '") +
                                key + "'");
  }
  return node.as<std::string>();
}

std::vector<std::string> ReadStrings(const YAML::Node &object,
                                     const char *key) {
  const auto node = Field(object, key);
  if (!Present(node)) {
    return {};
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument(std::string("Intent JSON field '") + key +
                                "' must be an array");
  }
  return node.as<std::vector<std::string>>();
}

std::optional<int> ReadOptionalInt(const YAML::Node &object, const char *key) {
  const auto node = Field(object, key);
  if (!Present(node)) {
    return std::nullopt;
  }
  return node.as<int>();
}

template <typename T, typename Reader>
std::vector<T> ReadObjects(const YAML::Node &object, const char *key,
                           Reader reader) {
  const auto node = Field(object, key);
  std::vector<T> values;
  if (!Present(node)) {
    return values;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument(std::string("Intent JSON field '") + key +
                                "' must be an array");
  }
  for (const auto &element : node) {
    if (!element.IsMap()) {
      throw std::invalid_argument(std::string("Intent JSON field '") + key +
                                  "' must contain objects");
    }
    values.push_back(reader(element));
  }
  return values;
}

DataFlow ReadDataFlow(const YAML::Node &node) {
  DataFlow flow;
  flow.name = ReadString(node, "name");
  flow.type = ReadString(node, "type");
  flow.source = ParseFlowSource(RequireString(node, "source"));
  flow.validation = ReadStrings(node, "validation");
  flow.transformations = ReadStrings(node, "transformations");
  flow.sensitivity = ParseSensitivity(RequireString(node, "sensitivity"));
  return flow;
}

SideEffect ReadSideEffect(const YAML::Node &node) {
  SideEffect effect;
  effect.type = ParseSideEffectType(RequireString(node, "type"));
  effect.action = ReadString(node, "action");
  const auto target = Field(node, "target");
  if (Present(target)) {
    effect.target = target.as<std::string>();
  }
  effect.risk = ParseRisk(RequireString(node, "risk"));
  return effect;
}

Dependency ReadDependency(const YAML::Node &node) {
  Dependency dependency;
  dependency.name = ReadString(node, "name");
  dependency.type = ParseDependencyType(RequireString(node, "type"));
  dependency.purpose = ReadString(node, "purpose");
  const auto critical = Field(node, "critical");
  dependency.critical = Present(critical) && critical.as<bool>();
  return dependency;
}

Diagnostic ReadDiagnostic(const YAML::Node &node) {
  Diagnostic diagnostic;
  diagnostic.facet = ReadString(node, "facet");
  diagnostic.severity =
      ParseDiagnosticSeverity(RequireString(node, "severity"));
  diagnostic.message = ReadString(node, "message");
  diagnostic.line = ReadOptionalInt(node, "line");
  diagnostic.column = ReadOptionalInt(node, "column");
  return diagnostic;
}

ComplexityAnalysis ReadComplexity(const YAML::Node &object) {
  ComplexityAnalysis complexity;
  const auto node = Field(object, "complexity");
  if (!Present(node)) {
    return complexity;
  }
  if (!node.IsMap()) {
    throw std::invalid_argument(
        "Intent JSON field 'complexity' must be an object");
  }
  complexity.cognitive = node["cognitive"].as<int>(complexity.cognitive);
  complexity.cyclomatic = node["cyclomatic"].as<int>(complexity.cyclomatic);
  complexity.depth = node["depth"].as<int>(complexity.depth);
  complexity.coupling = node["coupling"].as<int>(complexity.coupling);
  complexity.cohesion = node["cohesion"].as<int>(complexity.cohesion);
  return complexity;
}

} // namespace

std::string SerializeSideEffect(const SideEffect &effect) {
  std::ostringstream output;
  output << "{\"type\": " << Quote(ToString(effect.type))
         << ", \"action\": " << Quote(effect.action) << ", \"target\": "
         << (effect.target ? Quote(*effect.target) : std::string("null"))
         << ", \"risk\": " << Quote(ToString(effect.risk)) << "}";
  return output.str();
}

std::string SerializeIntent(const CodeIntent &intent) {
  std::ostringstream output;
  output << "{\"purpose\": " << Quote(intent.purpose)
         << ", \"category\": " << Quote(ToString(intent.category))
         << ", \"actions\": " << StringArray(intent.actions)
         << ", \"inputs\": " << JsonArray(intent.inputs, SerializeDataFlow)
         << ", \"outputs\": " << JsonArray(intent.outputs, SerializeDataFlow)
         << ", \"side_effects\": "
         << JsonArray(intent.side_effects, SerializeSideEffect)
         << ", \"dependencies\": "
         << JsonArray(intent.dependencies, SerializeDependency)
         << ", \"complexity\": " << SerializeComplexity(intent.complexity)
         << ", \"patterns\": " << StringArray(intent.patterns)
         << ", \"anti_patterns\": " << StringArray(intent.anti_patterns)
         << ", \"suggestions\": " << StringArray(intent.suggestions)
         << ", \"confidence\": " << FormatDouble(intent.confidence)
         << ", \"diagnostics\": "
         << JsonArray(intent.diagnostics, SerializeDiagnostic) << "}";
  return output.str();
}

CodeIntent DeserializeIntent(const std::string &json) {
  YAML::Node root;
  try {
    root = YAML::Load(json);
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument(std::string("Invalid intent JSON: ") +
                                error.what());
  }
  if (!root.IsMap()) {
    throw std::invalid_argument("Intent JSON must be an object");
  }

  try {
    CodeIntent intent;
    intent.purpose = RequireString(root, "purpose");
    intent.category = ParseCategory(RequireString(root, "category"));
    intent.actions = ReadStrings(root, "actions");
    intent.inputs = ReadObjects<DataFlow>(root, "inputs", ReadDataFlow);
    intent.outputs = ReadObjects<DataFlow>(root, "outputs", ReadDataFlow);
    intent.side_effects =
        ReadObjects<SideEffect>(root, "side_effects", ReadSideEffect);
    intent.dependencies =
        ReadObjects<Dependency>(root, "dependencies", ReadDependency);
    intent.complexity = ReadComplexity(root);
    intent.patterns = ReadStrings(root, "patterns");
    intent.anti_patterns = ReadStrings(root, "anti_patterns");
    intent.suggestions = ReadStrings(root, "suggestions");
    const auto confidence = root["confidence"];
    intent.confidence = Present(confidence) ? confidence.as<double>() : 0.0;
    intent.diagnostics =
        ReadObjects<Diagnostic>(root, "diagnostics", ReadDiagnostic);
    return intent;
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument(std::string("Invalid intent JSON: ") +
                                error.what());
  }
}

} // namespace intent
