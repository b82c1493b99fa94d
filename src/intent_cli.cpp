#include <intent/intent_cli.h>

#include <intent/cli_exit_codes.h>
#include <intent/intent_analyzer_builder.h>
#include <intent/intent_reporter.h>
#include <intent/text.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using intent::AnalyzeOptions;
using intent::ToLower;
using intent::Trim;

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: intent-analyze analyze --file <path> [options]\n"
      << "Options:\n"
      << "  --file <path>          JavaScript or TypeScript file to analyze\n"
      << "  --file-name <name>     File name reported to the analyzer\n"
      << "                         (default: name of --file)\n"
      << "  --project-type <type>  Project type hint\n"
      << "  --dependencies <list>  Comma-separated declared dependencies\n"
      << "  --format <list>        Comma-separated list of output formats\n"
      << "                         (supported: markdown,json)\n"
      << "  --out <path>           Directory for report outputs (default: "
         "stdout)\n"
      << "  --config <file>        Optional YAML config file\n"
      << "  --log-level <level>    Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose              Shortcut for --log-level info\n"
      << "  --debug                Shortcut for --log-level debug\n"
      << "  --no-typescript        Reject TypeScript syntax\n"
      << "  --no-jsx               Reject JSX syntax\n"
      << "  --no-decorators        Reject decorators\n"
      << "  --help                 Show this message\n";
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = intent::ParseLogLevel(
        RequireValue(arguments, index, std::string(argument)));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = intent::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = intent::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleDialectOption(const std::string &argument,
                         AnalyzeOptions &options) {
  if (argument == "--no-typescript") {
    options.typescript = false;
    return true;
  }
  if (argument == "--no-jsx") {
    options.jsx = false;
    return true;
  }
  if (argument == "--no-decorators") {
    options.decorators = false;
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--file") {
    options.file = RequireValue(arguments, index, "--file");
    return true;
  }
  if (argument == "--file-name") {
    options.file_name = RequireValue(arguments, index, "--file-name");
    return true;
  }
  if (argument == "--project-type") {
    options.project_type = RequireValue(arguments, index, "--project-type");
    return true;
  }
  if (argument == "--dependencies") {
    AppendValues(RequireValue(arguments, index, "--dependencies"),
                 options.dependencies);
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandleDialectOption(argument, options);
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.file) {
    throw std::invalid_argument("--file is required");
  }
}

std::string ReadSourceFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open source file: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root,
                  const intent::Report &report) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "intent_report.md", report.markdown);
  WriteFileIfContent(root / "intent_report.json", report.json);
}

void PrintReport(const intent::Report &report) {
  if (!report.markdown.empty()) {
    std::cout << report.markdown;
  }
  if (!report.json.empty()) {
    if (!report.markdown.empty()) {
      std::cout << "\n";
    }
    std::cout << report.json << "\n";
  }
}

} // namespace

namespace intent {

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>,
                                 RegistryOverrides>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "file_name",  "project_type", "dependencies", "formats",
      "out",        "log_level",    "typescript",   "jsx",
      "decorators", "registry"};
  return keys;
}

namespace {

std::string JoinKeys(const std::vector<std::string> &keys) {
  std::string joined;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    joined += keys[i];
    if (i + 1 < keys.size()) {
      joined += ", ";
    }
  }
  return joined;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"filename", "file_name"},
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"deps", "dependencies"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  throw std::invalid_argument("Unknown config key: " + key +
                              ". Supported keys: " +
                              JoinKeys(SupportedConfigKeys()));
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

void AppendRegistryEntry(const std::string &value,
                         std::vector<std::string> &target) {
  const auto entry = Trim(value);
  if (entry.empty()) {
    throw std::invalid_argument("Registry entries cannot be empty");
  }
  target.push_back(entry);
}

RegistryOverrides ExtractRegistry(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw std::invalid_argument(
        "Config key 'registry' must be a mapping of table names to lists");
  }

  RegistryOverrides overrides;
  const auto &tables = SupportedRegistryKeys();
  for (const auto &entry : node) {
    auto table = ToLower(Trim(entry.first.as<std::string>()));
    std::replace(table.begin(), table.end(), '-', '_');
    if (table == "replace") {
      overrides.replace = ExtractBool(entry.second, "registry.replace");
      continue;
    }
    if (std::find(tables.begin(), tables.end(), table) == tables.end()) {
      throw std::invalid_argument("Unknown registry table: " + table +
                                  ". Supported tables: replace, " +
                                  JoinKeys(tables));
    }
    overrides.tables[table] =
        ExtractList(entry.second, "registry." + table, AppendRegistryEntry);
  }
  return overrides;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "dependencies") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "typescript" || key == "jsx" || key == "decorators") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "registry") {
    return ConfigValue{ExtractRegistry(node)};
  }
  if (key == "file_name" || key == "project_type" || key == "out" ||
      key == "log_level") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "file_name") {
      options.file_name = std::get<std::string>(value);
      continue;
    }
    if (key == "project_type") {
      options.project_type = std::get<std::string>(value);
      continue;
    }
    if (key == "dependencies") {
      options.dependencies = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "out") {
      options.output_directory = std::get<std::string>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    if (key == "typescript") {
      options.typescript = std::get<bool>(value);
      continue;
    }
    if (key == "jsx") {
      options.jsx = std::get<bool>(value);
      continue;
    }
    if (key == "decorators") {
      options.decorators = std::get<bool>(value);
      continue;
    }
    if (key == "registry") {
      options.registry = std::get<RegistryOverrides>(value);
      continue;
    }
    ThrowUnknownKey(key);
  }
}

} // namespace

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.file, cli_options.file);
  override_value(merged.file_name, cli_options.file_name);
  override_value(merged.project_type, cli_options.project_type);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.typescript, cli_options.typescript);
  override_value(merged.jsx, cli_options.jsx);
  override_value(merged.decorators, cli_options.decorators);

  if (!cli_options.dependencies.empty()) {
    merged.dependencies = cli_options.dependencies;
  }
  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  if (!cli_options.registry.tables.empty() || cli_options.registry.replace) {
    merged.registry = cli_options.registry;
  }
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

AnalysisContext BuildAnalysisContext(const AnalyzeOptions &options) {
  AnalysisContext context;
  if (options.file_name) {
    context.file_name = options.file_name;
  } else if (options.file) {
    context.file_name = options.file->filename().string();
  }
  context.project_type = options.project_type;
  context.dependencies = options.dependencies;
  return context;
}

ParseOptions BuildParseOptions(const AnalyzeOptions &options) {
  ParseOptions parse_options;
  parse_options.typescript = options.typescript.value_or(true);
  parse_options.jsx = options.jsx.value_or(true);
  parse_options.decorators = options.decorators.value_or(true);
  return parse_options;
}

std::shared_ptr<const AnalysisRegistry>
BuildRegistry(const AnalyzeOptions &options) {
  if (options.registry.tables.empty() && !options.registry.replace) {
    return DefaultAnalysisRegistry();
  }
  return std::make_shared<const AnalysisRegistry>(
      ApplyRegistryOverrides(MakeDefaultAnalysisRegistry(), options.registry));
}

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage();
    return 0;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);
  const auto code = ReadSourceFile(*merged.file);

  auto analyzer = IntentAnalyzerBuilder()
                      .WithLogger(logger)
                      .WithRegistry(BuildRegistry(merged))
                      .WithParseOptions(BuildParseOptions(merged))
                      .Build();
  const auto intent = analyzer.Analyze(code, BuildAnalysisContext(merged));

  ReportOptions report_options;
  report_options.source = merged.file->string();
  report_options.formats = merged.formats;
  const auto report = IntentReporter().Render(intent, report_options);
  if (merged.output_directory) {
    WriteReports(*merged.output_directory, report);
  } else {
    PrintReport(report);
  }
  return IntentExitCode(intent);
}

} // namespace intent
