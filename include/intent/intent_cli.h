#pragma once

#include <intent/interfaces.h>
#include <intent/logging.h>
#include <intent/registry.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace intent {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> file;
  std::optional<std::string> file_name;
  std::optional<std::string> project_type;
  std::vector<std::string> dependencies;
  std::vector<std::string> formats;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<LogLevel> log_level;
  std::optional<bool> typescript;
  std::optional<bool> jsx;
  std::optional<bool> decorators;
  RegistryOverrides registry;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
// Loads --config when given, merges it under the CLI flags and checks that a
// source file is set.
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

const std::vector<std::string> &SupportedConfigKeys();

AnalysisContext BuildAnalysisContext(const AnalyzeOptions &options);
ParseOptions BuildParseOptions(const AnalyzeOptions &options);
std::shared_ptr<const AnalysisRegistry>
BuildRegistry(const AnalyzeOptions &options);
LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options);

int RunAnalyze(const std::vector<std::string> &arguments);

} // namespace intent
