#pragma once

#include <pyscan/logging.h>
#include <pyscan/models.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pyscan {

struct AnalyzeOptions {
  std::vector<std::string> files;
  std::vector<std::string> enabled_categories;
  std::vector<std::string> disabled_categories;
  std::vector<std::string> formats;
  std::vector<std::string> rule_files;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> reporter;
  std::optional<Severity> fail_on;
  std::optional<bool> parallel;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct CompareOptions {
  std::optional<std::filesystem::path> before;
  std::optional<std::filesystem::path> after;
  std::vector<std::string> enabled_categories;
  std::vector<std::string> disabled_categories;
  std::vector<std::string> rule_files;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct RulesOptions {
  std::vector<std::string> rule_files;
  std::optional<std::string> category;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
// CLI values win over config values; list values replace, not append.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

// All categories when none are enabled explicitly, minus the disabled ones.
// Throws std::invalid_argument when nothing is left.
AnalysisOptions
BuildAnalysisOptions(const std::vector<std::string> &enabled_categories,
                     const std::vector<std::string> &disabled_categories);

CompareOptions ParseCompareArguments(const std::vector<std::string> &arguments);
RulesOptions ParseRulesArguments(const std::vector<std::string> &arguments);

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out);
int RunCompare(const std::vector<std::string> &arguments, std::ostream &out);
int RunRules(const std::vector<std::string> &arguments, std::ostream &out);

} // namespace pyscan
