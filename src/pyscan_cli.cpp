#include <pyscan/pyscan_cli.h>

#include <pyscan/cli_exit_codes.h>
#include <pyscan/code_analyzer_builder.h>
#include <pyscan/component_registry.h>
#include <pyscan/escaping.h>
#include <pyscan/file_source_provider.h>
#include <pyscan/rule.h>
#include <pyscan/rule_registry.h>
#include <pyscan/text_reporter.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using pyscan::AnalyzeOptions;

constexpr const char kMarkdownReportName[] = "pyscan_report.md";
constexpr const char kJsonReportName[] = "pyscan_report.json";

void PrintAnalyzeUsage(std::ostream &out) {
  out << "Usage: pyscan analyze [options] [<path>...]\n"
      << "Options:\n"
      << "  --file <path>         Python file or directory to analyze; '-'\n"
      << "                        reads standard input (repeatable)\n"
      << "  --enable <list>       Comma-separated categories to run\n"
      << "                        (security,performance,quality,complexity,\n"
      << "                        dead_code,type_hints,syntax; default: all)\n"
      << "  --disable <list>      Comma-separated categories to skip\n"
      << "  --format <list>       Comma-separated list of output formats\n"
      << "                        (supported: markdown,json)\n"
      << "  --out <path>          Directory for report outputs (default: .)\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --rules <list>        Comma-separated YAML rule packs to load\n"
      << "  --reporter <name>     Reporter plug-in (markdown,text)\n"
      << "  --fail-on <severity>  Lowest severity that makes the exit code 2\n"
      << "                        (info,warning,error,critical; default: "
         "error)\n"
      << "  --parallel            Scan categories concurrently\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n";
}

void PrintCompareUsage(std::ostream &out) {
  out << "Usage: pyscan compare --before <file> --after <file> [options]\n"
      << "Options:\n"
      << "  --enable <list>       Comma-separated categories to run\n"
      << "  --disable <list>      Comma-separated categories to skip\n"
      << "  --rules <list>        Comma-separated YAML rule packs to load\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --help                Show this message\n";
}

void PrintRulesUsage(std::ostream &out) {
  out << "Usage: pyscan rules [--category <name>] [--rules <list>]\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

void AppendUnique(std::string value, std::vector<std::string> &target) {
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(std::move(value));
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : pyscan::SplitList(raw_formats, ',')) {
    format = ToLower(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    AppendUnique(std::move(format), target);
  }
}

void AppendCategories(const std::string &raw_categories,
                      std::vector<std::string> &target) {
  for (const auto &name : pyscan::SplitList(raw_categories, ',')) {
    AppendUnique(pyscan::CategoryName(pyscan::ParseCategory(name)), target);
  }
}

void AppendPaths(const std::string &raw_paths,
                 std::vector<std::string> &target) {
  for (const auto &path : pyscan::SplitList(raw_paths, ',')) {
    AppendUnique(path, target);
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool IsPositional(const std::string &argument) {
  return argument == "-" || argument.rfind('-', 0) != 0;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index,
                         std::optional<pyscan::LogLevel> &log_level) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    log_level =
        pyscan::ParseLogLevel(RequireValue(arguments, index, "--log-level"));
    return true;
  }
  if (argument == "--verbose") {
    log_level = pyscan::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    log_level = pyscan::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleCategoryOption(const std::vector<std::string> &arguments,
                          std::size_t &index,
                          std::vector<std::string> &enabled,
                          std::vector<std::string> &disabled) {
  const auto &argument = arguments[index];
  if (argument == "--enable") {
    AppendCategories(RequireValue(arguments, index, "--enable"), enabled);
    return true;
  }
  if (argument == "--disable") {
    AppendCategories(RequireValue(arguments, index, "--disable"), disabled);
    return true;
  }
  return false;
}

bool HandleOutputOption(const std::vector<std::string> &arguments,
                        std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, "--reporter");
    return true;
  }
  if (argument == "--fail-on") {
    options.fail_on =
        pyscan::ParseSeverity(RequireValue(arguments, index, "--fail-on"));
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
  if (IsPositional(argument)) {
    AppendUnique(argument, options.files);
    return true;
  }
  if (argument == "--file") {
    AppendUnique(RequireValue(arguments, index, "--file"), options.files);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--rules") {
    AppendPaths(RequireValue(arguments, index, "--rules"), options.rule_files);
    return true;
  }
  if (argument == "--parallel") {
    options.parallel = true;
    return true;
  }
  return HandleCategoryOption(arguments, index, options.enabled_categories,
                              options.disabled_categories) ||
         HandleOutputOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options.log_level);
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (options.files.empty()) {
    throw std::invalid_argument(
        "No input given: pass --file, a path, or set 'files' in the config "
        "file");
  }
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "files",    "enable",   "disable", "formats",  "out",
      "rules",    "reporter", "fail_on", "parallel", "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"file", "files"},
      {"categories", "enable"},
      {"enabled", "enable"},
      {"disabled", "disable"},
      {"format", "formats"},
      {"output", "out"},
      {"output_directory", "out"},
      {"rule_files", "rules"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
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

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "enable" || key == "disable") {
    return ExtractList(node, key, AppendCategories);
  }
  if (key == "files" || key == "rules") {
    return ExtractList(node, key, AppendPaths);
  }
  if (key == "parallel") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "out" || key == "reporter" || key == "fail_on" ||
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
    if (key == "files") {
      options.files = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "enable") {
      options.enabled_categories = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "disable") {
      options.disabled_categories = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "rules") {
      options.rule_files = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "out") {
      options.output_directory = std::get<std::string>(value);
      continue;
    }
    if (key == "reporter") {
      options.reporter = std::get<std::string>(value);
      continue;
    }
    if (key == "fail_on") {
      options.fail_on = pyscan::ParseSeverity(std::get<std::string>(value));
      continue;
    }
    if (key == "parallel") {
      options.parallel = std::get<bool>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = pyscan::ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content, std::ostream &out) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
  out << "Wrote " << path.generic_string() << "\n";
}

void WriteReports(const std::filesystem::path &root,
                  const pyscan::Report &report, std::ostream &out) {
  if (report.markdown.empty() && report.json.empty()) {
    return;
  }
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / kMarkdownReportName, report.markdown, out);
  WriteFileIfContent(root / kJsonReportName, report.json, out);
}

pyscan::LoggingConfig
BuildLoggingConfig(const std::optional<pyscan::LogLevel> &log_level) {
  pyscan::LoggingConfig logging;
  logging.level = log_level.value_or(pyscan::LogLevel::kWarn);
  return logging;
}

} // namespace

namespace pyscan {

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
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.fail_on, cli_options.fail_on);
  override_value(merged.parallel, cli_options.parallel);
  override_value(merged.log_level, cli_options.log_level);

  override_list(merged.files, cli_options.files);
  override_list(merged.enabled_categories, cli_options.enabled_categories);
  override_list(merged.disabled_categories, cli_options.disabled_categories);
  override_list(merged.formats, cli_options.formats);
  override_list(merged.rule_files, cli_options.rule_files);
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

AnalysisOptions
BuildAnalysisOptions(const std::vector<std::string> &enabled_categories,
                     const std::vector<std::string> &disabled_categories) {
  auto options = AnalysisOptions::AllCategories();
  if (!enabled_categories.empty()) {
    options.enabled_categories.clear();
    for (const auto &name : enabled_categories) {
      options.enabled_categories.insert(ParseCategory(name));
    }
  }
  for (const auto &name : disabled_categories) {
    options.enabled_categories.erase(ParseCategory(name));
  }
  if (options.enabled_categories.empty()) {
    throw std::invalid_argument("No rule categories left to run");
  }
  return options;
}

CompareOptions
ParseCompareArguments(const std::vector<std::string> &arguments) {
  CompareOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--before") {
      options.before = RequireValue(arguments, i, "--before");
      continue;
    }
    if (argument == "--after") {
      options.after = RequireValue(arguments, i, "--after");
      continue;
    }
    if (argument == "--rules") {
      AppendPaths(RequireValue(arguments, i, "--rules"), options.rule_files);
      continue;
    }
    if (HandleCategoryOption(arguments, i, options.enabled_categories,
                             options.disabled_categories) ||
        HandleLoggingOption(arguments, i, options.log_level)) {
      continue;
    }
    throw std::invalid_argument("Unknown compare argument: " + argument);
  }
  return options;
}

RulesOptions ParseRulesArguments(const std::vector<std::string> &arguments) {
  RulesOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--category") {
      options.category =
          CategoryName(ParseCategory(RequireValue(arguments, i, "--category")));
      continue;
    }
    if (argument == "--rules") {
      AppendPaths(RequireValue(arguments, i, "--rules"), options.rule_files);
      continue;
    }
    throw std::invalid_argument("Unknown rules argument: " + argument);
  }
  return options;
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(out);
    return kExitClean;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged.log_level), std::clog);
  const auto analysis_options = BuildAnalysisOptions(
      merged.enabled_categories, merged.disabled_categories);

  const auto registry = MakeRuleRegistry(merged.rule_files, logger);
  const auto analyzer = CodeAnalyzerBuilder(registry)
                            .WithLogger(logger)
                            .WithParallelScan(merged.parallel.value_or(false))
                            .Build();

  const auto &components = GlobalComponentRegistry();
  auto provider = components.CreateSourceProvider();
  auto reporter = components.CreateReporter(merged.reporter.value_or(""));

  std::vector<AnalysisReport> reports;
  for (const auto &unit : provider->Acquire(merged.files)) {
    reports.push_back(analyzer.Analyze(unit, analysis_options));
  }

  ReportConfig report_config;
  report_config.formats = merged.formats;
  const auto report = reporter->Render(reports, report_config);
  WriteReports(merged.output_directory.value_or("."), report, out);
  out << report.text;
  return ReportExitCode(reports, merged.fail_on.value_or(Severity::kError));
}

int RunCompare(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseCompareArguments(arguments);
  if (options.show_help) {
    PrintCompareUsage(out);
    return kExitClean;
  }
  if (!options.before || !options.after) {
    throw std::invalid_argument("compare requires --before and --after");
  }

  auto logger = MakeLogger(BuildLoggingConfig(options.log_level), std::clog);
  const auto analysis_options = BuildAnalysisOptions(
      options.enabled_categories, options.disabled_categories);
  const auto registry = MakeRuleRegistry(options.rule_files, logger);
  const auto analyzer =
      CodeAnalyzerBuilder(registry).WithLogger(logger).Build();

  const auto comparison =
      analyzer.Compare(ReadSourceFile(*options.before),
                       ReadSourceFile(*options.after), analysis_options);
  out << FormatComparison(comparison);
  const bool failed = !comparison.before.success || !comparison.after.success;
  return failed ? kExitFailure : kExitClean;
}

int RunRules(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseRulesArguments(arguments);
  if (options.show_help) {
    PrintRulesUsage(out);
    return kExitClean;
  }

  const auto registry = MakeRuleRegistry(options.rule_files);
  for (const auto &rule : registry.rules()) {
    const auto category = CategoryName(rule.category);
    if (options.category && *options.category != category) {
      continue;
    }
    out << rule.id << "\t" << category << "\t" << SeverityName(rule.severity)
        << "\t" << rule.cwe_id.value_or("-") << "\n";
  }
  return kExitClean;
}

} // namespace pyscan
