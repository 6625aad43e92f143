#include <pyscan/cli_exit_codes.h>
#include <pyscan/pyscan_cli.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace pyscan {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

template <typename Function>
std::string ErrorMessage(Function &&function) {
  try {
    function();
  } catch (const std::exception &error) {
    return error.what();
  }
  return "";
}

TEST(PyscanCliTest, ParsesAnalyzeFlags) {
  const auto options = ParseAnalyzeArguments(
      {"app.py", "--file", "lib", "--enable", "Security,code-smells",
       "--disable", "type_hint", "--format", "json,Markdown", "--fail-on",
       "warn", "--rules", "a.yaml, b.yaml", "--reporter", "text", "--out",
       "reports", "--parallel", "--debug"});

  EXPECT_THAT(options.files, ElementsAre("app.py", "lib"));
  EXPECT_THAT(options.enabled_categories, ElementsAre("security", "quality"));
  EXPECT_THAT(options.disabled_categories, ElementsAre("type_hints"));
  EXPECT_THAT(options.formats, ElementsAre("json", "markdown"));
  EXPECT_THAT(options.rule_files, ElementsAre("a.yaml", "b.yaml"));
  EXPECT_EQ(options.fail_on, Severity::kWarning);
  EXPECT_EQ(options.reporter, "text");
  EXPECT_EQ(options.output_directory, std::filesystem::path("reports"));
  EXPECT_EQ(options.parallel, true);
  EXPECT_EQ(options.log_level, LogLevel::kDebug);
  EXPECT_FALSE(options.show_help);
}

TEST(PyscanCliTest, TreatsDashAsStandardInput) {
  const auto options = ParseAnalyzeArguments({"-", "--verbose"});

  EXPECT_THAT(options.files, ElementsAre("-"));
  EXPECT_EQ(options.log_level, LogLevel::kInfo);
}

TEST(PyscanCliTest, RejectsBadAnalyzeArguments) {
  EXPECT_EQ(ErrorMessage([] { ParseAnalyzeArguments({"--bogus"}); }),
            "Unknown argument: --bogus");
  EXPECT_EQ(ErrorMessage([] { ParseAnalyzeArguments({"--format", "xml"}); }),
            "Unsupported format: xml");
  EXPECT_EQ(ErrorMessage([] { ParseAnalyzeArguments({"--enable"}); }),
            "--enable requires a value");
  EXPECT_THAT(ErrorMessage([] { ParseAnalyzeArguments({"--enable", "io"}); }),
              HasSubstr("Unknown category: io"));
  EXPECT_THAT(ErrorMessage([] { ParseAnalyzeArguments({"--fail-on", "x"}); }),
              HasSubstr("Unknown severity: x"));
}

TEST(PyscanCliTest, StopsParsingAtHelp) {
  const auto options = ParseAnalyzeArguments({"--help", "--bogus"});
  EXPECT_TRUE(options.show_help);
}

TEST(PyscanCliTest, ReadsYamlConfigWithAliases) {
  test::TemporaryProject project;
  const auto config = project.AddFile("pyscan.yaml", "files:\n"
                                                     "  - a.py\n"
                                                     "  - b.py\n"
                                                     "categories: security\n"
                                                     "format: json\n"
                                                     "fail-on: critical\n"
                                                     "parallel: yes\n"
                                                     "log_level: info\n"
                                                     "output: build/reports\n");

  const auto options = ParseConfigFile(config);

  EXPECT_THAT(options.files, ElementsAre("a.py", "b.py"));
  EXPECT_THAT(options.enabled_categories, ElementsAre("security"));
  EXPECT_THAT(options.formats, ElementsAre("json"));
  EXPECT_EQ(options.fail_on, Severity::kCritical);
  EXPECT_EQ(options.parallel, true);
  EXPECT_EQ(options.log_level, LogLevel::kInfo);
  EXPECT_EQ(options.output_directory, std::filesystem::path("build/reports"));
}

TEST(PyscanCliTest, RejectsInvalidConfigFiles) {
  test::TemporaryProject project;
  const auto unknown = project.AddFile("unknown.yml", "colour: blue\n");
  const auto wrong_type = project.AddFile("list.yml", "out: [a, b]\n");
  const auto text = project.AddFile("config.txt", "files: a.py\n");

  EXPECT_THAT(ErrorMessage([&] { ParseConfigFile(unknown); }),
              HasSubstr("Unknown config key: colour. Supported keys: files"));
  EXPECT_THAT(ErrorMessage([&] { ParseConfigFile(wrong_type); }),
              HasSubstr("Config key 'out' must be a string"));
  EXPECT_THROW(ParseConfigFile(text), std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.root() / "absent.yaml"),
               std::runtime_error);
}

TEST(PyscanCliTest, CommandLineOverridesConfigValues) {
  AnalyzeOptions config;
  config.files = {"a.py"};
  config.formats = {"json"};
  config.fail_on = Severity::kInfo;
  AnalyzeOptions cli;
  cli.files = {"b.py"};
  cli.fail_on = Severity::kCritical;

  const auto merged = MergeOptions(config, cli);

  EXPECT_THAT(merged.files, ElementsAre("b.py"));
  EXPECT_THAT(merged.formats, ElementsAre("json"));
  EXPECT_EQ(merged.fail_on, Severity::kCritical);
}

TEST(PyscanCliTest, RequiresSomeInput) {
  EXPECT_EQ(ErrorMessage([] { ResolveAnalyzeOptions(AnalyzeOptions{}); }),
            "No input given: pass --file, a path, or set 'files' in the "
            "config file");
}

TEST(PyscanCliTest, BuildsCategorySelections) {
  const auto without_security = BuildAnalysisOptions({}, {"security"});
  EXPECT_FALSE(without_security.IsEnabled(Category::kSecurity));
  EXPECT_TRUE(without_security.IsEnabled(Category::kSyntax));

  const auto only = BuildAnalysisOptions({"performance", "quality"}, {});
  EXPECT_EQ(only.enabled_categories.size(), 2u);

  EXPECT_EQ(ErrorMessage([] {
              BuildAnalysisOptions({"security"}, {"security"});
            }),
            "No rule categories left to run");
}

TEST(PyscanCliTest, AnalyzePrintsTextDiagnosticsAndFailsOnCriticalIssues) {
  test::TemporaryProject project;
  const auto file = project.AddFile("app.py", "password = \"admin123\"\n");
  std::ostringstream out;

  const auto exit_code = RunAnalyze(
      {file.string(), "--reporter", "text", "--enable", "security"}, out);

  EXPECT_EQ(exit_code, kExitIssuesFound);
  EXPECT_THAT(out.str(),
              HasSubstr(file.generic_string() +
                        ":1: critical [security.hardcoded_credentials]"));
  EXPECT_THAT(out.str(), HasSubstr("Analyzed 1 file(s): 1 issue(s)"));
}

TEST(PyscanCliTest, AnalyzeHonorsFailOnThreshold) {
  test::TemporaryProject project;
  const auto file = project.AddFile("app.py", "for i in range(len(xs)):\n"
                                              "    print(xs[i])\n");
  std::ostringstream out;

  EXPECT_EQ(RunAnalyze({file.string(), "--reporter", "text", "--enable",
                        "performance"},
                       out),
            kExitClean);
  EXPECT_EQ(RunAnalyze({file.string(), "--reporter", "text", "--enable",
                        "performance", "--fail-on", "info"},
                       out),
            kExitIssuesFound);
}

TEST(PyscanCliTest, AnalyzeWritesMarkdownAndJsonReports) {
  test::TemporaryProject project;
  project.AddFile("src/app.py", "value = eval(data)\n");
  const auto out_dir = project.root() / "reports";
  std::ostringstream out;

  RunAnalyze({(project.root() / "src").string(), "--out", out_dir.string(),
              "--format", "markdown,json"},
             out);

  EXPECT_THAT(out.str(), HasSubstr("Wrote "));
  const auto markdown = test::ReadFile(out_dir / "pyscan_report.md");
  const auto json = test::ReadFile(out_dir / "pyscan_report.json");
  EXPECT_THAT(markdown, HasSubstr("security.eval"));
  EXPECT_THAT(json, HasSubstr("\"rule_id\": \"security.eval\""));
}

TEST(PyscanCliTest, AnalyzeReportsInvalidSourcesWithExitCodeOne) {
  test::TemporaryProject project;
  const auto file = project.AddFile("empty.py", "");
  std::ostringstream out;

  EXPECT_EQ(RunAnalyze({file.string(), "--reporter", "text"}, out),
            kExitFailure);
  EXPECT_THAT(out.str(), HasSubstr("error: Analysis failed"));
}

TEST(PyscanCliTest, CompareSummarizesFixedIssues) {
  test::TemporaryProject project;
  const auto before =
      project.AddFile("before.py", "password = \"admin123\"\n");
  const auto after =
      project.AddFile("after.py", "password = os.getenv(\"PASSWORD\")\n");
  std::ostringstream out;

  const auto exit_code =
      RunCompare({"--before", before.string(), "--after", after.string(),
                  "--enable", "security"},
                 out);

  EXPECT_EQ(exit_code, kExitClean);
  EXPECT_THAT(out.str(),
              HasSubstr("Fixed 1 issues. Security improved by 25.0%"));
}

TEST(PyscanCliTest, CompareRequiresBothSides) {
  std::ostringstream out;
  EXPECT_THROW(RunCompare({"--before", "a.py"}, out), std::invalid_argument);
  EXPECT_THROW(ParseCompareArguments({"--bogus"}), std::invalid_argument);
}

TEST(PyscanCliTest, RulesListsCatalogFilteredByCategory) {
  std::ostringstream out;

  EXPECT_EQ(RunRules({"--category", "security"}, out), kExitClean);

  EXPECT_THAT(out.str(), HasSubstr("security.eval\tsecurity\tcritical\tCWE-95\n"));
  EXPECT_THAT(out.str(), Not(HasSubstr("quality.")));
}

TEST(PyscanCliTest, RulesIncludesLoadedPacks) {
  test::TemporaryProject project;
  const auto pack = project.AddFile("pack.yaml",
                                    "rules:\n"
                                    "  - id: custom.print_call\n"
                                    "    category: quality\n"
                                    "    severity: info\n"
                                    "    pattern: 'print\\('\n"
                                    "    description: print() call\n");
  std::ostringstream out;

  RunRules({"--rules", pack.string(), "--category", "quality"}, out);

  EXPECT_THAT(out.str(), HasSubstr("custom.print_call\tquality\tinfo\t-\n"));
  EXPECT_THAT(out.str(), Not(HasSubstr("security.")));
}

TEST(PyscanCliTest, HelpPrintsUsage) {
  std::ostringstream out;
  EXPECT_EQ(RunAnalyze({"--help"}, out), kExitClean);
  EXPECT_THAT(out.str(), HasSubstr("Usage: pyscan analyze"));
  EXPECT_THAT(ParseRulesArguments({"-h"}).rule_files, IsEmpty());
}

} // namespace
} // namespace pyscan
