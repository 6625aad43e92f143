#include <cstdlib>
#include <filesystem>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace pyscan {
namespace {

using ::testing::HasSubstr;

std::filesystem::path ExecutableUnderTest() {
#ifdef PYSCAN_CLI_PATH
  return std::filesystem::path(PYSCAN_CLI_PATH);
#else
  return std::filesystem::current_path() / "pyscan";
#endif
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

std::string Quoted(const std::filesystem::path &path) {
  return "\"" + path.string() + "\"";
}

TEST(CliIntegrationTest, GeneratesReportsForSampleProject) {
  test::TemporaryProject project;
  project.AddFile("app/__init__.py", "");
  project.AddFile("app/handlers.py",
                  "import hashlib\n"
                  "API_KEY = \"sk_live_abc\"\n"
                  "def handle(request):\n"
                  "    return eval(request.body)\n");
  project.AddFile("app/util.py", "def add(a: int, b: int) -> int:\n"
                                 "    return a + b\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const auto output_directory = project.root() / "artifacts";
  const auto log_path = project.root() / "stdout.txt";
  const std::string command =
      Quoted(cli) + " analyze " + Quoted(project.root() / "app") +
      " --format markdown,json --out " + Quoted(output_directory) + " > " +
      Quoted(log_path) + " 2>&1";

  // __init__.py is empty, so one report fails.
  ASSERT_EQ(ExitCode(command), 1);

  const auto markdown = test::ReadFile(output_directory / "pyscan_report.md");
  const auto json = test::ReadFile(output_directory / "pyscan_report.json");
  EXPECT_THAT(markdown, HasSubstr("# pyscan Analysis Report"));
  EXPECT_THAT(markdown, HasSubstr("| Files Analyzed | 3 |"));
  EXPECT_THAT(markdown, HasSubstr("security.hardcoded_credentials"));
  EXPECT_THAT(json, HasSubstr("\"rule_id\": \"security.eval\""));
  EXPECT_THAT(json, HasSubstr("\"success\": false"));
  EXPECT_THAT(test::ReadFile(log_path), HasSubstr("Wrote "));
}

TEST(CliIntegrationTest, ExitsWithTwoWhenIssuesReachTheThreshold) {
  test::TemporaryProject project;
  const auto source = project.AddFile("app.py", "value = eval(data)\n");
  const auto clean = project.AddFile("clean.py", "print('ok')\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli));
  const std::string text_options =
      " --reporter text --enable security > /dev/null 2>&1";

  EXPECT_EQ(ExitCode(Quoted(cli) + " " + Quoted(source) + text_options), 2);
  EXPECT_EQ(ExitCode(Quoted(cli) + " " + Quoted(clean) + text_options), 0);
}

TEST(CliIntegrationTest, ReadsStandardInput) {
  test::TemporaryProject project;
  const auto input = project.AddFile("input.txt", "password = \"hunter22\"\n");
  const auto log_path = project.root() / "stdout.txt";

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli));
  const std::string command = Quoted(cli) +
                              " analyze - --reporter text --enable security "
                              "--fail-on critical < " +
                              Quoted(input) + " > " + Quoted(log_path);

  EXPECT_EQ(ExitCode(command), 2);
  EXPECT_THAT(test::ReadFile(log_path),
              HasSubstr("<stdin>:1: critical [security.hardcoded_credentials]"));
}

TEST(CliIntegrationTest, RejectsUnknownArguments) {
  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli));

  EXPECT_EQ(ExitCode(Quoted(cli) + " analyze --bogus > /dev/null 2>&1"), 1);
}

TEST(CliIntegrationTest, ListsRules) {
  test::TemporaryProject project;
  const auto log_path = project.root() / "rules.txt";
  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli));

  ASSERT_EQ(ExitCode(Quoted(cli) + " rules --category syntax > " +
                     Quoted(log_path)),
            0);
  EXPECT_THAT(test::ReadFile(log_path), HasSubstr("syntax.missing_colon"));
}

} // namespace
} // namespace pyscan
