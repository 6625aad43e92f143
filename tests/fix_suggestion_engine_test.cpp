#include <pyscan/fix_suggestion_engine.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace pyscan {
namespace {

using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class MockFixModel : public FixModel {
public:
  MOCK_METHOD(std::optional<std::string>, Propose, (const Issue &issue),
              (override));
};

Issue IssueFor(const std::string &rule_id,
               std::vector<std::string> captures = {}) {
  Issue issue;
  issue.rule_id = rule_id;
  issue.line_number = 3;
  issue.captures = std::move(captures);
  return issue;
}

TEST(FixSuggestionEngineTest, ExpandsFixTemplatesWithCaptures) {
  std::vector<Issue> issues = {
      IssueFor("security.hardcoded_credentials",
               {"api_key = \"abc\"", "api_key", "abc"})};

  ApplyDeterministicFixes(GlobalRuleRegistry(), issues);

  EXPECT_EQ(issues[0].suggested_fix, "api_key = os.getenv(\"API_KEY\")");
  EXPECT_FALSE(issues[0].delegable);
}

TEST(FixSuggestionEngineTest, MarksIssuesWithoutTemplateAsDelegable) {
  std::vector<Issue> issues = {IssueFor("complexity.deep_nesting"),
                               IssueFor("unknown.rule")};

  ApplyDeterministicFixes(GlobalRuleRegistry(), issues);

  for (const auto &issue : issues) {
    EXPECT_FALSE(issue.suggested_fix.has_value());
    EXPECT_TRUE(issue.delegable);
  }
}

TEST(FixSuggestionEngineTest, MergesModelProposalsOnlyForDelegableIssues) {
  AnalysisReport report;
  report.issues = {IssueFor("security.eval"),
                   IssueFor("complexity.deep_nesting")};
  report.issues[0].suggested_fix = "Use ast.literal_eval()";
  report.issues[1].delegable = true;

  MockFixModel model;
  EXPECT_CALL(model, Propose(Field(&Issue::rule_id, "complexity.deep_nesting")))
      .WillOnce(Return(std::optional<std::string>("Extract the inner loop")));

  const auto merged = MergeDelegatedFixes(report, model);

  EXPECT_EQ(merged.issues[0].suggested_fix, "Use ast.literal_eval()");
  EXPECT_EQ(merged.issues[1].suggested_fix, "Extract the inner loop");
  EXPECT_FALSE(report.issues[1].suggested_fix.has_value());
}

TEST(FixSuggestionEngineTest, KeepsIssueUnchangedWhenTheModelFails) {
  AnalysisReport report;
  report.issues = {IssueFor("syntax.unclosed_bracket"),
                   IssueFor("complexity.complex_condition")};
  report.issues[0].delegable = true;
  report.issues[1].delegable = true;

  MockFixModel model;
  EXPECT_CALL(model, Propose(_))
      .WillOnce(Throw(std::runtime_error("model offline")))
      .WillOnce(Return(std::nullopt));
  std::stringstream log;

  const auto merged =
      MergeDelegatedFixes(report, model, MakeLogger({LogLevel::kWarn}, log));

  EXPECT_FALSE(merged.issues[0].suggested_fix.has_value());
  EXPECT_FALSE(merged.issues[1].suggested_fix.has_value());
  EXPECT_THAT(log.str(), HasSubstr("fix.model_failed"));
  EXPECT_THAT(log.str(), HasSubstr("model offline"));
}

} // namespace
} // namespace pyscan
