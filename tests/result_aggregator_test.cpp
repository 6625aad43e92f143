#include <pyscan/result_aggregator.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pyscan {
namespace {

using ::testing::ElementsAre;

Issue MakeIssue(int line, Severity severity, Category category,
                std::size_t rule_order, const std::string &rule_id) {
  Issue issue;
  issue.line_number = line;
  issue.severity = severity;
  issue.category = category;
  issue.rule_order = rule_order;
  issue.rule_id = rule_id;
  return issue;
}

std::vector<std::string> RuleIds(const std::vector<Issue> &issues) {
  std::vector<std::string> ids;
  for (const auto &issue : issues) {
    ids.push_back(issue.rule_id);
  }
  return ids;
}

TEST(ResultAggregatorTest, SortsByLineThenSeverityThenRuleOrder) {
  std::vector<Issue> issues = {
      MakeIssue(5, Severity::kInfo, Category::kQuality, 1, "late"),
      MakeIssue(2, Severity::kWarning, Category::kQuality, 9, "warning_b"),
      MakeIssue(2, Severity::kCritical, Category::kSecurity, 20, "critical"),
      MakeIssue(2, Severity::kWarning, Category::kQuality, 3, "warning_a")};

  SortIssues(issues);

  EXPECT_THAT(RuleIds(issues),
              ElementsAre("critical", "warning_a", "warning_b", "late"));
}

TEST(ResultAggregatorTest, CountsSeveritiesAndBuildsSummary) {
  AggregationInput input;
  input.file_name = "app.py";
  input.issues = {
      MakeIssue(1, Severity::kCritical, Category::kSecurity, 0, "a"),
      MakeIssue(2, Severity::kError, Category::kSyntax, 1, "b"),
      MakeIssue(3, Severity::kWarning, Category::kPerformance, 2, "c"),
      MakeIssue(4, Severity::kInfo, Category::kQuality, 3, "d"),
      MakeIssue(5, Severity::kInfo, Category::kQuality, 4, "e")};
  input.security_score = 75;
  input.performance_score = 95;

  const auto report = Aggregate(input);

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.file_name, "app.py");
  EXPECT_EQ(report.total_issues, 5);
  EXPECT_EQ(report.critical, 1);
  EXPECT_EQ(report.errors, 1);
  EXPECT_EQ(report.warnings, 1);
  EXPECT_EQ(report.info, 2);
  EXPECT_EQ(report.summary, "Found 5 issues. Security score: 75/100");
  EXPECT_THAT(report.recommendations,
              ElementsAre("Fix security vulnerabilities immediately",
                          "Optimize performance bottlenecks"));
  EXPECT_EQ(OverallStatus(report), "CRITICAL");
}

TEST(ResultAggregatorTest, CleanInputProducesPerfectReport) {
  AggregationInput input;
  input.file_name = "clean.py";

  const auto report = Aggregate(input);

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.total_issues, 0);
  EXPECT_EQ(report.security_score, 100);
  EXPECT_EQ(report.performance_score, 100);
  EXPECT_THAT(report.recommendations,
              ElementsAre("Code quality is good! Keep it up!"));
  EXPECT_EQ(report.summary, "Found 0 issues. Security score: 100/100");
  EXPECT_EQ(OverallStatus(report), "GOOD");
}

TEST(ResultAggregatorTest, ErrorsWithoutCriticalsNeedAttention) {
  AnalysisReport report;
  report.errors = 2;
  EXPECT_EQ(OverallStatus(report), "NEEDS ATTENTION");
}

} // namespace
} // namespace pyscan
