#include <pyscan/scoring_engine.h>
#include <pyscan/structural_extractor.h>

#include <gtest/gtest.h>

namespace pyscan {
namespace {

Issue MakeIssue(Category category, Severity severity) {
  Issue issue;
  issue.category = category;
  issue.severity = severity;
  return issue;
}

std::vector<LineContext> Lines(const std::string &text) {
  return ExtractLines(SourceUnit{text, std::nullopt});
}

TEST(ScoringEngineTest, WeightsSeveritiesDescending) {
  EXPECT_EQ(SeverityWeight(Severity::kCritical), 25);
  EXPECT_EQ(SeverityWeight(Severity::kError), 15);
  EXPECT_EQ(SeverityWeight(Severity::kWarning), 5);
  EXPECT_EQ(SeverityWeight(Severity::kInfo), 1);
}

TEST(ScoringEngineTest, SubtractsPenaltiesOfTheScoredCategoryOnly) {
  const std::vector<Issue> issues = {
      MakeIssue(Category::kSecurity, Severity::kCritical),
      MakeIssue(Category::kSecurity, Severity::kWarning),
      MakeIssue(Category::kPerformance, Severity::kCritical)};

  const auto security = ScoreCategory(issues, Category::kSecurity);
  EXPECT_EQ(security.score, 70);
  EXPECT_FALSE(security.clamped);
  EXPECT_EQ(ScoreCategory(issues, Category::kPerformance).score, 75);
  EXPECT_EQ(ScoreCategory(issues, Category::kQuality).score, 100);
}

TEST(ScoringEngineTest, ClampsAtZeroAndReportsIt) {
  const std::vector<Issue> issues(5, MakeIssue(Category::kSecurity,
                                               Severity::kCritical));
  const auto exact = ScoreCategory(
      std::vector<Issue>(issues.begin(), issues.begin() + 4),
      Category::kSecurity);
  EXPECT_EQ(exact.score, 0);
  EXPECT_FALSE(exact.clamped);

  const auto clamped = ScoreCategory(issues, Category::kSecurity);
  EXPECT_EQ(clamped.score, 0);
  EXPECT_TRUE(clamped.clamped);
}

TEST(ScoringEngineTest, ScoreNeverIncreasesWhenIssuesAreAdded) {
  std::vector<Issue> issues;
  int previous = ScoreCategory(issues, Category::kPerformance).score;
  for (int i = 0; i < 40; ++i) {
    issues.push_back(MakeIssue(Category::kPerformance,
                               static_cast<Severity>(i % 4)));
    const auto score = ScoreCategory(issues, Category::kPerformance).score;
    EXPECT_LE(score, previous);
    EXPECT_GE(score, 0);
    previous = score;
  }
}

TEST(ScoringEngineTest, CountsDecisionPointsForCyclomaticComplexity) {
  const auto lines = Lines("def f(a, b):\n"
                           "    if a and b:\n"
                           "        return 1\n"
                           "    elif a or b:\n"
                           "        return 2\n"
                           "    for x in a:\n"
                           "        pass\n"
                           "    while b:\n"
                           "        break\n"
                           "    try:\n"
                           "        pass\n"
                           "    except ValueError:\n"
                           "        pass\n"
                           "    else:\n"
                           "        pass\n");

  // 1 + if + elif + for + while + except + and + or.
  EXPECT_EQ(CyclomaticComplexity(lines), 8);
}

TEST(ScoringEngineTest, StraightLineCodeHasComplexityOne) {
  const auto metrics = ComputeComplexityMetrics(Lines("x = 1\ny = x\n"));
  EXPECT_EQ(metrics.cyclomatic_complexity, 1);
  EXPECT_GT(metrics.maintainability_index, 0.0);
  EXPECT_LE(metrics.maintainability_index, 100.0);
}

TEST(ScoringEngineTest, MaintainabilityDropsAsCodeGrows) {
  const auto small = ComputeComplexityMetrics(Lines("x = 1\n"));
  std::string large_text;
  for (int i = 0; i < 200; ++i) {
    large_text += "if value_" + std::to_string(i) + " and flag or other:\n" +
                  "    total_" + std::to_string(i) + " = compute(" +
                  std::to_string(i) + ")\n";
  }
  const auto large = ComputeComplexityMetrics(Lines(large_text));

  EXPECT_LT(large.maintainability_index, small.maintainability_index);
  EXPECT_GE(large.maintainability_index, 0.0);
}

TEST(ScoringEngineTest, MaintainabilityDropsWithDecisionPoints) {
  // Both texts have 20 code lines of 80 tokens drawn from 8 distinct ones.
  std::string branching;
  std::string straight;
  for (int i = 0; i < 10; ++i) {
    branching += "if p and q:\n    r = 1\n";
    straight += "r = p\nq + s - 1\n";
  }
  const auto branching_lines = Lines(branching);
  const auto straight_lines = Lines(straight);
  ASSERT_EQ(ComputeCodeMetrics(branching_lines).code_lines,
            ComputeCodeMetrics(straight_lines).code_lines);

  const auto complex = ComputeComplexityMetrics(branching_lines);
  const auto simple = ComputeComplexityMetrics(straight_lines);

  EXPECT_EQ(complex.cyclomatic_complexity, 21);
  EXPECT_EQ(simple.cyclomatic_complexity, 1);
  EXPECT_LT(complex.maintainability_index, simple.maintainability_index);
}

TEST(ScoringEngineTest, MaintainabilityRisesWithComments) {
  std::string bare;
  std::string commented;
  for (int i = 0; i < 10; ++i) {
    bare += "r = p\nq + s - 1\n";
    commented += "# keep r in sync with p\nr = p\nq + s - 1\n";
  }

  const auto without_comments = ComputeComplexityMetrics(Lines(bare));
  const auto with_comments = ComputeComplexityMetrics(Lines(commented));

  EXPECT_EQ(with_comments.cyclomatic_complexity,
            without_comments.cyclomatic_complexity);
  EXPECT_GT(with_comments.maintainability_index,
            without_comments.maintainability_index);
  EXPECT_LT(with_comments.maintainability_index, 100.0);
}

TEST(ScoringEngineTest, CountsCodeCommentAndBlankLines) {
  const auto metrics = ComputeCodeMetrics(Lines("\"\"\"Module docs.\"\"\"\n"
                                                "# comment\n"
                                                "\n"
                                                "x = 1  # inline\n"
                                                "y = 2\n"));

  EXPECT_EQ(metrics.total_lines, 5);
  EXPECT_EQ(metrics.code_lines, 2);
  EXPECT_EQ(metrics.comment_lines, 2);
  EXPECT_EQ(metrics.blank_lines, 1);
  EXPECT_DOUBLE_EQ(metrics.code_to_comment_ratio, 2.0 / 3.0);
}

TEST(ScoringEngineTest, LabelsScoreBands) {
  EXPECT_EQ(ScoreLabel(100), "Excellent");
  EXPECT_EQ(ScoreLabel(80), "Excellent");
  EXPECT_EQ(ScoreLabel(79), "Good");
  EXPECT_EQ(ScoreLabel(40), "Needs Improvement");
  EXPECT_EQ(ScoreLabel(0), "Critical");
}

} // namespace
} // namespace pyscan
