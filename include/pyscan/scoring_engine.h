#pragma once

#include <pyscan/models.h>

#include <string>
#include <vector>

namespace pyscan {

struct CategoryScore {
  int score = 100;
  // Set when the penalty exceeded 100 and the score was clamped to 0.
  bool clamped = false;
};

int SeverityWeight(Severity severity);

CategoryScore ScoreCategory(const std::vector<Issue> &issues,
                            Category category);

// 1 + if/elif headers + loop headers + except clauses + and/or operators.
int CyclomaticComplexity(const std::vector<LineContext> &lines);
ComplexityMetrics ComputeComplexityMetrics(const std::vector<LineContext> &lines);
CodeMetrics ComputeCodeMetrics(const std::vector<LineContext> &lines);

// Excellent, Good, Needs Improvement or Critical.
std::string ScoreLabel(int score);

} // namespace pyscan
