#pragma once

#include <pyscan/models.h>

#include <string>
#include <vector>

namespace pyscan {

struct AggregationInput {
  std::string file_name;
  std::vector<Issue> issues;
  std::vector<RuleFault> faults;
  int security_score = 100;
  int performance_score = 100;
  ComplexityMetrics complexity_metrics;
  CodeMetrics code_metrics;
};

// Stable sort by line ascending, severity descending, then rule order.
void SortIssues(std::vector<Issue> &issues);

AnalysisReport Aggregate(AggregationInput input);

std::string FormatSummary(int total_issues, int security_score);
std::vector<std::string> BuildRecommendations(const std::vector<Issue> &issues);
// CRITICAL, NEEDS ATTENTION or GOOD.
std::string OverallStatus(const AnalysisReport &report);

} // namespace pyscan
