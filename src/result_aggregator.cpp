#include <pyscan/result_aggregator.h>

#include <algorithm>
#include <utility>

namespace pyscan {

void SortIssues(std::vector<Issue> &issues) {
  std::stable_sort(issues.begin(), issues.end(),
                   [](const Issue &left, const Issue &right) {
                     if (left.line_number != right.line_number) {
                       return left.line_number < right.line_number;
                     }
                     if (left.severity != right.severity) {
                       return left.severity > right.severity;
                     }
                     return left.rule_order < right.rule_order;
                   });
}

std::string FormatSummary(int total_issues, int security_score) {
  return "Found " + std::to_string(total_issues) +
         " issues. Security score: " + std::to_string(security_score) + "/100";
}

std::vector<std::string> BuildRecommendations(const std::vector<Issue> &issues) {
  const auto has_category = [&](Category category) {
    return std::any_of(issues.begin(), issues.end(), [&](const Issue &issue) {
      return issue.category == category;
    });
  };
  std::vector<std::string> recommendations;
  if (has_category(Category::kSecurity)) {
    recommendations.emplace_back("Fix security vulnerabilities immediately");
  }
  if (has_category(Category::kPerformance)) {
    recommendations.emplace_back("Optimize performance bottlenecks");
  }
  if (recommendations.empty()) {
    recommendations.emplace_back("Code quality is good! Keep it up!");
  }
  return recommendations;
}

std::string OverallStatus(const AnalysisReport &report) {
  if (report.critical > 0) {
    return "CRITICAL";
  }
  if (report.errors > 0) {
    return "NEEDS ATTENTION";
  }
  return "GOOD";
}

AnalysisReport Aggregate(AggregationInput input) {
  AnalysisReport report;
  report.success = true;
  report.file_name = std::move(input.file_name);
  report.issues = std::move(input.issues);
  report.rule_faults = std::move(input.faults);
  SortIssues(report.issues);

  report.total_issues = static_cast<int>(report.issues.size());
  for (const auto &issue : report.issues) {
    switch (issue.severity) {
    case Severity::kCritical:
      ++report.critical;
      break;
    case Severity::kError:
      ++report.errors;
      break;
    case Severity::kWarning:
      ++report.warnings;
      break;
    case Severity::kInfo:
      ++report.info;
      break;
    }
  }

  report.security_score = input.security_score;
  report.performance_score = input.performance_score;
  report.complexity_metrics = input.complexity_metrics;
  report.code_metrics = input.code_metrics;
  report.recommendations = BuildRecommendations(report.issues);
  report.summary = FormatSummary(report.total_issues, report.security_score);
  return report;
}

} // namespace pyscan
