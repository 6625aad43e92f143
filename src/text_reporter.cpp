#include <pyscan/text_reporter.h>

#include <pyscan/result_aggregator.h>
#include <pyscan/rule.h>

#include <sstream>

namespace pyscan {
namespace {

std::string FormatSignedChange(int value) {
  return (value > 0 ? "+" : "") + std::to_string(value);
}

void AppendReport(const AnalysisReport &report, std::ostringstream &output) {
  if (!report.success) {
    output << report.file_name << ": error: " << report.summary << "\n";
    return;
  }
  for (const auto &issue : report.issues) {
    output << FormatIssueLine(report.file_name, issue) << "\n";
    if (issue.suggested_fix) {
      output << "    fix: " << *issue.suggested_fix << "\n";
    }
  }
  for (const auto &fault : report.rule_faults) {
    output << report.file_name << ":" << fault.line_number
           << ": rule fault [" << fault.rule_id << "] " << fault.message
           << "\n";
  }
  output << report.file_name << ": " << report.summary
         << ". Performance score: " << report.performance_score << "/100 ["
         << OverallStatus(report) << "]\n";
}

} // namespace

std::string FormatIssueLine(const std::string &file_name, const Issue &issue) {
  std::ostringstream line;
  line << file_name << ":" << issue.line_number << ": "
       << SeverityName(issue.severity) << " [" << issue.rule_id << "] "
       << issue.description;
  if (issue.cwe_id) {
    line << " (" << *issue.cwe_id << ")";
  }
  return line.str();
}

Report TextReporter::Render(const std::vector<AnalysisReport> &reports,
                            const ReportConfig &) {
  std::ostringstream output;
  int total_issues = 0;
  int failed = 0;
  for (const auto &report : reports) {
    AppendReport(report, output);
    total_issues += report.total_issues;
    if (!report.success) {
      ++failed;
    }
  }
  output << "Analyzed " << reports.size() << " file(s): " << total_issues
         << " issue(s)";
  if (failed > 0) {
    output << ", " << failed << " failed";
  }
  output << "\n";

  Report result;
  result.text = output.str();
  return result;
}

std::string FormatComparison(const ComparisonResult &comparison) {
  std::ostringstream output;
  output << "Before: " << comparison.before.file_name << " ("
         << comparison.before.total_issues << " issues, security "
         << comparison.before.security_score << "/100, performance "
         << comparison.before.performance_score << "/100)\n";
  output << "After:  " << comparison.after.file_name << " ("
         << comparison.after.total_issues << " issues, security "
         << comparison.after.security_score << "/100, performance "
         << comparison.after.performance_score << "/100)\n";
  output << "Performance change: "
         << FormatSignedChange(comparison.performance_improvement) << "\n";
  output << "Complexity change: "
         << FormatSignedChange(comparison.complexity_change) << "\n";
  output << comparison.summary << "\n";
  return output.str();
}

} // namespace pyscan
