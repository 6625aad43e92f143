#include <pyscan/markdown_reporter.h>

#include <pyscan/escaping.h>
#include <pyscan/result_aggregator.h>
#include <pyscan/rule.h>
#include <pyscan/scoring_engine.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

namespace pyscan {
namespace {

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string JsonString(const std::string &value) {
  return "\"" + EscapeJson(value) + "\"";
}

std::string JsonOptional(const std::optional<std::string> &value) {
  return value ? JsonString(*value) : "null";
}

std::string JsonArray(const std::vector<std::string> &values) {
  return "[" + Join(values, ",", JsonString) + "]";
}

std::string FormatDecimal(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string CurrentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm utc;
  gmtime_r(&now_time, &utc);
  std::ostringstream stream;
  stream << std::put_time(&utc, "%FT%TZ");
  return stream.str();
}

int TotalIssues(const std::vector<AnalysisReport> &reports) {
  int total = 0;
  for (const auto &report : reports) {
    total += report.total_issues;
  }
  return total;
}

std::string BuildHeaderMarkdown(const std::vector<AnalysisReport> &reports,
                                const std::string &timestamp) {
  std::ostringstream section;
  section << "## Analysis Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Files Analyzed | " << reports.size() << " |\n";
  section << "| Total Issues | " << TotalIssues(reports) << " |\n\n";
  return section.str();
}

std::string BuildMetricsMarkdown(const AnalysisReport &report) {
  std::ostringstream section;
  section << "| Metric | Value |\n";
  section << "| --- | --- |\n";
  section << "| Status | " << OverallStatus(report) << " |\n";
  section << "| Total Issues | " << report.total_issues << " |\n";
  section << "| Critical | " << report.critical << " |\n";
  section << "| Errors | " << report.errors << " |\n";
  section << "| Warnings | " << report.warnings << " |\n";
  section << "| Info | " << report.info << " |\n";
  section << "| Security Score | " << report.security_score << "/100 ("
          << ScoreLabel(report.security_score) << ") |\n";
  section << "| Performance Score | " << report.performance_score << "/100 ("
          << ScoreLabel(report.performance_score) << ") |\n";
  section << "| Cyclomatic Complexity | "
          << report.complexity_metrics.cyclomatic_complexity << " |\n";
  section << "| Maintainability Index | "
          << FormatDecimal(report.complexity_metrics.maintainability_index)
          << " |\n";
  section << "| Lines (code/comment/blank) | "
          << report.code_metrics.code_lines << "/"
          << report.code_metrics.comment_lines << "/"
          << report.code_metrics.blank_lines << " |\n\n";
  return section.str();
}

std::string BuildIssuesMarkdown(const AnalysisReport &report) {
  std::ostringstream section;
  section << "### Issues\n\n";
  section << "| Line | Severity | Category | Rule | Description | Code | "
             "Suggested Fix | CWE |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  if (report.issues.empty()) {
    section << "| None | - | - | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &issue : report.issues) {
    section << "| " << issue.line_number << " | "
            << SeverityName(issue.severity) << " | "
            << CategoryName(issue.category) << " | " << issue.rule_id << " | "
            << EscapeMarkdownCell(issue.description) << " | `"
            << EscapeMarkdownCell(issue.code_snippet) << "` | "
            << EscapeMarkdownCell(issue.suggested_fix.value_or("-")) << " | "
            << issue.cwe_id.value_or("-") << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildReportMarkdown(const AnalysisReport &report) {
  std::ostringstream section;
  section << "## " << report.file_name << "\n\n";
  if (!report.success) {
    section << "Analysis failed: " << report.error << "\n\n";
    return section.str();
  }
  section << report.summary << "\n\n";
  section << BuildMetricsMarkdown(report);
  section << BuildIssuesMarkdown(report);

  section << "### Recommendations\n\n";
  for (const auto &recommendation : report.recommendations) {
    section << "- " << recommendation << "\n";
  }
  section << "\n";

  if (!report.rule_faults.empty()) {
    section << "### Rule Faults\n\n";
    for (const auto &fault : report.rule_faults) {
      section << "- " << fault.rule_id << " at line " << fault.line_number
              << ": " << fault.message << "\n";
    }
    section << "\n";
  }
  return section.str();
}

std::string BuildIssueJson(const Issue &issue) {
  std::ostringstream json;
  json << "{\"line_number\": " << issue.line_number << ",";
  json << "\"severity\": " << JsonString(SeverityName(issue.severity)) << ",";
  json << "\"issue_type\": " << JsonString(CategoryName(issue.category))
       << ",";
  json << "\"description\": " << JsonString(issue.description) << ",";
  json << "\"code_snippet\": " << JsonString(issue.code_snippet) << ",";
  json << "\"suggested_fix\": " << JsonOptional(issue.suggested_fix) << ",";
  json << "\"cwe_id\": " << JsonOptional(issue.cwe_id) << ",";
  json << "\"rule_id\": " << JsonString(issue.rule_id) << "}";
  return json.str();
}

std::string BuildFaultJson(const RuleFault &fault) {
  std::ostringstream json;
  json << "{\"rule_id\": " << JsonString(fault.rule_id) << ",";
  json << "\"line_number\": " << fault.line_number << ",";
  json << "\"message\": " << JsonString(fault.message) << "}";
  return json.str();
}

std::string BuildReportJson(const AnalysisReport &report) {
  std::ostringstream json;
  json << "{\"file_name\": " << JsonString(report.file_name) << ",";
  json << "\"success\": " << (report.success ? "true" : "false") << ",";
  json << "\"error\": "
       << (report.error.empty() ? std::string("null")
                                : JsonString(report.error))
       << ",";
  json << "\"total_issues\": " << report.total_issues << ",";
  json << "\"critical\": " << report.critical << ",";
  json << "\"errors\": " << report.errors << ",";
  json << "\"warnings\": " << report.warnings << ",";
  json << "\"info\": " << report.info << ",";
  json << "\"security_score\": " << report.security_score << ",";
  json << "\"performance_score\": " << report.performance_score << ",";
  json << "\"complexity_metrics\": {\"cyclomatic_complexity\": "
       << report.complexity_metrics.cyclomatic_complexity
       << ", \"maintainability_index\": "
       << FormatDecimal(report.complexity_metrics.maintainability_index)
       << "},";
  json << "\"code_metrics\": {\"total_lines\": "
       << report.code_metrics.total_lines
       << ", \"code_lines\": " << report.code_metrics.code_lines
       << ", \"comment_lines\": " << report.code_metrics.comment_lines
       << ", \"blank_lines\": " << report.code_metrics.blank_lines
       << ", \"code_to_comment_ratio\": "
       << FormatDecimal(report.code_metrics.code_to_comment_ratio) << "},";
  json << "\"issues\": [" << Join(report.issues, ",", BuildIssueJson) << "],";
  json << "\"rule_faults\": [" << Join(report.rule_faults, ",", BuildFaultJson)
       << "],";
  json << "\"recommendations\": " << JsonArray(report.recommendations) << ",";
  json << "\"status\": "
       << (report.success ? JsonString(OverallStatus(report))
                          : std::string("null"))
       << ",";
  json << "\"summary\": " << JsonString(report.summary) << "}";
  return json.str();
}

} // namespace

Report MarkdownReporter::Render(const std::vector<AnalysisReport> &reports,
                                const ReportConfig &config) {
  const auto timestamp = CurrentTimestamp();

  Report report;
  if (ShouldRenderFormat(config.formats, "markdown")) {
    std::ostringstream output;
    output << "# " << config.title << "\n\n";
    output << BuildHeaderMarkdown(reports, timestamp);
    for (const auto &entry : reports) {
      output << BuildReportMarkdown(entry);
    }
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(config.formats, "json")) {
    std::ostringstream output;
    output << "{\"analysis_header\": {";
    output << "\"title\": " << JsonString(config.title) << ",";
    output << "\"generated_on\": " << JsonString(timestamp) << ",";
    output << "\"files_analyzed\": " << reports.size() << ",";
    output << "\"total_issues\": " << TotalIssues(reports) << "},";
    output << "\"reports\": [" << Join(reports, ",", BuildReportJson) << "]}";
    report.json = output.str();
  }

  return report;
}

} // namespace pyscan
