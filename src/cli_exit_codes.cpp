#include <pyscan/cli_exit_codes.h>

#include <algorithm>

namespace pyscan {

int ReportExitCode(const std::vector<AnalysisReport> &reports,
                   Severity fail_on) {
  const auto failed = std::any_of(
      reports.begin(), reports.end(),
      [](const AnalysisReport &report) { return !report.success; });
  if (failed) {
    return kExitFailure;
  }
  for (const auto &report : reports) {
    for (const auto &issue : report.issues) {
      if (static_cast<int>(issue.severity) >= static_cast<int>(fail_on)) {
        return kExitIssuesFound;
      }
    }
  }
  return kExitClean;
}

} // namespace pyscan
