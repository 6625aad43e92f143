#pragma once

#include <pyscan/interfaces.h>

#include <string>

namespace pyscan {

// Console rendering: one "file:line: severity [rule] description" line per
// issue followed by a per-file summary. Fills Report::text only.
class TextReporter : public Reporter {
public:
  Report Render(const std::vector<AnalysisReport> &reports,
                const ReportConfig &config) override;
};

std::string FormatIssueLine(const std::string &file_name, const Issue &issue);
std::string FormatComparison(const ComparisonResult &comparison);

} // namespace pyscan
