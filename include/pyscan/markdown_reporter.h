#pragma once

#include <pyscan/interfaces.h>

namespace pyscan {

// Renders "markdown" and/or "json" depending on config.formats; markdown
// when no format is requested.
class MarkdownReporter : public Reporter {
public:
  Report Render(const std::vector<AnalysisReport> &reports,
                const ReportConfig &config) override;
};

} // namespace pyscan
