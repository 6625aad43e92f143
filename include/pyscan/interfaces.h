#pragma once

#include <pyscan/models.h>

#include <optional>
#include <string>
#include <vector>

namespace pyscan {

class SourceProvider {
public:
  virtual ~SourceProvider() = default;
  virtual std::vector<SourceUnit>
  Acquire(const std::vector<std::string> &locations) = 0;
};

// Proposes a fix for an issue that has no deterministic suggestion. Invoked
// by callers after analysis, never from inside a scan.
class FixModel {
public:
  virtual ~FixModel() = default;
  virtual std::optional<std::string> Propose(const Issue &issue) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const std::vector<AnalysisReport> &reports,
                        const ReportConfig &config) = 0;
};

} // namespace pyscan
