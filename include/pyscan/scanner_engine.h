#pragma once

#include <pyscan/logging.h>
#include <pyscan/models.h>
#include <pyscan/rule_registry.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pyscan {

struct ScanSettings {
  // One task per enabled category; results are merged in category order.
  bool parallel_categories = false;
  // Pattern rules only see this many bytes of a line.
  std::size_t max_pattern_line_length = 1024;
};

struct ScanResult {
  std::vector<Issue> issues;
  std::vector<RuleFault> faults;
};

class ScannerEngine {
public:
  ScannerEngine(const RuleRegistry &registry, std::shared_ptr<Logger> logger,
                ScanSettings settings = {});

  ScanResult Scan(const std::vector<LineContext> &lines,
                  const AnalysisOptions &options) const;
  ScanResult ScanCategory(const std::vector<LineContext> &lines,
                          Category category) const;

private:
  bool Evaluate(const Rule &rule, const LineContext &line,
                std::vector<std::string> &captures) const;

  const RuleRegistry *registry_;
  std::shared_ptr<Logger> logger_;
  ScanSettings settings_;
};

// Trimmed line shortened for display in reports.
std::string MakeCodeSnippet(const std::string &raw_text);

} // namespace pyscan
