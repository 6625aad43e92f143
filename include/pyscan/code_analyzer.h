#pragma once

#include <pyscan/logging.h>
#include <pyscan/models.h>
#include <pyscan/rule_registry.h>
#include <pyscan/scanner_engine.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyscan {

constexpr std::size_t kMaxBatchSize = 20;

// Source text that cannot be analyzed: empty, whitespace only, containing
// NUL bytes or not valid UTF-8.
class InvalidInputError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

bool IsValidUtf8(const std::string &text);
void ValidateSourceUnit(const SourceUnit &unit);

struct AnalyzerComponents {
  const RuleRegistry *registry = nullptr;
  std::shared_ptr<Logger> logger;
  ScanSettings scan_settings;
};

// The registry must outlive the analyzer.
class CodeAnalyzer {
public:
  explicit CodeAnalyzer(AnalyzerComponents components);

  // Never throws for bad input; such units yield success == false.
  AnalysisReport Analyze(const SourceUnit &unit,
                         const AnalysisOptions &options) const;
  // Throws std::invalid_argument for more than kMaxBatchSize units.
  BatchResult AnalyzeBatch(const std::vector<SourceUnit> &units,
                           const AnalysisOptions &options) const;
  ComparisonResult Compare(const SourceUnit &before, const SourceUnit &after,
                           const AnalysisOptions &options) const;

  const RuleRegistry &registry() const { return *registry_; }

private:
  const RuleRegistry *registry_;
  std::shared_ptr<Logger> logger_;
  ScannerEngine scanner_;
};

std::string DisplayName(const SourceUnit &unit);

} // namespace pyscan
