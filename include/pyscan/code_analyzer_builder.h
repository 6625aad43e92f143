#pragma once

#include <pyscan/code_analyzer.h>
#include <pyscan/logging.h>
#include <pyscan/rule_registry.h>
#include <pyscan/scanner_engine.h>

#include <memory>

namespace pyscan {

class CodeAnalyzerBuilder {
public:
  explicit CodeAnalyzerBuilder(
      const RuleRegistry &registry = GlobalRuleRegistry());

  CodeAnalyzerBuilder &WithRuleRegistry(const RuleRegistry &registry);
  CodeAnalyzerBuilder &WithLogger(std::shared_ptr<Logger> logger);
  CodeAnalyzerBuilder &WithScanSettings(ScanSettings settings);
  CodeAnalyzerBuilder &WithParallelScan(bool enabled);
  CodeAnalyzerBuilder &WithMaxPatternLineLength(std::size_t length);

  CodeAnalyzer Build() const;

private:
  AnalyzerComponents components_;
};

} // namespace pyscan
