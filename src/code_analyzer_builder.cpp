#include <pyscan/code_analyzer_builder.h>

#include <stdexcept>
#include <utility>

namespace pyscan {

CodeAnalyzerBuilder::CodeAnalyzerBuilder(const RuleRegistry &registry) {
  components_.registry = &registry;
}

CodeAnalyzerBuilder &
CodeAnalyzerBuilder::WithRuleRegistry(const RuleRegistry &registry) {
  components_.registry = &registry;
  return *this;
}

CodeAnalyzerBuilder &
CodeAnalyzerBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

CodeAnalyzerBuilder &CodeAnalyzerBuilder::WithScanSettings(ScanSettings settings) {
  components_.scan_settings = settings;
  return *this;
}

CodeAnalyzerBuilder &CodeAnalyzerBuilder::WithParallelScan(bool enabled) {
  components_.scan_settings.parallel_categories = enabled;
  return *this;
}

CodeAnalyzerBuilder &
CodeAnalyzerBuilder::WithMaxPatternLineLength(std::size_t length) {
  if (length == 0) {
    throw std::invalid_argument("Pattern line length must be positive");
  }
  components_.scan_settings.max_pattern_line_length = length;
  return *this;
}

CodeAnalyzer CodeAnalyzerBuilder::Build() const {
  auto components = components_;
  components.logger = EnsureLogger(std::move(components.logger));
  return CodeAnalyzer(std::move(components));
}

} // namespace pyscan
