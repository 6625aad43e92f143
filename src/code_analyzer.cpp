#include <pyscan/code_analyzer.h>

#include <pyscan/fix_suggestion_engine.h>
#include <pyscan/result_aggregator.h>
#include <pyscan/scoring_engine.h>
#include <pyscan/structural_extractor.h>

#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

constexpr const char kDefaultFileName[] = "input.py";

pyscan::AnalysisReport InvalidReport(const std::string &file_name,
                                     const std::string &reason) {
  pyscan::AnalysisReport report;
  report.success = false;
  report.file_name = file_name;
  report.error = reason;
  report.summary = "Analysis failed: " + reason;
  report.recommendations.emplace_back("Provide non-empty UTF-8 source text");
  return report;
}

std::string FormatComparisonSummary(int issues_fixed,
                                    int security_improvement) {
  std::ostringstream stream;
  stream << "Fixed " << issues_fixed << " issues. Security improved by "
         << std::fixed << std::setprecision(1)
         << static_cast<double>(security_improvement) << "%";
  return stream.str();
}

} // namespace

namespace pyscan {

bool IsValidUtf8(const std::string &text) {
  std::size_t index = 0;
  while (index < text.size()) {
    const auto lead = static_cast<unsigned char>(text[index]);
    std::size_t length = 0;
    unsigned int code_point = 0;
    if (lead < 0x80) {
      ++index;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (index + length > text.size()) {
      return false;
    }
    for (std::size_t offset = 1; offset < length; ++offset) {
      const auto continuation = static_cast<unsigned char>(text[index + offset]);
      if ((continuation & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (continuation & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    index += length;
  }
  return true;
}

void ValidateSourceUnit(const SourceUnit &unit) {
  if (unit.text.empty()) {
    throw InvalidInputError("Source text is empty");
  }
  if (unit.text.find('\0') != std::string::npos) {
    throw InvalidInputError("Source text contains NUL bytes");
  }
  if (unit.text.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    throw InvalidInputError("Source text contains only whitespace");
  }
  if (!IsValidUtf8(unit.text)) {
    throw InvalidInputError("Source text is not valid UTF-8");
  }
}

std::string DisplayName(const SourceUnit &unit) {
  return unit.filename && !unit.filename->empty() ? *unit.filename
                                                  : kDefaultFileName;
}

CodeAnalyzer::CodeAnalyzer(AnalyzerComponents components)
    : registry_(components.registry != nullptr ? components.registry
                                                : &GlobalRuleRegistry()),
      logger_(EnsureLogger(std::move(components.logger))),
      scanner_(*registry_, logger_, components.scan_settings) {}

AnalysisReport CodeAnalyzer::Analyze(const SourceUnit &unit,
                                     const AnalysisOptions &options) const {
  const auto file_name = DisplayName(unit);
  logger_->Log(LogLevel::kInfo, "analysis.start",
               {{"file", file_name},
                {"bytes", std::to_string(unit.text.size())},
                {"categories",
                 std::to_string(options.enabled_categories.size())}});
  const auto start = std::chrono::steady_clock::now();

  try {
    ValidateSourceUnit(unit);
  } catch (const InvalidInputError &error) {
    logger_->Log(LogLevel::kWarn, "analysis.invalid_input",
                 {{"file", file_name}, {"reason", error.what()}});
    return InvalidReport(file_name, error.what());
  }

  const auto lines = ExtractLines(unit);
  auto scan = scanner_.Scan(lines, options);
  ApplyDeterministicFixes(*registry_, scan.issues);

  const auto security = ScoreCategory(scan.issues, Category::kSecurity);
  const auto performance = ScoreCategory(scan.issues, Category::kPerformance);
  const auto report_clamp = [&](Category category, const CategoryScore &score) {
    if (score.clamped) {
      logger_->Log(LogLevel::kDebug, "score.clamped",
                   {{"file", file_name}, {"category", CategoryName(category)}});
    }
  };
  report_clamp(Category::kSecurity, security);
  report_clamp(Category::kPerformance, performance);

  AggregationInput input;
  input.file_name = file_name;
  input.issues = std::move(scan.issues);
  input.faults = std::move(scan.faults);
  input.security_score = security.score;
  input.performance_score = performance.score;
  input.complexity_metrics = ComputeComplexityMetrics(lines);
  input.code_metrics = ComputeCodeMetrics(lines);
  auto report = Aggregate(std::move(input));

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kInfo, "analysis.complete",
               {{"file", file_name},
                {"issues", std::to_string(report.total_issues)},
                {"faults", std::to_string(report.rule_faults.size())},
                {"duration_ms", std::to_string(duration_ms)}});
  return report;
}

BatchResult CodeAnalyzer::AnalyzeBatch(const std::vector<SourceUnit> &units,
                                       const AnalysisOptions &options) const {
  if (units.size() > kMaxBatchSize) {
    throw std::invalid_argument("Maximum " + std::to_string(kMaxBatchSize) +
                                " files per batch request");
  }
  BatchResult result;
  result.entries.reserve(units.size());
  for (std::size_t i = 0; i < units.size(); ++i) {
    auto unit = units[i];
    if (!unit.filename || unit.filename->empty()) {
      unit.filename = "file_" + std::to_string(i) + ".py";
    }
    auto report = Analyze(unit, options);
    if (report.success) {
      ++result.successful;
    } else {
      ++result.failed;
    }
    result.entries.push_back(BatchEntry{i, std::move(report)});
  }
  return result;
}

ComparisonResult CodeAnalyzer::Compare(const SourceUnit &before,
                                       const SourceUnit &after,
                                       const AnalysisOptions &options) const {
  ComparisonResult result;
  result.before = Analyze(before, options);
  result.after = Analyze(after, options);
  result.issues_fixed = result.before.total_issues - result.after.total_issues;
  result.security_improvement =
      result.after.security_score - result.before.security_score;
  result.performance_improvement =
      result.after.performance_score - result.before.performance_score;
  result.complexity_change =
      result.after.complexity_metrics.cyclomatic_complexity -
      result.before.complexity_metrics.cyclomatic_complexity;
  result.summary = FormatComparisonSummary(result.issues_fixed,
                                           result.security_improvement);
  return result;
}

} // namespace pyscan
