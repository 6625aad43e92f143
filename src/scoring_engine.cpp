#include <pyscan/scoring_engine.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <unordered_set>

namespace {

using pyscan::Construct;
using pyscan::LineContext;

bool IsBlank(const LineContext &line) {
  return line.raw_text.find_first_not_of(" \t\f\v") == std::string::npos;
}

// Comment lines and lines that hold nothing but a string literal, which
// covers docstrings.
bool IsDocumentation(const LineContext &line) {
  if (line.Has(Construct::kComment)) {
    return true;
  }
  if (!line.Has(Construct::kStringLiteral)) {
    return false;
  }
  return std::all_of(line.code.begin(), line.code.end(), [](char character) {
    return character == '"' || character == '\'' ||
           std::isspace(static_cast<unsigned char>(character)) != 0;
  });
}

bool IsWordChar(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
         character == '_' || static_cast<unsigned char>(character) >= 0x80;
}

// Halstead volume approximated from the lexical tokens of code lines.
double HalsteadVolume(const std::vector<LineContext> &lines) {
  std::unordered_set<std::string> distinct;
  std::size_t total = 0;
  for (const auto &line : lines) {
    if (IsBlank(line) || IsDocumentation(line)) {
      continue;
    }
    const auto &code = line.code;
    std::size_t index = 0;
    while (index < code.size()) {
      const char character = code[index];
      if (std::isspace(static_cast<unsigned char>(character)) != 0) {
        ++index;
        continue;
      }
      auto end = index + 1;
      if (IsWordChar(character)) {
        while (end < code.size() && IsWordChar(code[end])) {
          ++end;
        }
      }
      distinct.insert(code.substr(index, end - index));
      ++total;
      index = end;
    }
  }
  if (distinct.size() < 2) {
    return static_cast<double>(total);
  }
  return static_cast<double>(total) *
         std::log2(static_cast<double>(distinct.size()));
}

} // namespace

namespace pyscan {

int SeverityWeight(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
    return 25;
  case Severity::kError:
    return 15;
  case Severity::kWarning:
    return 5;
  case Severity::kInfo:
    return 1;
  }
  return 0;
}

CategoryScore ScoreCategory(const std::vector<Issue> &issues,
                            Category category) {
  int penalty = 0;
  for (const auto &issue : issues) {
    if (issue.category == category) {
      penalty += SeverityWeight(issue.severity);
    }
  }
  CategoryScore result;
  result.clamped = penalty > 100;
  result.score = std::clamp(100 - penalty, 0, 100);
  return result;
}

int CyclomaticComplexity(const std::vector<LineContext> &lines) {
  int complexity = 1;
  for (const auto &line : lines) {
    if (line.Has(Construct::kConditional)) {
      ++complexity;
    }
    if (line.Has(Construct::kLoop)) {
      ++complexity;
    }
    if (line.Has(Construct::kExceptionHandler)) {
      ++complexity;
    }
    complexity += line.boolean_operators;
  }
  return complexity;
}

CodeMetrics ComputeCodeMetrics(const std::vector<LineContext> &lines) {
  CodeMetrics metrics;
  metrics.total_lines = static_cast<int>(lines.size());
  for (const auto &line : lines) {
    if (IsBlank(line)) {
      ++metrics.blank_lines;
    } else if (IsDocumentation(line)) {
      ++metrics.comment_lines;
    } else {
      ++metrics.code_lines;
    }
  }
  // Every non-code line, blank lines included, counts against code.
  metrics.code_to_comment_ratio =
      static_cast<double>(metrics.code_lines) /
      static_cast<double>(
          std::max(1, metrics.total_lines - metrics.code_lines));
  return metrics;
}

ComplexityMetrics
ComputeComplexityMetrics(const std::vector<LineContext> &lines) {
  ComplexityMetrics metrics;
  metrics.cyclomatic_complexity = CyclomaticComplexity(lines);

  const auto code = ComputeCodeMetrics(lines);
  const double loc = std::max(1, code.code_lines);
  const double volume = std::max(1.0, HalsteadVolume(lines));
  const int commented = code.code_lines + code.comment_lines;
  const double comment_ratio =
      commented == 0 ? 0.0
                     : static_cast<double>(code.comment_lines) / commented;

  const double raw = 171.0 - 5.2 * std::log(volume) -
                     0.23 * metrics.cyclomatic_complexity -
                     16.2 * std::log(loc) +
                     50.0 * std::sin(std::sqrt(2.4 * comment_ratio));
  const double scaled = std::clamp(raw * 100.0 / 171.0, 0.0, 100.0);
  metrics.maintainability_index = std::round(scaled * 100.0) / 100.0;
  return metrics;
}

std::string ScoreLabel(int score) {
  if (score >= 80) {
    return "Excellent";
  }
  if (score >= 60) {
    return "Good";
  }
  if (score >= 40) {
    return "Needs Improvement";
  }
  return "Critical";
}

} // namespace pyscan
