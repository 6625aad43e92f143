#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pyscan {

enum class Severity { kInfo = 0, kWarning = 1, kError = 2, kCritical = 3 };

enum class Category {
  kSecurity,
  kPerformance,
  kQuality,
  kComplexity,
  kDeadCode,
  kTypeHints,
  kSyntax
};

enum class Construct {
  kAssignment,
  kAugmentedAssignment,
  kFunctionDef,
  kClassDef,
  kConditional,
  kElseClause,
  kConditionalExpression,
  kLoop,
  kComprehension,
  kTryBlock,
  kExceptionHandler,
  kBareExcept,
  kBroadExceptUnused,
  kFinallyClause,
  kReturn,
  kRaise,
  kLoopControl,
  kImport,
  kDecorator,
  kGlobalDeclaration,
  kLambda,
  kStringLiteral,
  kMultilineString,
  kComment,
  kInlineComment,
  kStatementSeparator,
  kContinuation,
  kInLoopBody,
  kInFunctionBody,
  kTypeAnnotated,
  kUnusedDefinition,
  kUnreachable,
  kMissingColon,
  kUnterminatedString,
  kUnmatchedBracket,
  kUnclosedBracket,
  kMixedIndentation
};

struct SourceUnit {
  std::string text;
  std::optional<std::string> filename;
};

struct LineContext {
  int line_number = 0;
  std::string raw_text;
  std::set<Construct> constructs;
  // Source text with string bodies and comments removed.
  std::string code;
  int indent = 0;
  int nesting_depth = 0;
  int boolean_operators = 0;
  // Function, class or variable name defined on this line.
  std::string symbol;

  bool Has(Construct construct) const {
    return constructs.count(construct) != 0;
  }
};

struct Issue {
  int line_number = 0;
  Severity severity = Severity::kInfo;
  Category category = Category::kQuality;
  std::string description;
  std::string code_snippet;
  std::optional<std::string> suggested_fix;
  std::optional<std::string> cwe_id;
  std::string rule_id;

  std::vector<std::string> captures;
  std::size_t rule_order = 0;
  bool delegable = false;
};

struct RequestFlags {
  bool syntax = true;
  bool security = true;
  bool performance = true;
  bool code_smells = true;
  bool complexity = true;
  bool dead_code = true;
  bool type_hints = true;
};

struct AnalysisOptions {
  std::set<Category> enabled_categories;

  static AnalysisOptions AllCategories();
  static AnalysisOptions FromRequestFlags(const RequestFlags &flags);
  static AnalysisOptions Only(std::set<Category> categories);

  bool IsEnabled(Category category) const {
    return enabled_categories.count(category) != 0;
  }
};

struct ComplexityMetrics {
  int cyclomatic_complexity = 1;
  double maintainability_index = 100.0;
};

struct CodeMetrics {
  int total_lines = 0;
  int code_lines = 0;
  int comment_lines = 0;
  int blank_lines = 0;
  double code_to_comment_ratio = 0.0;
};

struct RuleFault {
  std::string rule_id;
  int line_number = 0;
  std::string message;
};

struct AnalysisReport {
  bool success = false;
  std::string file_name;
  std::string error;
  int total_issues = 0;
  int critical = 0;
  int errors = 0;
  int warnings = 0;
  int info = 0;
  int security_score = 100;
  int performance_score = 100;
  ComplexityMetrics complexity_metrics;
  CodeMetrics code_metrics;
  std::vector<Issue> issues;
  std::vector<RuleFault> rule_faults;
  std::vector<std::string> recommendations;
  std::string summary;
};

struct BatchEntry {
  std::size_t index = 0;
  AnalysisReport report;
};

struct BatchResult {
  std::vector<BatchEntry> entries;
  int successful = 0;
  int failed = 0;
};

struct ComparisonResult {
  AnalysisReport before;
  AnalysisReport after;
  int issues_fixed = 0;
  int security_improvement = 0;
  int performance_improvement = 0;
  int complexity_change = 0;
  std::string summary;
};

struct Report {
  std::string markdown;
  std::string json;
  std::string text;
};

struct ReportConfig {
  std::vector<std::string> formats;
  std::string title = "pyscan Analysis Report";
};

} // namespace pyscan
