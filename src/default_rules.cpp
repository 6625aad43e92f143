#include <pyscan/rule.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using pyscan::Category;
using pyscan::Construct;
using pyscan::LineContext;
using pyscan::Rule;
using pyscan::Severity;

constexpr std::size_t kMaxLineLength = 120;
constexpr int kNestingThreshold = 4;
constexpr int kBooleanOperatorThreshold = 3;

struct RuleText {
  std::string description;
  std::optional<std::string> fix;
  std::optional<std::string> cwe;
};

Rule Pattern(std::string id, Category category, Severity severity,
             const std::string &expression, RuleText text,
             bool ignore_case = false) {
  return Rule{.id = std::move(id),
              .category = category,
              .severity = severity,
              .matcher = pyscan::MakePattern(expression, ignore_case),
              .cwe_id = std::move(text.cwe),
              .description_template = std::move(text.description),
              .fix_template = std::move(text.fix)};
}

Rule Structural(std::string id, Category category, Severity severity,
                std::function<bool(const LineContext &)> predicate,
                RuleText text) {
  return Rule{.id = std::move(id),
              .category = category,
              .severity = severity,
              .matcher = pyscan::MakePredicate(std::move(predicate)),
              .cwe_id = std::move(text.cwe),
              .description_template = std::move(text.description),
              .fix_template = std::move(text.fix)};
}

std::size_t CodePointCount(const std::string &text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char character) {
        return (static_cast<unsigned char>(character) & 0xC0) != 0x80;
      }));
}

bool IsSpace(char character) {
  return std::isspace(static_cast<unsigned char>(character)) != 0;
}

bool IsIdentifierChar(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
         character == '_';
}

std::size_t SkipSpaces(const std::string &text, std::size_t index) {
  while (index < text.size() && IsSpace(text[index])) {
    ++index;
  }
  return index;
}

bool HasAt(const std::string &text, std::size_t index,
           std::string_view expected) {
  return text.compare(index, expected.size(), expected) == 0;
}

// Positions just past each "+=" with the following blanks skipped.
std::vector<std::size_t> AugmentedAddOperands(const std::string &code) {
  std::vector<std::size_t> operands;
  for (auto found = code.find("+="); found != std::string::npos;
       found = code.find("+=", found + 2)) {
    operands.push_back(SkipSpaces(code, found + 2));
  }
  return operands;
}

bool IsCallTo(const std::string &code, std::size_t index,
              std::string_view name) {
  return HasAt(code, index, name) &&
         SkipSpaces(code, index + name.size()) < code.size() &&
         code[SkipSpaces(code, index + name.size())] == '(';
}

// "name = name + [...]"
bool IsSelfListConcatenation(const std::string &code) {
  const auto name_start = SkipSpaces(code, 0);
  auto name_end = name_start;
  while (name_end < code.size() && IsIdentifierChar(code[name_end])) {
    ++name_end;
  }
  if (name_end == name_start) {
    return false;
  }
  const std::string_view name(code.data() + name_start, name_end - name_start);
  auto index = SkipSpaces(code, name_end);
  if (index >= code.size() || code[index] != '=') {
    return false;
  }
  index = SkipSpaces(code, index + 1);
  if (!HasAt(code, index, name)) {
    return false;
  }
  index = SkipSpaces(code, index + name.size());
  if (index >= code.size() || code[index] != '+') {
    return false;
  }
  index = SkipSpaces(code, index + 1);
  return index < code.size() && code[index] == '[';
}

bool IsListConcatenationInLoop(const LineContext &line) {
  if (!line.Has(Construct::kInLoopBody)) {
    return false;
  }
  for (const auto operand : AugmentedAddOperands(line.code)) {
    if ((operand < line.code.size() && line.code[operand] == '[') ||
        IsCallTo(line.code, operand, "list")) {
      return true;
    }
  }
  return IsSelfListConcatenation(line.code);
}

bool IsStringConcatenationInLoop(const LineContext &line) {
  if (!line.Has(Construct::kInLoopBody) ||
      !line.Has(Construct::kAugmentedAssignment)) {
    return false;
  }
  constexpr std::string_view kStringPrefixes = "rRbBuUfF";
  for (const auto operand : AugmentedAddOperands(line.code)) {
    auto index = operand;
    while (index < line.code.size() && index < operand + 2 &&
           kStringPrefixes.find(line.code[index]) != std::string_view::npos) {
      ++index;
    }
    if (index < line.code.size() &&
        (line.code[index] == '"' || line.code[index] == '\'')) {
      return true;
    }
    if (IsCallTo(line.code, operand, "str")) {
      return true;
    }
  }
  return false;
}

bool HasManyConcatenations(const LineContext &line) {
  if (!line.Has(Construct::kStringLiteral)) {
    return false;
  }
  int plus_signs = 0;
  for (std::size_t index = 0; index < line.code.size(); ++index) {
    const bool augmented =
        index + 1 < line.code.size() && line.code[index + 1] == '=';
    if (line.code[index] == '+' && !augmented) {
      ++plus_signs;
    }
  }
  return plus_signs > 2;
}

bool IsBranchHeader(const LineContext &line) {
  return line.Has(Construct::kConditional) || line.Has(Construct::kLoop) ||
         line.Has(Construct::kTryBlock);
}

// The signature closes on this line: "...)" then ":" and nothing else.
bool ClosesSignature(const std::string &code) {
  auto end = code.size();
  while (end > 0 && IsSpace(code[end - 1])) {
    --end;
  }
  if (end == 0 || code[end - 1] != ':') {
    return false;
  }
  --end;
  while (end > 0 && IsSpace(code[end - 1])) {
    --end;
  }
  return end > 0 && code[end - 1] == ')';
}

bool LacksReturnAnnotation(const LineContext &line) {
  return line.Has(Construct::kFunctionDef) &&
         line.Has(Construct::kTypeAnnotated) &&
         line.code.find("->") == std::string::npos && ClosesSignature(line.code);
}

void AddSecurityRules(std::vector<Rule> &rules) {
  rules.push_back(Pattern(
      "security.sql_injection_format", Category::kSecurity,
      Severity::kCritical, R"(execute\s*\(\s*["'].*%s.*["']\s*%)",
      {"SQL Injection vulnerability detected",
       "Use parameterized queries: cursor.execute(\"SELECT * FROM users "
       "WHERE id = ?\", (user_id,))",
       "CWE-89"}));
  rules.push_back(Pattern(
      "security.sql_injection_interpolation", Category::kSecurity,
      Severity::kCritical,
      R"(execute\s*\(\s*(?:[rR]?[fF][rR]?["']|["'][^"']*["']\s*(?:\+|\.format\s*\()))",
      {"SQL query built by string interpolation",
       "Pass values as query parameters instead of formatting them into "
       "the SQL text",
       "CWE-89"}));
  rules.push_back(Pattern(
      "security.sql_query_formatting", Category::kSecurity, Severity::kError,
      R"(^(?!.*execute\s*\().*["']\s*(SELECT|INSERT|UPDATE|DELETE)\b[^"']*%s[^"']*["']\s*%)",
      {"{1:upper} statement assembled with % formatting",
       "Keep the query constant and bind values through the driver's "
       "parameters",
       "CWE-89"},
      true));
  rules.push_back(Pattern(
      "security.command_injection", Category::kSecurity, Severity::kCritical,
      R"(os\.system\s*\(.*\+.*\)|subprocess\.(call|run|Popen|check_output)\s*\(.*\+.*\))",
      {"Command Injection vulnerability",
       "Use subprocess with list arguments: subprocess.run([\"command\", "
       "arg1, arg2])",
       "CWE-78"}));
  rules.push_back(Pattern("security.shell_true", Category::kSecurity,
                          Severity::kWarning, R"(\bshell\s*=\s*True\b)",
                          {"Subprocess started through the shell",
                           "Pass the command as a list and drop shell=True",
                           "CWE-78"}));
  rules.push_back(Pattern(
      "security.hardcoded_credentials", Category::kSecurity,
      Severity::kCritical,
      R"(([A-Za-z0-9_]*(?:password|passwd|pwd|secret|token|api_key)[A-Za-z0-9_]*)\s*=\s*["']([^"']+)["'])",
      {"Hardcoded credentials detected in '{1}'",
       "{1} = os.getenv(\"{1:upper}\")", "CWE-798"},
      true));
  rules.push_back(Pattern(
      "security.weak_hash", Category::kSecurity, Severity::kWarning,
      R"(\b(md5|sha1)\b)",
      {"Weak cryptographic algorithm: {1:lower}",
       "Use SHA-256 or better: hashlib.sha256(data.encode())", "CWE-327"},
      true));
  rules.push_back(Pattern(
      "security.eval", Category::kSecurity, Severity::kCritical,
      R"(\beval\s*\()",
      {"Dangerous eval() usage",
       "Use ast.literal_eval() for safe evaluation or parse manually",
       "CWE-95"}));
  rules.push_back(Pattern("security.exec", Category::kSecurity,
                          Severity::kCritical, R"(\bexec\s*\()",
                          {"Dangerous exec() usage",
                           "Replace dynamic code execution with explicit "
                           "dispatch",
                           "CWE-95"}));
  rules.push_back(Pattern("security.pickle_load", Category::kSecurity,
                          Severity::kWarning, R"(\bpickle\.loads?\s*\()",
                          {"Unsafe deserialization with pickle",
                           "Use json.loads() for untrusted data", "CWE-502"}));
  rules.push_back(Pattern("security.yaml_load", Category::kSecurity,
                          Severity::kWarning,
                          R"(\byaml\.load\s*\((?!.*Loader))",
                          {"yaml.load() without an explicit Loader",
                           "Use yaml.safe_load()", "CWE-502"}));
  rules.push_back(Pattern("security.tls_verification_disabled",
                          Category::kSecurity, Severity::kError,
                          R"(\bverify\s*=\s*False\b)",
                          {"TLS certificate verification disabled",
                           "Remove verify=False or point verify at a CA "
                           "bundle",
                           "CWE-295"}));
}

void AddPerformanceRules(std::vector<Rule> &rules) {
  rules.push_back(Structural("performance.list_concat_in_loop",
                             Category::kPerformance, Severity::kWarning,
                             IsListConcatenationInLoop,
                             {"Inefficient list concatenation in loop",
                              "Use list.append() or list comprehension",
                              std::nullopt}));
  rules.push_back(Structural("performance.string_concat_in_loop",
                             Category::kPerformance, Severity::kWarning,
                             IsStringConcatenationInLoop,
                             {"String concatenation in loop",
                              "Collect the parts in a list and use "
                              "''.join(parts)",
                              std::nullopt}));
  rules.push_back(Structural(
      "performance.many_concatenations", Category::kPerformance,
      Severity::kInfo, HasManyConcatenations,
      {"Multiple string concatenations",
       "Use f-string or str.join(): f\"{var1}{var2}{var3}\"",
       std::nullopt}));
  rules.push_back(Pattern("performance.global_usage", Category::kPerformance,
                          Severity::kWarning, R"(^\s*global\s+(\w+))",
                          {"Global variable usage affects performance: '{1}'",
                           "Use local variables or pass {1} as a parameter",
                           std::nullopt}));
  rules.push_back(Pattern(
      "performance.range_len", Category::kPerformance, Severity::kInfo,
      R"(\bfor\s+\w+\s+in\s+range\s*\(\s*len\s*\(\s*([\w.]+)\s*\)\s*\))",
      {"Index-based iteration over {1}",
       "Iterate directly or use enumerate({1})", std::nullopt}));
  rules.push_back(Pattern(
      "performance.keys_membership", Category::kPerformance, Severity::kInfo,
      R"(\bin\s+([\w.]+)\.keys\s*\(\s*\))",
      {"Membership test on {1}.keys()", "Test membership on {1} directly",
       std::nullopt}));
}

void AddQualityRules(std::vector<Rule> &rules) {
  rules.push_back(Structural(
      "quality.long_line", Category::kQuality, Severity::kInfo,
      [](const LineContext &line) {
        return CodePointCount(line.raw_text) > kMaxLineLength;
      },
      {"Line too long (>120 characters)",
       "Break into multiple lines or refactor", std::nullopt}));
  rules.push_back(Pattern("quality.magic_number", Category::kQuality,
                          Severity::kInfo,
                          R"(^(?!.*\breturn\b).*?\b(\d{4,})\b)",
                          {"Magic number detected: {1}",
                           "Define as named constant: MAX_VALUE = {1}",
                           std::nullopt}));
  rules.push_back(Pattern(
      "quality.commented_out_code", Category::kQuality, Severity::kInfo,
      R"(^\s*#\s*(?:(?:import|from|return|def|class|if|for|while)\b|[\w.]+\s*\(.*\)\s*$|[\w.]+\s*=[^=]))",
      {"Commented out code", "Remove commented code, use version control",
       std::nullopt}));
  rules.push_back(Structural(
      "quality.multiple_statements", Category::kQuality, Severity::kWarning,
      [](const LineContext &line) {
        return line.Has(Construct::kStatementSeparator);
      },
      {"Multiple statements on one line",
       "Put each statement on separate line", std::nullopt}));
  rules.push_back(Structural(
      "quality.bare_except", Category::kQuality, Severity::kWarning,
      [](const LineContext &line) { return line.Has(Construct::kBareExcept); },
      {"Bare except clause catches every exception",
       "Catch the specific exceptions you expect: except ValueError as e:",
       "CWE-396"}));
  rules.push_back(Structural(
      "quality.broad_except_unused", Category::kQuality, Severity::kInfo,
      [](const LineContext &line) {
        return line.Has(Construct::kBroadExceptUnused);
      },
      {"Catching Exception without using it",
       "except Exception as e: # Use e for logging", std::nullopt}));
  rules.push_back(Pattern(
      "quality.mutable_default", Category::kQuality, Severity::kWarning,
      R"(^\s*(?:async\s+)?def\s+\w+\s*\(.*=\s*(\[\]|\{\}|list\(\)|dict\(\)|set\(\)))",
      {"Mutable default argument {1}",
       "Default to None and create the {1} inside the function",
       std::nullopt}));
  rules.push_back(Pattern("quality.none_comparison", Category::kQuality,
                          Severity::kInfo, R"(([=!]=)\s*None\b)",
                          {"Comparison to None with {1}",
                           "Use 'is None' or 'is not None'", std::nullopt}));
}

void AddComplexityRules(std::vector<Rule> &rules) {
  // A header at depth 3 opens the fourth level.
  rules.push_back(Structural(
      "complexity.deep_nesting", Category::kComplexity, Severity::kWarning,
      [](const LineContext &line) {
        return IsBranchHeader(line) &&
               line.nesting_depth + 1 >= kNestingThreshold;
      },
      {"Deeply nested block", std::nullopt, std::nullopt}));
  rules.push_back(Structural(
      "complexity.complex_condition", Category::kComplexity, Severity::kInfo,
      [](const LineContext &line) {
        return (line.Has(Construct::kConditional) ||
                line.Has(Construct::kLoop)) &&
               line.boolean_operators >= kBooleanOperatorThreshold;
      },
      {"Complex boolean condition", std::nullopt, std::nullopt}));
  rules.push_back(Pattern(
      "complexity.long_parameter_list", Category::kComplexity,
      Severity::kWarning,
      R"(^\s*(?:async\s+)?def\s+(\w+)\s*\((?:[^,)]*,){5,}[^)]*\w[^)]*\))",
      {"Function '{1}' has a long parameter list",
       "Group related parameters of {1} into a dataclass", std::nullopt}));
}

void AddDeadCodeRules(std::vector<Rule> &rules) {
  rules.push_back(Structural(
      "dead_code.unused_definition", Category::kDeadCode, Severity::kInfo,
      [](const LineContext &line) {
        return line.Has(Construct::kUnusedDefinition);
      },
      {"Unused variable or function: '{1}'",
       "Remove unused {1} or prefix with _ if intentional", std::nullopt}));
  rules.push_back(Structural(
      "dead_code.unreachable", Category::kDeadCode, Severity::kWarning,
      [](const LineContext &line) {
        return line.Has(Construct::kUnreachable);
      },
      {"Unreachable statement", "Remove the unreachable statement",
       std::nullopt}));
}

void AddTypeHintRules(std::vector<Rule> &rules) {
  rules.push_back(Pattern(
      "type_hints.missing_annotations", Category::kTypeHints, Severity::kInfo,
      R"(^\s*(?:async\s+)?def\s+(\w+)\s*\(([^):]*)\)\s*:)",
      {"Function '{1}' missing type hints",
       "def {1}(param: str) -> int:", std::nullopt}));
  rules.push_back(Structural(
      "type_hints.missing_return_annotation", Category::kTypeHints,
      Severity::kInfo, LacksReturnAnnotation,
      {"Function '{1}' is missing a return annotation",
       "Add a return annotation to {1}: -> ReturnType", std::nullopt}));
}

void AddSyntaxRules(std::vector<Rule> &rules) {
  const auto tagged = [](Construct construct) {
    return [construct](const LineContext &line) {
      return line.Has(construct);
    };
  };
  rules.push_back(Structural(
      "syntax.missing_colon", Category::kSyntax, Severity::kError,
      tagged(Construct::kMissingColon),
      {"Missing colon at end of block statement",
       "Add ':' at the end of the statement", std::nullopt}));
  rules.push_back(Structural("syntax.unterminated_string", Category::kSyntax,
                             Severity::kError,
                             tagged(Construct::kUnterminatedString),
                             {"Unterminated string literal",
                              "Close the string with a matching quote",
                              std::nullopt}));
  rules.push_back(Structural("syntax.unmatched_bracket", Category::kSyntax,
                             Severity::kError,
                             tagged(Construct::kUnmatchedBracket),
                             {"Unmatched closing bracket", std::nullopt,
                              std::nullopt}));
  rules.push_back(Structural("syntax.unclosed_bracket", Category::kSyntax,
                             Severity::kError,
                             tagged(Construct::kUnclosedBracket),
                             {"Bracket is never closed", std::nullopt,
                              std::nullopt}));
  rules.push_back(Structural("syntax.mixed_indentation", Category::kSyntax,
                             Severity::kWarning,
                             tagged(Construct::kMixedIndentation),
                             {"Mixed tabs and spaces in indentation",
                              "Indent with spaces only", std::nullopt}));
}

} // namespace

namespace pyscan {

std::vector<Rule> MakeDefaultRules() {
  std::vector<Rule> rules;
  AddSecurityRules(rules);
  AddPerformanceRules(rules);
  AddQualityRules(rules);
  AddComplexityRules(rules);
  AddDeadCodeRules(rules);
  AddTypeHintRules(rules);
  AddSyntaxRules(rules);
  return rules;
}

} // namespace pyscan
