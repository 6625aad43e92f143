#pragma once

#include <pyscan/models.h>

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace pyscan {

struct PatternMatcher {
  std::string expression;
  std::regex compiled;
  bool ignore_case = false;
};

struct StructuralPredicate {
  std::function<bool(const LineContext &)> predicate;
};

using Matcher = std::variant<PatternMatcher, StructuralPredicate>;

struct Rule {
  std::string id;
  Category category = Category::kQuality;
  Severity severity = Severity::kInfo;
  Matcher matcher;
  std::optional<std::string> cwe_id;
  std::string description_template;
  std::optional<std::string> fix_template;
};

// Compiles the expression up front; throws std::invalid_argument naming the
// expression when it is not a valid ECMAScript regex.
PatternMatcher MakePattern(const std::string &expression,
                           bool ignore_case = false);
StructuralPredicate
MakePredicate(std::function<bool(const LineContext &)> predicate);

// Expands {N}, {N:upper} and {N:lower} with captures[N]. Missing captures
// expand to an empty string; any other brace text is copied unchanged.
std::string ExpandTemplate(const std::string &text,
                           const std::vector<std::string> &captures);

std::string CategoryName(Category category);
Category ParseCategory(const std::string &value);
const std::vector<Category> &AllCategoriesInOrder();

std::string SeverityName(Severity severity);
Severity ParseSeverity(const std::string &value);

std::vector<Rule> MakeDefaultRules();

} // namespace pyscan
