#include <pyscan/rule.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace pyscan {
namespace {

std::string Normalize(std::string value) {
  value.erase(std::remove_if(value.begin(), value.end(),
                             [](unsigned char ch) { return std::isspace(ch); }),
              value.end());
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

std::string ApplyModifier(std::string value, const std::string &modifier) {
  if (modifier == "upper") {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) {
                     return static_cast<char>(std::toupper(ch));
                   });
  } else if (modifier == "lower") {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) {
                     return static_cast<char>(std::tolower(ch));
                   });
  }
  return value;
}

bool IsPlaceholder(const std::string &body, std::size_t &index,
                   std::string &modifier) {
  const auto colon = body.find(':');
  const auto digits = body.substr(0, colon);
  if (digits.empty() || digits.size() > 2 ||
      !std::all_of(digits.begin(), digits.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    return false;
  }
  modifier = colon == std::string::npos ? "" : body.substr(colon + 1);
  if (!modifier.empty() && modifier != "upper" && modifier != "lower") {
    return false;
  }
  index = static_cast<std::size_t>(std::stoi(digits));
  return true;
}

} // namespace

PatternMatcher MakePattern(const std::string &expression, bool ignore_case) {
  auto flags = std::regex::ECMAScript | std::regex::optimize;
  if (ignore_case) {
    flags |= std::regex::icase;
  }
  try {
    return PatternMatcher{expression, std::regex(expression, flags),
                          ignore_case};
  } catch (const std::regex_error &error) {
    throw std::invalid_argument("Invalid rule pattern '" + expression +
                                "': " + error.what());
  }
}

StructuralPredicate
MakePredicate(std::function<bool(const LineContext &)> predicate) {
  if (!predicate) {
    throw std::invalid_argument("Structural predicate cannot be null");
  }
  return StructuralPredicate{std::move(predicate)};
}

std::string ExpandTemplate(const std::string &text,
                           const std::vector<std::string> &captures) {
  std::string expanded;
  expanded.reserve(text.size());
  std::size_t position = 0;
  while (position < text.size()) {
    const auto open = text.find('{', position);
    if (open == std::string::npos) {
      expanded.append(text, position, std::string::npos);
      break;
    }
    const auto close = text.find('}', open + 1);
    if (close == std::string::npos) {
      expanded.append(text, position, std::string::npos);
      break;
    }
    expanded.append(text, position, open - position);
    const auto body = text.substr(open + 1, close - open - 1);
    std::size_t index = 0;
    std::string modifier;
    if (IsPlaceholder(body, index, modifier)) {
      if (index < captures.size()) {
        expanded.append(ApplyModifier(captures[index], modifier));
      }
    } else {
      expanded.append(text, open, close - open + 1);
    }
    position = close + 1;
  }
  return expanded;
}

std::string CategoryName(Category category) {
  switch (category) {
  case Category::kSecurity:
    return "security";
  case Category::kPerformance:
    return "performance";
  case Category::kQuality:
    return "quality";
  case Category::kComplexity:
    return "complexity";
  case Category::kDeadCode:
    return "dead_code";
  case Category::kTypeHints:
    return "type_hints";
  case Category::kSyntax:
    return "syntax";
  }
  return "unknown";
}

Category ParseCategory(const std::string &value) {
  const auto normalized = Normalize(value);
  for (const auto category : AllCategoriesInOrder()) {
    if (CategoryName(category) == normalized) {
      return category;
    }
  }
  if (normalized == "code_smells" || normalized == "style") {
    return Category::kQuality;
  }
  if (normalized == "type_hint") {
    return Category::kTypeHints;
  }
  throw std::invalid_argument(
      "Unknown category: " + value +
      ". Supported: security, performance, quality, complexity, dead_code, "
      "type_hints, syntax");
}

const std::vector<Category> &AllCategoriesInOrder() {
  static const std::vector<Category> categories = {
      Category::kSyntax,     Category::kSecurity,  Category::kPerformance,
      Category::kQuality,    Category::kComplexity, Category::kDeadCode,
      Category::kTypeHints};
  return categories;
}

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
    return "critical";
  case Severity::kError:
    return "error";
  case Severity::kWarning:
    return "warning";
  case Severity::kInfo:
    return "info";
  }
  return "unknown";
}

Severity ParseSeverity(const std::string &value) {
  const auto normalized = Normalize(value);
  if (normalized == "critical") {
    return Severity::kCritical;
  }
  if (normalized == "error") {
    return Severity::kError;
  }
  if (normalized == "warning" || normalized == "warn") {
    return Severity::kWarning;
  }
  if (normalized == "info") {
    return Severity::kInfo;
  }
  throw std::invalid_argument("Unknown severity: " + value +
                              ". Supported: critical, error, warning, info");
}

} // namespace pyscan
