#include <pyscan/scanner_engine.h>

#include <pyscan/escaping.h>

#include <algorithm>
#include <future>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace {

constexpr std::size_t kSnippetLength = 120;

std::string TrimLine(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\f\v");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\f\v");
  return value.substr(first, last - first + 1);
}

struct MatchVisitor {
  const pyscan::LineContext &line;
  std::size_t max_length;
  std::vector<std::string> &captures;

  bool operator()(const pyscan::PatternMatcher &pattern) const {
    const auto subject = line.raw_text.size() > max_length
                             ? line.raw_text.substr(0, max_length)
                             : line.raw_text;
    std::smatch match;
    if (!std::regex_search(subject, match, pattern.compiled)) {
      return false;
    }
    captures.reserve(match.size());
    for (const auto &group : match) {
      captures.push_back(group.matched ? group.str() : std::string());
    }
    return true;
  }

  bool operator()(const pyscan::StructuralPredicate &structural) const {
    if (!structural.predicate(line)) {
      return false;
    }
    captures = {TrimLine(line.raw_text), line.symbol};
    return true;
  }
};

} // namespace

namespace pyscan {

std::string MakeCodeSnippet(const std::string &raw_text) {
  return TruncateForDisplay(TrimLine(raw_text), kSnippetLength);
}

ScannerEngine::ScannerEngine(const RuleRegistry &registry,
                             std::shared_ptr<Logger> logger,
                             ScanSettings settings)
    : registry_(&registry), logger_(EnsureLogger(std::move(logger))),
      settings_(settings) {}

bool ScannerEngine::Evaluate(const Rule &rule, const LineContext &line,
                             std::vector<std::string> &captures) const {
  return std::visit(
      MatchVisitor{line, settings_.max_pattern_line_length, captures},
      rule.matcher);
}

ScanResult ScannerEngine::ScanCategory(const std::vector<LineContext> &lines,
                                       Category category) const {
  ScanResult result;
  const auto &rules = registry_->RulesFor(category);
  const auto *first_rule = registry_->rules().data();
  for (const auto &line : lines) {
    for (const auto *rule : rules) {
      try {
        std::vector<std::string> captures;
        if (!Evaluate(*rule, line, captures)) {
          continue;
        }
        Issue issue;
        issue.line_number = line.line_number;
        issue.severity = rule->severity;
        issue.category = rule->category;
        issue.description = ExpandTemplate(rule->description_template, captures);
        issue.code_snippet = MakeCodeSnippet(line.raw_text);
        issue.cwe_id = rule->cwe_id;
        issue.rule_id = rule->id;
        issue.captures = std::move(captures);
        issue.rule_order = static_cast<std::size_t>(rule - first_rule);
        result.issues.push_back(std::move(issue));
      } catch (const std::exception &error) {
        result.faults.push_back(
            RuleFault{rule->id, line.line_number, error.what()});
        logger_->Log(LogLevel::kWarn, "scan.rule_fault",
                     {{"rule", rule->id},
                      {"line", std::to_string(line.line_number)},
                      {"error", error.what()}});
      } catch (...) {
        result.faults.push_back(
            RuleFault{rule->id, line.line_number, "unknown error"});
        logger_->Log(LogLevel::kWarn, "scan.rule_fault",
                     {{"rule", rule->id},
                      {"line", std::to_string(line.line_number)},
                      {"error", "unknown error"}});
      }
    }
  }
  if (logger_->IsEnabled(LogLevel::kDebug)) {
    logger_->Log(LogLevel::kDebug, "scan.category.complete",
                 {{"category", CategoryName(category)},
                  {"issues", std::to_string(result.issues.size())},
                  {"faults", std::to_string(result.faults.size())}});
  }
  return result;
}

ScanResult ScannerEngine::Scan(const std::vector<LineContext> &lines,
                               const AnalysisOptions &options) const {
  std::vector<Category> categories;
  for (const auto category : AllCategoriesInOrder()) {
    if (options.IsEnabled(category) && !registry_->RulesFor(category).empty()) {
      categories.push_back(category);
    }
  }

  std::vector<ScanResult> partials;
  partials.reserve(categories.size());
  if (settings_.parallel_categories && categories.size() > 1) {
    std::vector<std::future<ScanResult>> tasks;
    tasks.reserve(categories.size());
    for (const auto category : categories) {
      tasks.push_back(std::async(std::launch::async, [this, &lines, category]() {
        return ScanCategory(lines, category);
      }));
    }
    for (auto &task : tasks) {
      partials.push_back(task.get());
    }
  } else {
    for (const auto category : categories) {
      partials.push_back(ScanCategory(lines, category));
    }
  }

  ScanResult merged;
  for (auto &partial : partials) {
    std::move(partial.issues.begin(), partial.issues.end(),
              std::back_inserter(merged.issues));
    std::move(partial.faults.begin(), partial.faults.end(),
              std::back_inserter(merged.faults));
  }
  return merged;
}

} // namespace pyscan
