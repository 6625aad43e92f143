#include <pyscan/fix_suggestion_engine.h>

#include <pyscan/rule.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace pyscan {

void ApplyDeterministicFixes(const RuleRegistry &registry,
                             std::vector<Issue> &issues) {
  for (auto &issue : issues) {
    const auto *rule = registry.Find(issue.rule_id);
    if (rule != nullptr && rule->fix_template) {
      issue.suggested_fix = ExpandTemplate(*rule->fix_template, issue.captures);
      issue.delegable = false;
    } else {
      issue.suggested_fix.reset();
      issue.delegable = true;
    }
  }
}

AnalysisReport MergeDelegatedFixes(const AnalysisReport &report,
                                   FixModel &model,
                                   std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  AnalysisReport merged = report;
  for (auto &issue : merged.issues) {
    if (!issue.delegable || issue.suggested_fix) {
      continue;
    }
    try {
      auto proposal = model.Propose(issue);
      if (proposal && !proposal->empty()) {
        issue.suggested_fix = std::move(*proposal);
      }
    } catch (const std::exception &error) {
      logger->Log(LogLevel::kWarn, "fix.model_failed",
                  {{"rule", issue.rule_id},
                   {"line", std::to_string(issue.line_number)},
                   {"error", error.what()}});
    }
  }
  return merged;
}

} // namespace pyscan
