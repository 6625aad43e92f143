#pragma once

#include <pyscan/logging.h>
#include <pyscan/rule.h>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace pyscan {

// Immutable after construction; safe to read from concurrent scans.
class RuleRegistry {
public:
  explicit RuleRegistry(std::vector<Rule> rules);
  // Category lists point into rules_, which survives a move but not a copy.
  RuleRegistry(const RuleRegistry &) = delete;
  RuleRegistry &operator=(const RuleRegistry &) = delete;
  RuleRegistry(RuleRegistry &&) = default;
  RuleRegistry &operator=(RuleRegistry &&) = default;

  // Rules of the category in insertion order; empty when none exist.
  const std::vector<const Rule *> &RulesFor(Category category) const;
  std::set<Category> AllCategories() const;
  const Rule *Find(const std::string &id) const;
  // Position of the rule in the catalog, used to order issues.
  std::size_t OrderOf(const std::string &id) const;

  const std::vector<Rule> &rules() const { return rules_; }
  std::size_t size() const { return rules_.size(); }

private:
  std::vector<Rule> rules_;
  std::unordered_map<std::string, std::size_t> index_;
  std::map<Category, std::vector<const Rule *>> by_category_;
};

// Default catalog followed by the rules of each pack, in the order given.
RuleRegistry MakeRuleRegistry(const std::vector<std::string> &rule_files,
                              std::shared_ptr<Logger> logger = nullptr);
const RuleRegistry &GlobalRuleRegistry();

} // namespace pyscan
