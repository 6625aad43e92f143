#include <pyscan/rule_registry.h>

#include <pyscan/rule_pack_loader.h>

#include <stdexcept>
#include <utility>

namespace pyscan {

RuleRegistry::RuleRegistry(std::vector<Rule> rules) : rules_(std::move(rules)) {
  for (std::size_t i = 0; i < rules_.size(); ++i) {
    const auto &rule = rules_[i];
    if (rule.id.empty()) {
      throw std::invalid_argument("Rule id cannot be empty");
    }
    if (!index_.emplace(rule.id, i).second) {
      throw std::invalid_argument("Rule with id '" + rule.id +
                                  "' already registered");
    }
  }
  // Pointers are taken once the vector no longer grows.
  for (const auto &rule : rules_) {
    by_category_[rule.category].push_back(&rule);
  }
}

const std::vector<const Rule *> &
RuleRegistry::RulesFor(Category category) const {
  static const std::vector<const Rule *> kEmpty;
  const auto found = by_category_.find(category);
  return found == by_category_.end() ? kEmpty : found->second;
}

std::set<Category> RuleRegistry::AllCategories() const {
  std::set<Category> categories;
  for (const auto &entry : by_category_) {
    categories.insert(entry.first);
  }
  return categories;
}

const Rule *RuleRegistry::Find(const std::string &id) const {
  const auto found = index_.find(id);
  return found == index_.end() ? nullptr : &rules_[found->second];
}

std::size_t RuleRegistry::OrderOf(const std::string &id) const {
  const auto found = index_.find(id);
  if (found == index_.end()) {
    throw std::invalid_argument("Unknown rule '" + id + "'");
  }
  return found->second;
}

RuleRegistry MakeRuleRegistry(const std::vector<std::string> &rule_files,
                              std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  auto rules = MakeDefaultRules();
  for (const auto &path : rule_files) {
    auto pack = LoadRulePack(path);
    logger->Log(LogLevel::kInfo, "rules.pack_loaded",
                {{"path", path}, {"rules", std::to_string(pack.size())}});
    for (auto &rule : pack) {
      rules.push_back(std::move(rule));
    }
  }
  return RuleRegistry(std::move(rules));
}

const RuleRegistry &GlobalRuleRegistry() {
  static const RuleRegistry registry(MakeDefaultRules());
  return registry;
}

} // namespace pyscan
