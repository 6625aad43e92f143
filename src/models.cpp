#include <pyscan/models.h>

#include <pyscan/rule.h>

#include <utility>

namespace pyscan {

AnalysisOptions AnalysisOptions::AllCategories() {
  AnalysisOptions options;
  const auto &categories = AllCategoriesInOrder();
  options.enabled_categories.insert(categories.begin(), categories.end());
  return options;
}

AnalysisOptions AnalysisOptions::FromRequestFlags(const RequestFlags &flags) {
  AnalysisOptions options;
  const auto enable_if = [&](bool enabled, Category category) {
    if (enabled) {
      options.enabled_categories.insert(category);
    }
  };
  enable_if(flags.syntax, Category::kSyntax);
  enable_if(flags.security, Category::kSecurity);
  enable_if(flags.performance, Category::kPerformance);
  enable_if(flags.code_smells, Category::kQuality);
  enable_if(flags.complexity, Category::kComplexity);
  enable_if(flags.dead_code, Category::kDeadCode);
  enable_if(flags.type_hints, Category::kTypeHints);
  return options;
}

AnalysisOptions AnalysisOptions::Only(std::set<Category> categories) {
  AnalysisOptions options;
  options.enabled_categories = std::move(categories);
  return options;
}

} // namespace pyscan
