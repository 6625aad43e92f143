#pragma once

#include <pyscan/interfaces.h>
#include <pyscan/logging.h>
#include <pyscan/models.h>
#include <pyscan/rule_registry.h>

#include <memory>
#include <vector>

namespace pyscan {

// Fills suggested_fix from each rule's fix template using the issue's
// captures. Issues whose rule has no template are marked delegable.
void ApplyDeterministicFixes(const RuleRegistry &registry,
                             std::vector<Issue> &issues);

// Asks the model for a fix on every delegable issue without one and returns
// the updated copy. A model that throws is logged and the issue is left as
// it was.
AnalysisReport MergeDelegatedFixes(const AnalysisReport &report,
                                   FixModel &model,
                                   std::shared_ptr<Logger> logger = nullptr);

} // namespace pyscan
