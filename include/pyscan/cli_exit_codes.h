#pragma once

#include <pyscan/models.h>

#include <vector>

namespace pyscan {

constexpr int kExitClean = 0;
constexpr int kExitFailure = 1;
constexpr int kExitIssuesFound = 2;

// kExitFailure when any report failed, kExitIssuesFound when an issue is at
// or above fail_on, kExitClean otherwise.
int ReportExitCode(const std::vector<AnalysisReport> &reports,
                   Severity fail_on);

} // namespace pyscan
