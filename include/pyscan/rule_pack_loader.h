#pragma once

#include <pyscan/rule.h>

#include <filesystem>
#include <string>
#include <vector>

namespace pyscan {

// Reads pattern rules from a YAML file of the form
//
//   rules:
//     - id: custom.requests_no_timeout
//       category: performance
//       severity: warning
//       pattern: 'requests\.(get|post)\((?!.*timeout)'
//       description: "HTTP call to {1} without a timeout"
//       fix: "Pass timeout= to requests.{1}"
//       cwe: CWE-400
//       ignore_case: false
//
// Throws std::invalid_argument naming the file and rule on malformed input
// and std::runtime_error when the file cannot be read.
std::vector<Rule> LoadRulePack(const std::filesystem::path &path);
std::vector<Rule> ParseRulePack(const std::string &yaml_text,
                                const std::string &source_name);

} // namespace pyscan
