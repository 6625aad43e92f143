#pragma once

#include <string>
#include <vector>

namespace pyscan {

std::string EscapeJson(const std::string &value);
std::string EscapeMarkdownCell(const std::string &value);
std::string TruncateForDisplay(const std::string &value, std::size_t limit);
std::vector<std::string> SplitList(const std::string &raw, char delimiter);

} // namespace pyscan
