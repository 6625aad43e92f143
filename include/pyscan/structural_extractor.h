#pragma once

#include <pyscan/models.h>

#include <string>
#include <vector>

namespace pyscan {

// Splits on '\n' and drops a trailing '\r'. A final newline ends the last
// line instead of starting an empty one.
std::vector<std::string> SplitPhysicalLines(const std::string &text);

// Produces one LineContext per physical line. Lexical only: the result is
// deterministic, linear in the input size, and never throws on malformed
// source; anything unrecognized simply carries no tags.
std::vector<LineContext> ExtractLines(const SourceUnit &unit);

} // namespace pyscan
