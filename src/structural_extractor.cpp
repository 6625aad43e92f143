#include <pyscan/structural_extractor.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

using pyscan::Construct;

constexpr int kTabWidth = 8;

enum class BlockKind { kFunction, kClass, kLoop, kOther };

struct OpenBlock {
  int indent = 0;
  BlockKind kind = BlockKind::kOther;
};

struct LexedLine {
  std::string code;
  // Expressions found inside f-string replacement fields.
  std::string embedded;
  std::string comment;
  bool has_string = false;
  bool started_in_string = false;
  bool unterminated_string = false;
  bool unmatched_bracket = false;
  bool has_separator = false;
  bool ends_with_backslash = false;
  int depth_at_start = 0;
};

bool IsIdentifierStart(char character) {
  const auto value = static_cast<unsigned char>(character);
  return std::isalpha(value) != 0 || character == '_' || value >= 0x80;
}

bool IsIdentifierChar(char character) {
  return IsIdentifierStart(character) ||
         std::isdigit(static_cast<unsigned char>(character)) != 0;
}

bool IsOpener(char character) {
  return character == '(' || character == '[' || character == '{';
}

bool IsCloser(char character) {
  return character == ')' || character == ']' || character == '}';
}

bool Closes(char opener, char closer) {
  return (opener == '(' && closer == ')') || (opener == '[' && closer == ']') ||
         (opener == '{' && closer == '}');
}

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\f\v");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\f\v");
  return value.substr(first, last - first + 1);
}

std::vector<std::string> Words(const std::string &code) {
  std::vector<std::string> words;
  std::size_t index = 0;
  while (index < code.size()) {
    if (!IsIdentifierChar(code[index])) {
      ++index;
      continue;
    }
    const auto start = index;
    while (index < code.size() && IsIdentifierChar(code[index])) {
      ++index;
    }
    // Numeric literals such as 1e5 or 0x1F are not names.
    if (IsIdentifierStart(code[start])) {
      words.push_back(code.substr(start, index - start));
    }
  }
  return words;
}

bool Contains(const std::vector<std::string> &words, std::string_view word) {
  return std::find(words.begin(), words.end(), word) != words.end();
}

bool HasFormatPrefix(const std::string &code) {
  constexpr std::string_view kPrefixes = "rRbBuUfF";
  auto index = code.size();
  int count = 0;
  bool formatted = false;
  while (index > 0 && count < 2 &&
         kPrefixes.find(code[index - 1]) != std::string_view::npos) {
    formatted = formatted || code[index - 1] == 'f' || code[index - 1] == 'F';
    --index;
    ++count;
  }
  if (count == 0 || (index > 0 && IsIdentifierChar(code[index - 1]))) {
    return false;
  }
  return formatted;
}

void AppendEmbeddedExpressions(const std::string &body, std::string &out) {
  std::size_t index = 0;
  while (index < body.size()) {
    if (body[index] != '{') {
      ++index;
      continue;
    }
    if (index + 1 < body.size() && body[index + 1] == '{') {
      index += 2;
      continue;
    }
    const auto close = body.find('}', index + 1);
    if (close == std::string::npos) {
      return;
    }
    out.append(body, index + 1, close - index - 1);
    out.push_back(' ');
    index = close + 1;
  }
}

std::size_t FindTripleClose(const std::string &raw, std::size_t from,
                            const std::string &delimiter) {
  auto index = from;
  while (index < raw.size()) {
    if (raw[index] == '\\') {
      index += 2;
      continue;
    }
    if (raw.compare(index, delimiter.size(), delimiter) == 0) {
      return index;
    }
    ++index;
  }
  return std::string::npos;
}

// Carries string and bracket state from one physical line to the next.
class Lexer {
public:
  LexedLine Lex(const std::string &raw, int line_index) {
    LexedLine line;
    line.depth_at_start = static_cast<int>(brackets_.size());
    line.started_in_string = !triple_delimiter_.empty();
    std::size_t index = 0;
    while (index < raw.size()) {
      if (!triple_delimiter_.empty()) {
        line.has_string = true;
        const auto close = FindTripleClose(raw, index, triple_delimiter_);
        if (close == std::string::npos) {
          break;
        }
        line.code.append(triple_delimiter_);
        index = close + triple_delimiter_.size();
        triple_delimiter_.clear();
        triple_start_line_ = -1;
        continue;
      }

      const char character = raw[index];
      if (character == '#') {
        line.comment = raw.substr(index);
        break;
      }
      if (character == '"' || character == '\'') {
        index = LexString(raw, index, line_index, line);
        continue;
      }
      if (IsOpener(character)) {
        brackets_.emplace_back(character, line_index);
      } else if (IsCloser(character)) {
        if (brackets_.empty() || !Closes(brackets_.back().first, character)) {
          line.unmatched_bracket = true;
        }
        if (!brackets_.empty()) {
          brackets_.pop_back();
        }
      } else if (character == ';') {
        line.has_separator = true;
      } else if (character == '\\' && index + 1 == raw.size()) {
        line.ends_with_backslash = true;
        ++index;
        continue;
      }
      line.code.push_back(character);
      ++index;
    }
    return line;
  }

  bool InsideString() const { return !triple_delimiter_.empty(); }
  int Depth() const { return static_cast<int>(brackets_.size()); }
  int OpenStringLine() const { return triple_start_line_; }
  const std::vector<std::pair<char, int>> &OpenBrackets() const {
    return brackets_;
  }

private:
  std::size_t LexString(const std::string &raw, std::size_t index,
                        int line_index, LexedLine &line) {
    const char quote = raw[index];
    line.has_string = true;
    const std::string triple(3, quote);
    if (raw.compare(index, 3, triple) == 0) {
      triple_delimiter_ = triple;
      triple_start_line_ = line_index;
      line.code.append(triple);
      return index + 3;
    }

    const bool formatted = HasFormatPrefix(line.code);
    auto end = index + 1;
    while (end < raw.size() && raw[end] != quote) {
      if (raw[end] == '\\') {
        ++end;
      }
      ++end;
    }
    line.code.push_back(quote);
    line.code.push_back(quote);
    if (end >= raw.size()) {
      line.unterminated_string = raw.back() != '\\';
      return raw.size();
    }
    if (formatted) {
      AppendEmbeddedExpressions(raw.substr(index + 1, end - index - 1),
                                line.embedded);
    }
    return end + 1;
  }

  std::string triple_delimiter_;
  int triple_start_line_ = -1;
  std::vector<std::pair<char, int>> brackets_;
};

int MeasureIndent(const std::string &raw, bool &mixed) {
  int width = 0;
  bool spaces = false;
  bool tabs = false;
  for (const auto character : raw) {
    if (character == ' ') {
      spaces = true;
      ++width;
    } else if (character == '\t') {
      tabs = true;
      width = (width / kTabWidth + 1) * kTabWidth;
    } else if (character == '\f') {
      width = 0;
    } else {
      break;
    }
  }
  mixed = spaces && tabs;
  return width;
}

bool HasTopLevelColon(const std::string &code, int depth) {
  for (const auto character : code) {
    if (IsOpener(character)) {
      ++depth;
    } else if (IsCloser(character)) {
      depth = std::max(0, depth - 1);
    } else if (character == ':' && depth == 0) {
      return true;
    }
  }
  return false;
}

bool IsSimpleName(const std::string &value) {
  return !value.empty() && IsIdentifierStart(value.front()) &&
         std::all_of(value.begin(), value.end(), IsIdentifierChar);
}

struct AssignmentShape {
  bool found = false;
  bool augmented = false;
  std::string target;
};

AssignmentShape DetectAssignment(const std::string &code) {
  static constexpr std::string_view kAugmentedOperators = "+-*/%&|^@";
  AssignmentShape shape;
  int depth = 0;
  for (std::size_t index = 0; index < code.size(); ++index) {
    const char character = code[index];
    if (IsOpener(character)) {
      ++depth;
      continue;
    }
    if (IsCloser(character)) {
      depth = std::max(0, depth - 1);
      continue;
    }
    if (character != '=' || depth != 0) {
      continue;
    }
    if (index + 1 < code.size() && code[index + 1] == '=') {
      ++index;
      continue;
    }
    const char previous = index > 0 ? code[index - 1] : '\0';
    std::size_t target_end = index;
    if (previous == '<' || previous == '>') {
      if (index < 2 || code[index - 2] != previous) {
        continue;
      }
      shape.augmented = true;
      target_end = index - 2;
    } else if (previous == '!' || previous == '=' || previous == ':') {
      continue;
    } else if (previous != '\0' &&
               kAugmentedOperators.find(previous) != std::string_view::npos) {
      shape.augmented = true;
      target_end = index - 1;
      if (target_end > 0 && (previous == '/' || previous == '*') &&
          code[target_end - 1] == previous) {
        --target_end;
      }
    }
    shape.found = true;
    shape.target = Trim(code.substr(0, target_end));
    const auto annotation = shape.target.find(':');
    if (annotation != std::string::npos) {
      shape.target = Trim(shape.target.substr(0, annotation));
    }
    return shape;
  }
  return shape;
}

bool HasAnnotatedParameters(const std::string &code) {
  const auto open = code.find('(');
  if (open == std::string::npos) {
    return false;
  }
  int depth = 0;
  for (auto index = open; index < code.size(); ++index) {
    const char character = code[index];
    if (IsOpener(character)) {
      ++depth;
    } else if (IsCloser(character)) {
      if (--depth == 0) {
        return false;
      }
    } else if (character == ':' && depth == 1) {
      return true;
    }
  }
  return false;
}

std::string NameAfter(const std::vector<std::string> &words,
                      std::string_view keyword) {
  const auto found = std::find(words.begin(), words.end(), keyword);
  if (found == words.end() || std::next(found) == words.end()) {
    return "";
  }
  return *std::next(found);
}

const std::unordered_set<std::string> &BlockKeywords() {
  static const std::unordered_set<std::string> keywords = {
      "def", "class", "if",     "elif",    "else", "for",
      "while", "try", "except", "finally", "with"};
  return keywords;
}

const std::unordered_set<std::string> &StatementKeywords() {
  static const std::unordered_set<std::string> keywords = {
      "def",      "class",  "if",     "elif",   "else",   "for",
      "while",    "try",    "except", "finally", "with",  "return",
      "raise",    "break",  "continue", "import", "from", "global",
      "nonlocal", "pass",   "lambda", "yield",  "assert", "del",
      "await"};
  return keywords;
}

struct Statement {
  int indent = 0;
  int nesting_depth = 0;
  std::string keyword;
  BlockKind kind = BlockKind::kOther;
  bool in_loop = false;
  bool in_function = false;
};

class LineClassifier {
public:
  void Classify(const LexedLine &lexed, pyscan::LineContext &line,
                bool continuation, bool statement_ends) {
    const auto trimmed = Trim(line.code);
    const auto words = Words(line.code);

    if (!continuation) {
      OpenStatement(line, trimmed, words);
    } else {
      line.constructs.insert(Construct::kContinuation);
      line.nesting_depth = statement_.nesting_depth;
    }
    if (statement_.in_loop) {
      line.constructs.insert(Construct::kInLoopBody);
    }
    if (statement_.in_function) {
      line.constructs.insert(Construct::kInFunctionBody);
    }

    TagExpressions(lexed, line, words);

    if (statement_ends) {
      CloseStatement(lexed, line, trimmed);
    }
  }

  bool Decorated(std::size_t line_index) const {
    return decorated_.count(line_index) != 0;
  }

private:
  void OpenStatement(pyscan::LineContext &line, const std::string &trimmed,
                     const std::vector<std::string> &words) {
    while (!blocks_.empty() && blocks_.back().indent >= line.indent) {
      blocks_.pop_back();
    }
    statement_ = Statement{};
    statement_.indent = line.indent;
    statement_.nesting_depth = static_cast<int>(blocks_.size());
    for (const auto &block : blocks_) {
      statement_.in_loop = statement_.in_loop || block.kind == BlockKind::kLoop;
      statement_.in_function =
          statement_.in_function || block.kind == BlockKind::kFunction;
    }
    line.nesting_depth = statement_.nesting_depth;

    if (terminator_pending_ && line.indent == terminator_indent_) {
      line.constructs.insert(Construct::kUnreachable);
    }

    std::string keyword;
    if (!trimmed.empty() && IsIdentifierStart(trimmed.front()) &&
        !words.empty()) {
      keyword = words.front();
      if (keyword == "async" && words.size() > 1) {
        keyword = words[1];
      }
    }
    statement_.keyword = keyword;
    TagKeyword(line, trimmed, words, keyword);

    terminator_pending_ = line.Has(Construct::kReturn) ||
                          line.Has(Construct::kRaise) ||
                          line.Has(Construct::kLoopControl);
    terminator_indent_ = line.indent;

    const auto line_index = static_cast<std::size_t>(line.line_number - 1);
    if (line.Has(Construct::kDecorator)) {
      decorator_pending_ = true;
    } else {
      if (decorator_pending_ && (line.Has(Construct::kFunctionDef) ||
                                 line.Has(Construct::kClassDef))) {
        decorated_.insert(line_index);
      }
      decorator_pending_ = false;
    }
  }

  void TagKeyword(pyscan::LineContext &line, const std::string &trimmed,
                  const std::vector<std::string> &words,
                  const std::string &keyword) {
    auto &tags = line.constructs;
    if (trimmed.front() == '@') {
      tags.insert(Construct::kDecorator);
      return;
    }
    if (keyword == "def") {
      tags.insert(Construct::kFunctionDef);
      statement_.kind = BlockKind::kFunction;
      line.symbol = NameAfter(words, "def");
      if (line.code.find("->") != std::string::npos ||
          HasAnnotatedParameters(line.code)) {
        tags.insert(Construct::kTypeAnnotated);
      }
    } else if (keyword == "class") {
      tags.insert(Construct::kClassDef);
      statement_.kind = BlockKind::kClass;
      line.symbol = NameAfter(words, "class");
    } else if (keyword == "if" || keyword == "elif") {
      tags.insert(Construct::kConditional);
    } else if (keyword == "else") {
      tags.insert(Construct::kElseClause);
    } else if (keyword == "for" || keyword == "while") {
      tags.insert(Construct::kLoop);
      statement_.kind = BlockKind::kLoop;
    } else if (keyword == "try") {
      tags.insert(Construct::kTryBlock);
    } else if (keyword == "except") {
      tags.insert(Construct::kExceptionHandler);
      const auto clause = Trim(trimmed.substr(6));
      if (!clause.empty() && clause.front() == ':') {
        tags.insert(Construct::kBareExcept);
      } else if (clause.rfind("Exception", 0) == 0) {
        const auto rest = Trim(clause.substr(9));
        if (!rest.empty() && rest.front() == ':') {
          tags.insert(Construct::kBroadExceptUnused);
        }
      }
    } else if (keyword == "finally") {
      tags.insert(Construct::kFinallyClause);
    } else if (keyword == "return") {
      tags.insert(Construct::kReturn);
    } else if (keyword == "raise") {
      tags.insert(Construct::kRaise);
    } else if (keyword == "break" || keyword == "continue") {
      tags.insert(Construct::kLoopControl);
    } else if (keyword == "import" ||
               (keyword == "from" && Contains(words, "import"))) {
      tags.insert(Construct::kImport);
    } else if (keyword == "global") {
      tags.insert(Construct::kGlobalDeclaration);
    } else if (StatementKeywords().count(keyword) == 0) {
      const auto assignment = DetectAssignment(line.code);
      if (assignment.found) {
        tags.insert(Construct::kAssignment);
        if (assignment.augmented) {
          tags.insert(Construct::kAugmentedAssignment);
        } else if (IsSimpleName(assignment.target)) {
          line.symbol = assignment.target;
        }
      }
    }
  }

  void TagExpressions(const LexedLine &lexed, pyscan::LineContext &line,
                      const std::vector<std::string> &words) {
    auto &tags = line.constructs;
    const bool header = statement_.keyword == "if" ||
                        statement_.keyword == "elif" ||
                        statement_.keyword == "else";
    if (!header && Contains(words, "if") && Contains(words, "else")) {
      tags.insert(Construct::kConditionalExpression);
    }
    if (!line.Has(Construct::kLoop) && Contains(words, "for")) {
      tags.insert(Construct::kComprehension);
    }
    if (Contains(words, "lambda")) {
      tags.insert(Construct::kLambda);
    }
    for (const auto &word : words) {
      if (word == "and" || word == "or") {
        ++line.boolean_operators;
      }
    }
    if (lexed.has_string) {
      tags.insert(Construct::kStringLiteral);
    }
    if (lexed.started_in_string) {
      tags.insert(Construct::kMultilineString);
    }
    if (!lexed.comment.empty()) {
      tags.insert(Construct::kInlineComment);
    }
    if (lexed.has_separator) {
      tags.insert(Construct::kStatementSeparator);
    }
    if (lexed.unterminated_string) {
      tags.insert(Construct::kUnterminatedString);
    }
    if (lexed.unmatched_bracket) {
      tags.insert(Construct::kUnmatchedBracket);
    }
  }

  void CloseStatement(const LexedLine &lexed, pyscan::LineContext &line,
                      const std::string &trimmed) {
    if (BlockKeywords().count(statement_.keyword) == 0) {
      return;
    }
    if (!HasTopLevelColon(line.code, lexed.depth_at_start)) {
      line.constructs.insert(Construct::kMissingColon);
      return;
    }
    if (!trimmed.empty() && trimmed.back() == ':') {
      blocks_.push_back(OpenBlock{statement_.indent, statement_.kind});
    }
  }

  std::vector<OpenBlock> blocks_;
  Statement statement_;
  bool terminator_pending_ = false;
  int terminator_indent_ = 0;
  bool decorator_pending_ = false;
  std::unordered_set<std::size_t> decorated_;
};

bool CanBeUnused(const pyscan::LineContext &line) {
  if (line.symbol.empty() || line.symbol.front() == '_') {
    return false;
  }
  return line.Has(Construct::kFunctionDef) ||
         (line.Has(Construct::kAssignment) &&
          !line.Has(Construct::kAugmentedAssignment));
}

} // namespace

namespace pyscan {

std::vector<std::string> SplitPhysicalLines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

std::vector<LineContext> ExtractLines(const SourceUnit &unit) {
  const auto physical = SplitPhysicalLines(unit.text);
  std::vector<LineContext> lines;
  lines.reserve(physical.size());
  std::unordered_map<std::string, int> references;

  Lexer lexer;
  LineClassifier classifier;
  bool previous_backslash = false;
  int last_nesting = 0;

  for (std::size_t index = 0; index < physical.size(); ++index) {
    LineContext line;
    line.line_number = static_cast<int>(index) + 1;
    line.raw_text = physical[index];

    const auto lexed = lexer.Lex(line.raw_text, static_cast<int>(index));
    line.code = lexed.code;
    for (const auto &word : Words(lexed.code + " " + lexed.embedded)) {
      ++references[word];
    }

    const bool continuation = lexed.depth_at_start > 0 || previous_backslash ||
                              lexed.started_in_string;
    previous_backslash = lexed.ends_with_backslash;

    bool mixed = false;
    line.indent = MeasureIndent(line.raw_text, mixed);

    if (Trim(line.raw_text).empty()) {
      line.nesting_depth = last_nesting;
      lines.push_back(std::move(line));
      continue;
    }
    if (mixed) {
      line.constructs.insert(Construct::kMixedIndentation);
    }
    if (Trim(line.code).empty() && !lexed.started_in_string) {
      // Comment-only line; it does not open or close any block.
      line.constructs.insert(Construct::kComment);
      line.nesting_depth = last_nesting;
      lines.push_back(std::move(line));
      continue;
    }

    const bool statement_ends =
        lexer.Depth() == 0 && !lexed.ends_with_backslash && !lexer.InsideString();
    classifier.Classify(lexed, line, continuation, statement_ends);
    last_nesting = line.nesting_depth;
    lines.push_back(std::move(line));
  }

  for (const auto &open : lexer.OpenBrackets()) {
    lines[static_cast<std::size_t>(open.second)].constructs.insert(
        Construct::kUnclosedBracket);
  }
  if (lexer.InsideString() && lexer.OpenStringLine() >= 0) {
    lines[static_cast<std::size_t>(lexer.OpenStringLine())].constructs.insert(
        Construct::kUnterminatedString);
  }

  for (std::size_t index = 0; index < lines.size(); ++index) {
    auto &line = lines[index];
    if (CanBeUnused(line) && !classifier.Decorated(index) &&
        references[line.symbol] <= 1) {
      line.constructs.insert(Construct::kUnusedDefinition);
    }
  }
  return lines;
}

} // namespace pyscan
