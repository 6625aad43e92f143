#include <pyscan/escaping.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace pyscan {

std::string EscapeJson(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      continue;
    case '\\':
      escaped.append("\\\\");
      continue;
    case '\n':
      escaped.append("\\n");
      continue;
    case '\r':
      escaped.append("\\r");
      continue;
    case '\t':
      escaped.append("\\t");
      continue;
    default:
      break;
    }
    const auto byte = static_cast<unsigned char>(character);
    if (byte < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x", byte);
      escaped.append(buffer);
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
      continue;
    }
    if (character == '\n' || character == '\r') {
      escaped.push_back(' ');
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string TruncateForDisplay(const std::string &value, std::size_t limit) {
  if (value.size() <= limit) {
    return value;
  }
  auto cut = limit;
  // Do not split a UTF-8 sequence.
  while (cut > 0 &&
         (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return value.substr(0, cut) + "...";
}

std::vector<std::string> SplitList(const std::string &raw, char delimiter) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  std::vector<std::string> values;
  std::string current;
  const auto flush = [&]() {
    current.erase(current.begin(),
                  std::find_if(current.begin(), current.end(),
                               [&](unsigned char ch) { return !is_space(ch); }));
    current.erase(std::find_if(current.rbegin(), current.rend(),
                               [&](unsigned char ch) { return !is_space(ch); })
                      .base(),
                  current.end());
    if (!current.empty()) {
      values.push_back(current);
    }
    current.clear();
  };
  for (const auto character : raw) {
    if (character == delimiter) {
      flush();
    } else {
      current.push_back(character);
    }
  }
  flush();
  return values;
}

} // namespace pyscan
