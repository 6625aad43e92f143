#include <pyscan/rule_pack_loader.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

namespace {

const std::set<std::string> &SupportedRuleKeys() {
  static const std::set<std::string> keys = {
      "id",  "category", "severity", "pattern", "ignore_case",
      "cwe", "description", "fix"};
  return keys;
}

std::string RequireString(const YAML::Node &entry, const std::string &key,
                          const std::string &context) {
  const auto node = entry[key];
  if (!node) {
    throw std::invalid_argument(context + ": missing '" + key + "'");
  }
  if (!node.IsScalar()) {
    throw std::invalid_argument(context + ": '" + key + "' must be a string");
  }
  return node.as<std::string>();
}

std::optional<std::string> OptionalString(const YAML::Node &entry,
                                          const std::string &key,
                                          const std::string &context) {
  const auto node = entry[key];
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    throw std::invalid_argument(context + ": '" + key + "' must be a string");
  }
  return node.as<std::string>();
}

bool OptionalBool(const YAML::Node &entry, const std::string &key,
                  const std::string &context) {
  const auto node = entry[key];
  if (!node) {
    return false;
  }
  try {
    return node.as<bool>();
  } catch (const YAML::Exception &) {
    throw std::invalid_argument(context + ": '" + key + "' must be a boolean");
  }
}

pyscan::Rule ParseRuleEntry(const YAML::Node &entry,
                            const std::string &source_name,
                            std::size_t position) {
  auto context = source_name + " rule #" + std::to_string(position + 1);
  if (!entry.IsMap()) {
    throw std::invalid_argument(context + ": entry must be a mapping");
  }
  for (const auto &field : entry) {
    const auto key = field.first.as<std::string>();
    if (SupportedRuleKeys().count(key) == 0) {
      throw std::invalid_argument(context + ": unknown key '" + key + "'");
    }
  }

  const auto id = RequireString(entry, "id", context);
  context = source_name + " rule '" + id + "'";
  try {
    return pyscan::Rule{
        .id = id,
        .category =
            pyscan::ParseCategory(RequireString(entry, "category", context)),
        .severity =
            pyscan::ParseSeverity(RequireString(entry, "severity", context)),
        .matcher = pyscan::MakePattern(
            RequireString(entry, "pattern", context),
            OptionalBool(entry, "ignore_case", context)),
        .cwe_id = OptionalString(entry, "cwe", context),
        .description_template = RequireString(entry, "description", context),
        .fix_template = OptionalString(entry, "fix", context)};
  } catch (const std::invalid_argument &error) {
    const std::string message = error.what();
    if (message.rfind(context, 0) == 0) {
      throw;
    }
    throw std::invalid_argument(context + ": " + message);
  }
}

} // namespace

namespace pyscan {

std::vector<Rule> ParseRulePack(const std::string &yaml_text,
                                const std::string &source_name) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument(source_name + ": " + error.what());
  }
  if (!root.IsMap() || !root["rules"]) {
    throw std::invalid_argument(source_name +
                                ": rule pack must contain a 'rules' list");
  }
  const auto entries = root["rules"];
  if (!entries.IsSequence()) {
    throw std::invalid_argument(source_name + ": 'rules' must be a list");
  }

  std::vector<Rule> rules;
  rules.reserve(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    rules.push_back(ParseRuleEntry(entries[i], source_name, i));
  }
  return rules;
}

std::vector<Rule> LoadRulePack(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Rule pack not found: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open rule pack: " + path.string());
  }
  const std::string text((std::istreambuf_iterator<char>(stream)),
                         std::istreambuf_iterator<char>());
  return ParseRulePack(text, path.string());
}

} // namespace pyscan
