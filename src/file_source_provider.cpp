#include <pyscan/file_source_provider.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

namespace pyscan {

namespace {
constexpr const char kStdinLocation[] = "-";
constexpr const char kStdinName[] = "<stdin>";

bool IsSkippedDirectory(const std::filesystem::path &path) {
  static const std::set<std::string> kSkipped = {"__pycache__", "venv",
                                                  "node_modules"};
  const auto name = path.filename().string();
  return (name.size() > 1 && name.front() == '.') || kSkipped.count(name) > 0;
}

bool IsPythonFile(const std::filesystem::directory_entry &entry) {
  return entry.is_regular_file() && entry.path().extension() == ".py";
}
} // namespace

std::vector<std::filesystem::path>
CollectPythonFiles(const std::filesystem::path &root) {
  std::vector<std::filesystem::path> files;
  for (std::filesystem::recursive_directory_iterator it(root), end; it != end;
       ++it) {
    const auto &entry = *it;
    if (entry.is_directory() && IsSkippedDirectory(entry.path())) {
      it.disable_recursion_pending();
      continue;
    }
    if (IsPythonFile(entry)) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

SourceUnit ReadSourceFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open source file: " + path.string());
  }
  SourceUnit unit;
  unit.text.assign(std::istreambuf_iterator<char>(stream),
                   std::istreambuf_iterator<char>());
  unit.filename = path.generic_string();
  return unit;
}

FileSourceProvider::FileSourceProvider()
    : FileSourceProvider(std::cin, nullptr) {}

FileSourceProvider::FileSourceProvider(std::istream &input,
                                       std::shared_ptr<Logger> logger)
    : input_(&input), logger_(EnsureLogger(std::move(logger))) {}

std::vector<SourceUnit>
FileSourceProvider::Acquire(const std::vector<std::string> &locations) {
  std::vector<SourceUnit> units;
  for (const auto &location : locations) {
    if (location == kStdinLocation) {
      SourceUnit unit;
      unit.text.assign(std::istreambuf_iterator<char>(*input_),
                       std::istreambuf_iterator<char>());
      unit.filename = kStdinName;
      units.push_back(std::move(unit));
      continue;
    }

    const std::filesystem::path path(location);
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("Source path not found: " + location);
    }
    if (std::filesystem::is_directory(path)) {
      const auto files = CollectPythonFiles(path);
      logger_->Log(LogLevel::kDebug, "sources.directory",
                   {{"path", path.generic_string()},
                    {"files", std::to_string(files.size())}});
      for (const auto &file : files) {
        units.push_back(ReadSourceFile(file));
      }
      continue;
    }
    units.push_back(ReadSourceFile(path));
  }

  if (units.empty()) {
    throw std::runtime_error("No Python source files found");
  }
  logger_->Log(LogLevel::kInfo, "sources.collected",
               {{"count", std::to_string(units.size())}});
  return units;
}

} // namespace pyscan
