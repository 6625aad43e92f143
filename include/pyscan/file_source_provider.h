#pragma once

#include <pyscan/interfaces.h>
#include <pyscan/logging.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace pyscan {

// Resolves CLI locations into source units. A file is read as is, a
// directory contributes every .py file below it in sorted order, and "-"
// reads the input stream under the name "<stdin>".
class FileSourceProvider : public SourceProvider {
public:
  FileSourceProvider();
  FileSourceProvider(std::istream &input, std::shared_ptr<Logger> logger);

  std::vector<SourceUnit>
  Acquire(const std::vector<std::string> &locations) override;

private:
  std::istream *input_;
  std::shared_ptr<Logger> logger_;
};

// Sorted .py files below root; hidden, __pycache__ and virtualenv
// directories are skipped.
std::vector<std::filesystem::path>
CollectPythonFiles(const std::filesystem::path &root);
SourceUnit ReadSourceFile(const std::filesystem::path &path);

} // namespace pyscan
