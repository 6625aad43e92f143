#include <pyscan/pyscan_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: pyscan <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Scan Python sources (default if no command is given).\n"
      << "  compare   Compare the analysis of two versions of a file.\n"
      << "  rules     List the rule catalog.\n\n"
      << "Run 'pyscan <command> --help' for command options.\n";
}

bool IsCommand(const std::string &argument) {
  return argument == "analyze" || argument == "compare" || argument == "rules";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return 0;
    }

    // A leading path is an implicit analyze.
    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && IsCommand(arguments.front())) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "compare") {
      return pyscan::RunCompare(command_arguments, std::cout);
    }
    if (command == "rules") {
      return pyscan::RunRules(command_arguments, std::cout);
    }
    return pyscan::RunAnalyze(command_arguments, std::cout);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return 1;
  }
}
