#include <intent/intent_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: intent-analyze <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Analyze one JavaScript/TypeScript file (default if no "
         "command is given).\n\n"
      << "Run 'intent-analyze analyze --help' for analysis options.\n";
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

    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }

    if (command == "analyze") {
      const std::vector<std::string> analyze_arguments(
          arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
          arguments.end());
      return intent::RunAnalyze(analyze_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return 1;
  }
}
