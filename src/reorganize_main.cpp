#include <reorg/cli_exit_codes.h>
#include <reorg/reorganize_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return reorg::RunReorganize(arguments);
  } catch (const std::invalid_argument &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    reorg::PrintUsage(std::cerr);
    return reorg::kExitFatal;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return reorg::kExitFatal;
  }
}
