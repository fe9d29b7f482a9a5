#include <codestat/cli.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return codestat::RunCli(arguments, std::cout, std::clog);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    std::cerr << "Run 'codestat --help' for usage.\n";
    return codestat::kExitFailure;
  }
}
