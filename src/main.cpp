#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  gitident::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    gitident::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    gitident::cli::print_usage();
    return 0;
  }

  const auto fn = gitident::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "gitident: '" << cmd << "' is not a command\n";
    gitident::cli::print_usage();
    return 2;
  }
  // argv[0] of the handler is the command name
  return fn(argc - 1, argv + 1);
}
