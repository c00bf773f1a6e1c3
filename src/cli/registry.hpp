#pragma once
#include <string>

namespace gitident::cli {

// argv[0] is the command name itself.
using command_fn = int (*)(int argc, char **argv);

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitident::cli
