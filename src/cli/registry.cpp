#include "cli/registry.hpp"

#include <iostream>
#include <map>

namespace gitident::cli {

namespace {

struct entry {
  command_fn fn;
  std::string help;
};

std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table().insert_or_assign(name, entry{.fn = fn, .help = help});
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: gitident <command> [args]\n\ncommands:\n";
  for (const auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
}

} // namespace gitident::cli
