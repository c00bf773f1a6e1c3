#include "cli/stamp.hpp"
#include "gitident/config.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_var(int argc, char **argv) {
  gitident::cli::StampOptions opts;
  bool debug = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--date" && i + 1 < argc) {
      opts.date = argv[++i];
    } else if (a == "--zone" && i + 1 < argc) {
      opts.zone = argv[++i];
    } else if (a == "--debug") {
      debug = true;
    } else {
      std::cerr << "usage: gitident var [--date <millis>] [--zone <id>] [--debug]\n";
      return 2;
    }
  }

  try {
    const auto cfg = gitident::load_user_config(std::filesystem::current_path());
    const auto ident = gitident::cli::stamp_ident(cfg, opts);
    std::cout << (debug ? ident.to_string() : ident.to_external_string()) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "var: " << e.what() << "\n";
    return 1;
  }
}
