#include "gitident/config.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_config(int argc, char **argv) {
  const std::filesystem::path root = std::filesystem::current_path();
  gitident::UserConfig updates;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--name" && i + 1 < argc) {
      updates.name = argv[++i];
    } else if (a == "--email" && i + 1 < argc) {
      updates.email = argv[++i];
    } else {
      std::cerr << "usage: gitident config [--name <name>] [--email <email>]\n";
      return 2;
    }
  }

  try {
    gitident::UserConfig cfg = gitident::load_user_config(root);
    if (!updates.name && !updates.email) {
      if (cfg.name)
        std::cout << "name: " << *cfg.name << "\n";
      if (cfg.email)
        std::cout << "email: " << *cfg.email << "\n";
      return 0;
    }
    if (updates.name)
      cfg.name = updates.name;
    if (updates.email)
      cfg.email = updates.email;
    gitident::save_user_config(root, cfg);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}
