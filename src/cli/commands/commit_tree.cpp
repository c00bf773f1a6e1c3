#include "cli/stamp.hpp"
#include "gitident/commit.hpp"
#include "gitident/config.hpp"
#include "gitident/consts.hpp"
#include "gitident/object.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_commit_tree(int argc, char **argv) {
  // gitident commit-tree <tree> [-p <parent>]... -m <message> [-w] [--date <ms>] [--zone <id>]
  gitident::cli::StampOptions opts;
  std::string tree;
  std::vector<std::string> parents;
  std::string message;
  bool write = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; a == "-p" && i + 1 < argc) {
      parents.emplace_back(argv[++i]);
    } else if ((a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    } else if (a == "--date" && i + 1 < argc) {
      opts.date = argv[++i];
    } else if (a == "--zone" && i + 1 < argc) {
      opts.zone = argv[++i];
    } else if (a == "-w") {
      write = true;
    } else if (tree.empty() && !a.starts_with("-")) {
      tree = a;
    } else {
      tree.clear();
      break;
    }
  }
  if (tree.empty() || message.empty()) {
    std::cerr << "usage: gitident commit-tree <tree> [-p <parent>]... -m <message> [-w]"
                 " [--date <millis>] [--zone <id>]\n";
    return 2;
  }

  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const auto cfg = gitident::load_user_config(root);
    const auto ident = gitident::cli::stamp_ident(cfg, opts);

    // append newline like Git usually stores
    const gitident::CommitData commit{.tree_hex = tree,
                                      .parents = parents,
                                      .author = ident,
                                      .committer = ident,
                                      .message = message + "\n"};
    const std::string payload = gitident::format_commit(commit);
    const std::string id = write ? gitident::write_loose_object(root, gitident::consts::kTypeCommit,
                                                                payload)
                                 : gitident::object_id(gitident::consts::kTypeCommit, payload);
    std::cout << id << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit-tree: " << e.what() << "\n";
    return 1;
  }
}
