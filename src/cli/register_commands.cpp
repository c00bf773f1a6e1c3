#include "cli/registry.hpp"

int cmd_config(int argc, char **argv);
int cmd_var(int argc, char **argv);
int cmd_commit_tree(int argc, char **argv);

namespace gitident::cli {

void register_all_commands() {
  register_command("config", ::cmd_config,
                   "Show or set the committer: gitident config [--name <n>] [--email <e>]");
  register_command("var", ::cmd_var,
                   "Print the committer ident: gitident var [--date <ms>] [--zone <id>] [--debug]");
  register_command("commit-tree", ::cmd_commit_tree,
                   "Stamp a commit: gitident commit-tree <tree> [-p <parent>]... -m <msg> [-w]"
                   " [--date <ms>] [--zone <id>]");
}

} // namespace gitident::cli
