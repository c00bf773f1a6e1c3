#pragma once
#include "gitident/person_ident.hpp"

#include <string>
#include <vector>

namespace gitident {

struct CommitData {
  std::string tree_hex;
  std::vector<std::string> parents; // zero or more parents (40-hex each)
  PersonIdent author;
  PersonIdent committer;
  std::string message;              // raw message (may contain newlines)
};

// Serialize the commit payload (no object header):
//   tree <hex>
//   parent <hex>        (one per parent)
//   author <ident>
//   committer <ident>
//
//   <message>
// Throws std::invalid_argument if tree or a parent is not 40-hex.
[[nodiscard]] auto format_commit(const CommitData &commit) -> std::string;

[[nodiscard]] auto commit_id(const CommitData &commit) -> std::string;

} // namespace gitident
