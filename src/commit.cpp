#include "gitident/commit.hpp"

#include "gitident/consts.hpp"
#include "gitident/hash.hpp"
#include "gitident/object.hpp"

#include <stdexcept>

namespace {

void append_header(std::string &txt, std::string_view prefix, std::string_view value) {
  txt.append(prefix);
  txt.append(value);
  txt.push_back(gitident::consts::kLF);
}

} // namespace

namespace gitident {

auto format_commit(const CommitData &commit) -> std::string {
  if (!looks_hex40(commit.tree_hex)) {
    throw std::invalid_argument("commit: bad tree id: " + commit.tree_hex);
  }
  std::string txt;
  append_header(txt, consts::kTreePrefix, commit.tree_hex);

  for (const auto &p : commit.parents) {
    if (!looks_hex40(p)) {
      throw std::invalid_argument("commit: bad parent id: " + p);
    }
    append_header(txt, consts::kParentPrefix, p);
  }

  append_header(txt, consts::kAuthorPrefix, commit.author.to_external_string());
  append_header(txt, consts::kCommitterPrefix, commit.committer.to_external_string());
  txt.push_back(consts::kLF);
  txt += commit.message;
  return txt;
}

auto commit_id(const CommitData &commit) -> std::string {
  return object_id(consts::kTypeCommit, format_commit(commit));
}

} // namespace gitident
