#include "gitident/commit.hpp"
#include "gitident/consts.hpp"
#include "gitident/fs.hpp"
#include "gitident/hash.hpp"
#include "gitident/object.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitident_commit_" + std::to_string(std::random_device{}()));

  try {
    if (gitident::to_hex(gitident::sha1("abc")) != "a9993e364706816aba3e25717850c26c9cd0d89d") {
      std::cerr << "sha1(abc) mismatch\n";
      return 1;
    }
    if (gitident::object_id(gitident::consts::kTypeBlob, "hello\n") !=
        "ce013625030ba8dba906f756967f9e9ca394464a") {
      std::cerr << "blob id mismatch\n";
      return 1;
    }

    const std::string empty_tree = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";
    const gitident::CommitData commit{
        .tree_hex = empty_tree,
        .parents = {},
        .author = gitident::PersonIdent{"A U Thor", "author@example.com", 1142878449000LL, -300},
        .committer =
            gitident::PersonIdent{"C O Mitter", "committer@example.com", 1142878449000LL, -300},
        .message = "initial\n"};

    const std::string payload = gitident::format_commit(commit);
    const std::string want = "tree " + empty_tree + "\n" +
                             "author A U Thor <author@example.com> 1142878449 -0500\n"
                             "committer C O Mitter <committer@example.com> 1142878449 -0500\n"
                             "\n"
                             "initial\n";
    if (payload != want) {
      std::cerr << "payload mismatch:\n" << payload << "\n";
      return 1;
    }
    // same id git hash-object -t commit gives for this payload
    const std::string id = gitident::commit_id(commit);
    if (id != "45cbcdc8d138a3265e570b9dfc05c7ae7ec79298") {
      std::cerr << "commit id mismatch: " << id << "\n";
      return 1;
    }

    // a parent line per parent, in order
    gitident::CommitData child = commit;
    child.parents = {id, std::string(40, 'a')};
    const std::string child_payload = gitident::format_commit(child);
    if (child_payload.find("tree " + empty_tree + "\nparent " + id + "\nparent " +
                           std::string(40, 'a') + "\nauthor ") != 0) {
      std::cerr << "parents not written in order\n";
      return 1;
    }

    // sanitized idents can't break the header layout
    gitident::CommitData hostile = commit;
    hostile.author = gitident::PersonIdent{"Eve\ncommitter x", "<eve>", 0, 0};
    if (gitident::format_commit(hostile).find("author Evecommitter x <eve> 0 +0000\n") ==
        std::string::npos) {
      std::cerr << "hostile author not sanitized\n";
      return 1;
    }

    bool threw = false;
    try {
      gitident::CommitData bad = commit;
      bad.parents = {"not-a-hash"};
      (void)gitident::format_commit(bad);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "bad parent accepted\n";
      return 1;
    }

    // loose object on disk decodes back to the payload
    const std::string written =
        gitident::write_loose_object(root, gitident::consts::kTypeCommit, payload);
    if (written != id) {
      std::cerr << "written id mismatch\n";
      return 1;
    }
    const auto path = gitident::loose_object_path(root, id);
    if (path != root / ".gitident" / "objects" / "45" / "cbcdc8d138a3265e570b9dfc05c7ae7ec79298") {
      std::cerr << "unexpected object path " << path << "\n";
      return 1;
    }
    const auto obj = gitident::decode_loose_object(gitident::fs::read_file(path));
    if (obj.type != "commit" || std::string(obj.data.begin(), obj.data.end()) != payload) {
      std::cerr << "decoded object mismatch\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
