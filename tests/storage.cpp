#include "gitgate/storage.hpp"
#include "support.hpp"

#include <iostream>
#include <string>

namespace storage = gitgate::storage;

static int fail(const std::string &msg) {
  std::cerr << msg << "\n";
  return 1;
}

int main() {
  try {
    const auto users = storage::parse_users("# users\n"
                                            "key: ssh-ed25519 AAAA orphan\n"
                                            "user: alice\n"
                                            "key: ssh-ed25519 AAAA one\n"
                                            "\n"
                                            "key:   ssh-ed25519 BBBB two  \n"
                                            "user: bob\n");
    if (users.size() != 2)
      return fail("expected 2 user records, got " + std::to_string(users.size()));
    if (users[0].name != "alice" || users[0].keys.size() != 2 ||
        users[0].keys[1] != "ssh-ed25519 BBBB two")
      return fail("alice record mismatch");
    if (users[1].name != "bob" || !users[1].keys.empty())
      return fail("bob record mismatch");

    if (storage::format_users(users) != "user: alice\n"
                                        "key: ssh-ed25519 AAAA one\n"
                                        "key: ssh-ed25519 BBBB two\n"
                                        "user: bob\n")
      return fail("format_users mismatch:\n" + storage::format_users(users));

    const auto repos = storage::parse_repos("path: /orphan\n"
                                            "repo: proj\n"
                                            "path: /srv/repos/proj.git\n"
                                            "perm: alice rw\n"
                                            "perm: guest r\n"
                                            "perm: broken\n"
                                            "repo: other\n");
    if (repos.size() != 2)
      return fail("expected 2 repo records");
    if (repos[0].name != "proj" || repos[0].path != "/srv/repos/proj.git")
      return fail("proj record mismatch");
    if (repos[0].users.size() != 2 || repos[0].users.at("alice") != "rw" ||
        repos[0].users.at("guest") != "r")
      return fail("proj permissions mismatch");
    if (repos[1].name != "other" || !repos[1].path.empty())
      return fail("other record mismatch");

    testsupport::TempDir tmp{"storage"};
    if (!storage::load_users(tmp.path() / "none.txt").empty())
      return fail("missing users file not empty");
    if (!storage::load_repos(tmp.path() / "none.txt").empty())
      return fail("missing repos file not empty");

    const auto file = tmp.path() / "sub" / "repos.txt";
    storage::save_repos(file, repos);
    const auto back = storage::load_repos(file);
    if (back.size() != 2 || back[0].users != repos[0].users)
      return fail("repos did not survive save/load");
  } catch (const std::exception &e) {
    return fail(std::string("exception: ") + e.what());
  }
  std::cout << "storage test OK\n";
  return 0;
}
