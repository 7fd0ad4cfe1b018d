#include "gitgate/command.hpp"

#include <iostream>
#include <string>

using gitgate::CommandError;
using gitgate::GitOp;

static int fail(const std::string &msg) {
  std::cerr << msg << "\n";
  return 1;
}

// Returns the error kind raised for `raw`, or -1 if it parsed.
static int error_kind(std::string_view raw) {
  try {
    (void)gitgate::parse_command(raw);
  } catch (const CommandError &e) {
    return static_cast<int>(e.kind());
  }
  return -1;
}

int main() {
  try {
    auto cmd = gitgate::parse_command("git-upload-pack '/proj.git'");
    if (cmd.op != GitOp::UploadPack || cmd.repo_path != "proj.git" || cmd.is_write)
      return fail("upload-pack '/proj.git' mismatch: " + cmd.repo_path);
    if (cmd.program() != "git-upload-pack")
      return fail("program mismatch");

    cmd = gitgate::parse_command("git-receive-pack '/a/b/c.git'");
    if (cmd.op != GitOp::ReceivePack || cmd.repo_path != "a/b/c.git" || !cmd.is_write)
      return fail("receive-pack '/a/b/c.git' mismatch");

    cmd = gitgate::parse_command("git-upload-pack \"team/x_y-z.git\"");
    if (cmd.repo_path != "team/x_y-z.git")
      return fail("double-quoted path mismatch");

    cmd = gitgate::parse_command("git-upload-pack proj.git\n");
    if (cmd.repo_path != "proj.git")
      return fail("bare path mismatch");

    const int format = static_cast<int>(CommandError::Kind::Format);
    const int disallowed = static_cast<int>(CommandError::Kind::Disallowed);
    const int invalid = static_cast<int>(CommandError::Kind::InvalidPath);

    struct Case {
      const char *raw;
      int kind;
    };
    const Case cases[] = {
        {"", format},
        {"git-upload-pack", format},
        {"ls -la", disallowed},
        {"git-upload-archive 'proj.git'", disallowed},
        {"sh -c 'git-upload-pack proj.git'", disallowed},
        {"git-upload-pack '/../../etc/passwd'", invalid},
        {"git-upload-pack '//proj.git'", invalid},
        {"git-upload-pack 'proj'", invalid},
        {"git-upload-pack 'my proj.git'", invalid},
        {"git-upload-pack 'proj.git; rm -rf /'", invalid},
        {"git-upload-pack 'a/../b.git'", invalid},
        {"git-receive-pack '$(id).git'", invalid},
    };
    for (const auto &c : cases) {
      const int got = error_kind(c.raw);
      if (got != c.kind)
        return fail(std::string("'") + c.raw + "': expected kind " + std::to_string(c.kind) +
                    ", got " + std::to_string(got));
    }

    try {
      (void)gitgate::parse_command("rm -rf /");
      return fail("rm accepted");
    } catch (const CommandError &e) {
      if (std::string(e.what()) != "command not allowed: rm")
        return fail(std::string("unexpected message: ") + e.what());
    }
  } catch (const std::exception &e) {
    return fail(std::string("exception: ") + e.what());
  }
  std::cout << "command parse test OK\n";
  return 0;
}
