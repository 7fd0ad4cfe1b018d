#pragma once
#include "gitgate/command.hpp"
#include "gitgate/identity.hpp"
#include "gitgate/session_io.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gitgate {

class Logger;
class RepoTable;

// The administrative plane reached by an admin session without a command.
class Console {
public:
  virtual ~Console() = default;
  virtual void run(SessionIo &io) = 0;
};

// Runs one authorized git operation with the session wired to its streams.
class GitExecutor {
public:
  virtual ~GitExecutor() = default;
  // Returns the operation's exit status; throws if it cannot be started.
  virtual int execute(const Command &cmd, const std::filesystem::path &repo_dir,
                      SessionIo &io) = 0;
};

// Spawns git-upload-pack / git-receive-pack <repo_dir> directly.
class ProcessGitExecutor : public GitExecutor {
public:
  explicit ProcessGitExecutor(std::string git_bin_dir = {});
  int execute(const Command &cmd, const std::filesystem::path &repo_dir, SessionIo &io) override;

private:
  std::string git_bin_dir_;
};

/**
 * Per-connection decision: console, git operation, or rejection.
 *
 *   no command   -> console, admin only
 *   command      -> parse, check permission, check the repository exists on
 *                   disk, execute; admins are refused
 *
 * route() never throws; every failure becomes a message to the client and
 * a non-zero exit status.
 */
class SessionRouter {
public:
  SessionRouter(const RepoTable &repos, Console &console, GitExecutor &git, Logger &log);

  int route(const Identity &who, std::string_view raw_command, SessionIo &io);

  // Interactive terminals are for the administrator only.
  [[nodiscard]] static auto allow_pty(const Identity &who) -> bool { return who.is_admin(); }

private:
  int run_console(const Identity &who, SessionIo &io);
  int run_git(const Identity &who, std::string_view raw_command, SessionIo &io);

  const RepoTable &repos_;
  Console &console_;
  GitExecutor &git_;
  Logger &log_;
};

} // namespace gitgate
