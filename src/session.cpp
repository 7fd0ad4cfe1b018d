#include "gitgate/session.hpp"

#include "gitgate/fs.hpp"
#include "gitgate/log.hpp"
#include "gitgate/process.hpp"
#include "gitgate/repo.hpp"

#include <utility>

namespace gitgate {

namespace {

[[nodiscard]] auto describe(const Identity &who) -> std::string {
  switch (who.kind) {
  case IdentityClass::Admin:
    return "admin";
  case IdentityClass::Normal:
    return "user " + who.name;
  case IdentityClass::Unknown:
    break;
  }
  return "unknown key";
}

} // namespace

ProcessGitExecutor::ProcessGitExecutor(std::string git_bin_dir)
    : git_bin_dir_(std::move(git_bin_dir)) {}

int ProcessGitExecutor::execute(const Command &cmd, const std::filesystem::path &repo_dir,
                                SessionIo &io) {
  std::string program{cmd.program()};
  if (!git_bin_dir_.empty())
    program = (std::filesystem::path(git_bin_dir_) / program).string();
  process::Child child = process::spawn({program, repo_dir.string()});
  return process::pump(child, io);
}

SessionRouter::SessionRouter(const RepoTable &repos, Console &console, GitExecutor &git,
                             Logger &log)
    : repos_(repos), console_(console), git_(git), log_(log) {}

int SessionRouter::route(const Identity &who, std::string_view raw_command, SessionIo &io) {
  try {
    if (raw_command.empty())
      return run_console(who, io);
    return run_git(who, raw_command, io);
  } catch (const std::exception &e) {
    log_.error("session (" + describe(who) + "): " + e.what());
    return 1;
  }
}

int SessionRouter::run_console(const Identity &who, SessionIo &io) {
  if (!who.is_admin()) {
    log_.info("console refused for " + describe(who));
    io.println("Access denied: admin only");
    return 1;
  }
  log_.info("admin console opened");
  console_.run(io);
  log_.info("admin console closed");
  return 0;
}

int SessionRouter::run_git(const Identity &who, std::string_view raw_command, SessionIo &io) {
  if (who.is_admin()) {
    io.println("Access denied: admins cannot perform Git operations");
    return 1;
  }

  Command cmd;
  try {
    cmd = parse_command(raw_command);
  } catch (const CommandError &e) {
    log_.info("rejected command from " + describe(who) + ": " + e.what());
    io.println(std::string("Error: ") + e.what());
    return 1;
  }

  // Unknown keys carry an empty name and can only pass through guest read.
  const std::string user = who.kind == IdentityClass::Normal ? who.name : std::string{};
  if (!repos_.check_permission(cmd.repo_path, user, cmd.is_write)) {
    log_.info("permission denied: " + describe(who) + " " + std::string(cmd.program()) + " " +
              cmd.repo_path);
    io.println("Access denied: insufficient permissions");
    return 1;
  }

  const auto repo_dir = repos_.repo_path(cmd.repo_path);
  if (!fs::exists(repo_dir)) {
    io.println("Error: repository does not exist");
    return 1;
  }

  log_.info(describe(who) + ": " + std::string(cmd.program()) + " " + cmd.repo_path);
  const int status = git_.execute(cmd, repo_dir, io);
  if (status != 0)
    log_.error(std::string(cmd.program()) + " " + cmd.repo_path + " exited with status " +
              std::to_string(status));
  return status;
}

} // namespace gitgate
