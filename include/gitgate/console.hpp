#pragma once
#include "gitgate/session.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

class IdentityStore;
class Logger;
class RepoTable;

/**
 * Line-oriented administration console:
 *
 *   repo list | create <name> | delete <name>
 *        | adduser <repo> <user> <r|rw> | deluser <repo> <user>
 *   user list | create <name> | delete <name>
 *        | addkey <name> <pubkey> | delkey <name> <fingerprint> | keys <name>
 *   help | quit
 *
 * The reserved "guest" entry is policed here: it can be granted read only,
 * and can never be created or deleted as a user. Both tables are saved
 * after every successful change.
 */
class AdminConsole : public Console {
public:
  AdminConsole(IdentityStore &ids, RepoTable &repos, std::filesystem::path users_file,
               std::filesystem::path repos_file, Logger &log);

  void run(SessionIo &io) override;

  // Execute one command line. Returns false when the session should end.
  bool execute(std::string_view line, SessionIo &io);

private:
  void show_help(SessionIo &io);
  void handle_repo(const std::vector<std::string> &args, SessionIo &io);
  void handle_user(const std::vector<std::string> &args, SessionIo &io);
  void save(SessionIo &io);

  IdentityStore &ids_;
  RepoTable &repos_;
  std::filesystem::path users_file_;
  std::filesystem::path repos_file_;
  Logger &log_;
};

// Read one line with minimal editing (echo, backspace). Returns
// std::nullopt on Ctrl-C, on Ctrl-D at an empty line, or at end of input.
std::optional<std::string> read_line(SessionIo &io);

} // namespace gitgate
