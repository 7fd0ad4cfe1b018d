#include "gitgate/console.hpp"

#include "gitgate/consts.hpp"
#include "gitgate/identity.hpp"
#include "gitgate/log.hpp"
#include "gitgate/pubkey.hpp"
#include "gitgate/repo.hpp"
#include "gitgate/util.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace gitgate {

namespace {

constexpr char kCtrlC = 3;
constexpr char kCtrlD = 4;
constexpr char kBackspace = '\b';
constexpr char kDelete = 127;

constexpr std::string_view kHelp[] = {
    "repo list                         - List all repositories",
    "repo create <name>                - Create a repository",
    "repo delete <name>                - Delete a repository",
    "repo adduser <repo> <user> <r|rw> - Add user to repository (r=read, rw=read-write)",
    "repo deluser <repo> <user>        - Remove user from repository",
    "user list                         - List all users",
    "user create <name>                - Create a user",
    "user delete <name>                - Delete a user",
    "user addkey <name> <pubkey>       - Add SSH key to user",
    "user delkey <name> <fingerprint>  - Remove SSH key from user",
    "user keys <name>                  - List user's SSH keys",
    "help                              - Show this help",
    "quit                              - Exit",
    "",
    "Note: \"guest\" is a built-in user for read-only access. Add guest to a repo",
    "      with \"repo adduser <repo> guest r\" to let anyone read it.",
};

[[nodiscard]] auto is_guest(std::string_view name) -> bool { return name == consts::kGuestName; }

} // namespace

std::optional<std::string> read_line(SessionIo &io) {
  std::string line;
  std::array<std::uint8_t, 1> buf{};
  for (;;) {
    const long n = io.read(buf, -1);
    if (n == SessionIo::kEof)
      return std::nullopt;
    if (n == 0)
      continue;

    const char ch = static_cast<char>(buf[0]);
    switch (ch) {
    case consts::kCR:
    case consts::kLF:
      io.print("\r\n");
      return line;
    case kDelete:
    case kBackspace:
      if (!line.empty()) {
        line.pop_back();
        io.print("\b \b");
      }
      break;
    case kCtrlC:
      io.print("^C\r\n");
      return std::nullopt;
    case kCtrlD:
      if (line.empty())
        return std::nullopt;
      break;
    default:
      if (ch >= 32 && ch < 127) {
        line.push_back(ch);
        io.print(std::string_view(&ch, 1));
      }
      break;
    }
  }
}

AdminConsole::AdminConsole(IdentityStore &ids, RepoTable &repos, std::filesystem::path users_file,
                           std::filesystem::path repos_file, Logger &log)
    : ids_(ids), repos_(repos), users_file_(std::move(users_file)),
      repos_file_(std::move(repos_file)), log_(log) {}

void AdminConsole::run(SessionIo &io) {
  io.println("");
  io.println("gitgate administration console");
  io.println("");
  show_help(io);

  for (;;) {
    io.print("\r\nadmin> ");
    const auto line = read_line(io);
    if (!line)
      return;
    if (!execute(*line, io))
      return;
  }
}

bool AdminConsole::execute(std::string_view line, SessionIo &io) {
  auto args = strutil::fields(line);
  if (args.empty())
    return true;
  const std::string cmd = args.front();
  args.erase(args.begin());

  if (cmd == "help" || cmd == "h") {
    show_help(io);
  } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
    io.println("Bye!");
    return false;
  } else if (cmd == "repo") {
    handle_repo(args, io);
  } else if (cmd == "user") {
    handle_user(args, io);
  } else {
    io.println("Unknown command: " + cmd);
  }
  return true;
}

void AdminConsole::show_help(SessionIo &io) {
  for (const auto line : kHelp)
    io.println(line);
}

void AdminConsole::save(SessionIo &io) {
  try {
    ids_.save_to_file(users_file_);
  } catch (const std::exception &e) {
    log_.warn(e.what());
    io.println(std::string("Failed to save user data: ") + e.what());
  }
  try {
    repos_.save_to_file(repos_file_);
  } catch (const std::exception &e) {
    log_.warn(e.what());
    io.println(std::string("Failed to save repo permissions: ") + e.what());
  }
}

void AdminConsole::handle_repo(const std::vector<std::string> &args, SessionIo &io) {
  if (args.empty()) {
    io.println("Usage: repo <list|create|delete|adduser|deluser>");
    return;
  }
  const std::string &sub = args[0];

  try {
    if (sub == "list") {
      const auto repos = repos_.list();
      if (repos.empty()) {
        io.println("  (no repositories)");
        return;
      }
      for (const auto &r : repos) {
        std::string users;
        for (const auto &[name, perm] : r.users) {
          users += users.empty() ? " [" : ", ";
          users += name + "(" + std::string(to_string(perm)) + ")";
        }
        if (!users.empty())
          users += "]";
        io.println("  " + r.name + users);
      }
    } else if (sub == "create") {
      if (args.size() < 2) {
        io.println("Usage: repo create <name>");
        return;
      }
      repos_.create(args[1]);
      log_.info("console: created repository " + args[1]);
      io.println("Repository " + args[1] + " created");
      save(io);
    } else if (sub == "delete") {
      if (args.size() < 2) {
        io.println("Usage: repo delete <name>");
        return;
      }
      repos_.destroy(args[1]);
      log_.info("console: deleted repository " + args[1]);
      io.println("Repository " + args[1] + " deleted");
      save(io);
    } else if (sub == "adduser") {
      if (args.size() < 4) {
        io.println("Usage: repo adduser <repo> <user> <r|rw>");
        return;
      }
      const std::string &user = args[2];
      const auto perm = parse_permission(args[3]);
      if (!perm) {
        io.println("Permission must be r or rw");
        return;
      }
      if (is_guest(user) && *perm != Permission::Read) {
        io.println("Guest user can only have read permission");
        return;
      }
      if (!is_guest(user) && !ids_.get_user(user)) {
        io.println("User not found");
        return;
      }
      repos_.add_user(args[1], user, *perm);
      io.println("User added");
      save(io);
    } else if (sub == "deluser") {
      if (args.size() < 3) {
        io.println("Usage: repo deluser <repo> <user>");
        return;
      }
      repos_.remove_user(args[1], args[2]);
      io.println("User removed");
      save(io);
    } else {
      io.println("Unknown repo subcommand");
    }
  } catch (const std::runtime_error &e) {
    io.println(std::string("Error: ") + e.what());
  }
}

void AdminConsole::handle_user(const std::vector<std::string> &args, SessionIo &io) {
  if (args.empty()) {
    io.println("Usage: user <list|create|delete|addkey|delkey|keys>");
    return;
  }
  const std::string &sub = args[0];

  try {
    if (sub == "list") {
      const auto users = ids_.list_users();
      if (users.empty()) {
        io.println("  (no users)");
        return;
      }
      for (const auto &u : users)
        io.println("  " + u.name + " (" + std::to_string(u.keys.size()) + " keys)");
    } else if (sub == "create") {
      if (args.size() < 2) {
        io.println("Usage: user create <name>");
        return;
      }
      if (is_guest(args[1])) {
        io.println("Cannot create user named guest");
        return;
      }
      ids_.create_user(args[1]);
      log_.info("console: created user " + args[1]);
      io.println("User " + args[1] + " created");
      save(io);
    } else if (sub == "delete") {
      if (args.size() < 2) {
        io.println("Usage: user delete <name>");
        return;
      }
      if (is_guest(args[1])) {
        io.println("Cannot delete guest user");
        return;
      }
      ids_.delete_user(args[1]);
      log_.info("console: deleted user " + args[1]);
      io.println("User " + args[1] + " deleted");
      save(io);
    } else if (sub == "addkey") {
      if (args.size() < 3) {
        io.println("Usage: user addkey <name> <pubkey>");
        return;
      }
      std::string key_text;
      for (std::size_t i = 2; i < args.size(); ++i) {
        if (!key_text.empty())
          key_text.push_back(consts::kSpace);
        key_text += args[i];
      }
      auto key = PublicKey::parse(key_text);
      if (!key) {
        io.println("Invalid public key: expected \"<type> <base64> [comment]\"");
        return;
      }
      ids_.add_key_to_user(args[1], std::move(*key));
      io.println("Key added");
      save(io);
    } else if (sub == "delkey") {
      if (args.size() < 3) {
        io.println("Usage: user delkey <name> <fingerprint>");
        return;
      }
      ids_.remove_key_from_user(args[1], args[2]);
      io.println("Key removed");
      save(io);
    } else if (sub == "keys") {
      if (args.size() < 2) {
        io.println("Usage: user keys <name>");
        return;
      }
      const auto user = ids_.get_user(args[1]);
      if (!user) {
        io.println("User not found");
        return;
      }
      if (user->keys.empty()) {
        io.println("  (no keys)");
        return;
      }
      for (const auto &k : user->keys)
        io.println("  " + k.fingerprint() + " " + k.type());
    } else {
      io.println("Unknown user subcommand");
    }
  } catch (const std::runtime_error &e) {
    io.println(std::string("Error: ") + e.what());
  }
}

} // namespace gitgate
