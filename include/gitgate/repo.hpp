#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

// Ordered: None < Read < Write
enum class Permission { None = 0, Read = 1, Write = 2 };

// "r" -> Read, "rw" -> Write, anything else -> std::nullopt
[[nodiscard]] auto parse_permission(std::string_view s) -> std::optional<Permission>;
// Read -> "r", Write -> "rw", None -> ""
[[nodiscard]] auto to_string(Permission p) -> std::string_view;

struct Repository {
  std::string name;                         // without ".git"
  std::filesystem::path path;               // bare repository directory
  std::map<std::string, Permission> users;  // may include the "guest" entry
};

/**
 * Process-wide table of hosted repositories and their per-user permissions.
 * Thread-safe: queries share a reader lock, mutations are exclusive.
 * Mutations report failure by throwing std::runtime_error.
 */
class RepoTable {
public:
  // Turns a freshly created, empty directory into a bare repository.
  using Initializer = std::function<void(const std::filesystem::path &)>;
  // Deletes a repository directory tree; throws if it cannot.
  using Remover = std::function<void(const std::filesystem::path &)>;

  explicit RepoTable(std::filesystem::path repos_dir, Initializer init = {}, Remover remove = {});
  RepoTable(const RepoTable &) = delete;
  RepoTable &operator=(const RepoTable &) = delete;

  // Allocate <repos_dir>/<name>.git and initialize it. On failure the
  // directory is removed again and nothing is tracked.
  void create(const std::string &name);

  // Remove on-disk data, then forget the entry. If removal fails the
  // entry stays tracked.
  void destroy(const std::string &name);

  // Accepts names with or without ".git".
  [[nodiscard]] auto get(std::string_view name) const -> std::optional<Repository>;
  [[nodiscard]] auto list() const -> std::vector<Repository>;

  // Fail only if the repository is untracked. Removing an absent user is a no-op.
  void add_user(const std::string &repo, const std::string &user, Permission perm);
  void remove_user(const std::string &repo, const std::string &user);

  // Guest read is honoured before anything else; empty `user` means an
  // unauthenticated caller.
  [[nodiscard]] auto check_permission(std::string_view repo, std::string_view user,
                                      bool need_write) const -> bool;

  [[nodiscard]] auto repo_path(std::string_view name) const -> std::filesystem::path;
  [[nodiscard]] const std::filesystem::path &repos_dir() const { return repos_dir_; }

  // Persistence (repos.txt). Only records whose path exists on disk are
  // admitted, and an already tracked name is never overwritten.
  void load_from_file(const std::filesystem::path &path);
  void save_to_file(const std::filesystem::path &path) const;

private:
  std::filesystem::path repos_dir_;
  Initializer init_;
  Remover remove_;
  mutable std::shared_mutex mu_;
  std::map<std::string, Repository> repos_;
};

// Default initializer: `<git_program> init --bare` run inside the directory.
RepoTable::Initializer make_git_initializer(std::string git_program);

} // namespace gitgate
