#include "gitgate/repo.hpp"

#include "gitgate/consts.hpp"
#include "gitgate/fs.hpp"
#include "gitgate/process.hpp"
#include "gitgate/storage.hpp"
#include "gitgate/util.hpp"

#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace gitgate {

auto parse_permission(std::string_view s) -> std::optional<Permission> {
  if (s == "r")
    return Permission::Read;
  if (s == "rw")
    return Permission::Write;
  return std::nullopt;
}

auto to_string(Permission p) -> std::string_view {
  switch (p) {
  case Permission::Read:
    return "r";
  case Permission::Write:
    return "rw";
  case Permission::None:
    break;
  }
  return "";
}

RepoTable::Initializer make_git_initializer(std::string git_program) {
  return [git = std::move(git_program)](const stdfs::path &dir) {
    const auto res = process::run({git, "init", "--bare"}, dir);
    if (res.status != 0) {
      std::string out = res.output;
      strutil::rstrip_newlines(out);
      throw std::runtime_error("failed to init repository: git exited with status " +
                               std::to_string(res.status) + (out.empty() ? "" : ": " + out));
    }
  };
}

namespace {

void remove_tree(const stdfs::path &dir) {
  std::error_code ec;
  stdfs::remove_all(dir, ec);
  if (ec) {
    throw std::runtime_error("remove " + dir.string() + " failed: " + ec.message());
  }
}

} // namespace

RepoTable::RepoTable(stdfs::path repos_dir, Initializer init, Remover remove)
    : repos_dir_(std::move(repos_dir)),
      init_(init ? std::move(init) : make_git_initializer(std::string(consts::kGitProgram))),
      remove_(remove ? std::move(remove) : Remover(remove_tree)) {}

auto RepoTable::repo_path(std::string_view name) const -> stdfs::path {
  return repos_dir_ / (strip_repo_suffix(name) + std::string(consts::kRepoSuffix));
}

void RepoTable::create(const std::string &name) {
  std::unique_lock lock(mu_);
  if (repos_.contains(name)) {
    throw std::runtime_error("repository " + name + " already exists");
  }
  if (!is_valid_repo_name(name)) {
    throw std::runtime_error("invalid repository name: " + name);
  }
  const stdfs::path dir = repo_path(name);
  if (fs::exists(dir)) {
    throw std::runtime_error("repository directory already exists: " + dir.string());
  }

  std::error_code ec;
  stdfs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("create repository dir failed: " + ec.message());
  }
  try {
    init_(dir);
  } catch (const std::exception &) {
    stdfs::remove_all(dir, ec);
    throw;
  }

  repos_.emplace(name, Repository{.name = name, .path = dir, .users = {}});
}

void RepoTable::destroy(const std::string &name) {
  std::unique_lock lock(mu_);
  const auto it = repos_.find(name);
  if (it == repos_.end()) {
    throw std::runtime_error("repository " + name + " does not exist");
  }
  remove_(it->second.path);
  repos_.erase(it);
}

auto RepoTable::get(std::string_view name) const -> std::optional<Repository> {
  std::shared_lock lock(mu_);
  const auto it = repos_.find(strip_repo_suffix(name));
  if (it == repos_.end())
    return std::nullopt;
  return it->second;
}

auto RepoTable::list() const -> std::vector<Repository> {
  std::shared_lock lock(mu_);
  std::vector<Repository> out;
  out.reserve(repos_.size());
  for (const auto &[name, repo] : repos_)
    out.push_back(repo);
  return out;
}

void RepoTable::add_user(const std::string &repo, const std::string &user, Permission perm) {
  std::unique_lock lock(mu_);
  const auto it = repos_.find(repo);
  if (it == repos_.end()) {
    throw std::runtime_error("repository " + repo + " does not exist");
  }
  it->second.users[user] = perm;
}

void RepoTable::remove_user(const std::string &repo, const std::string &user) {
  std::unique_lock lock(mu_);
  const auto it = repos_.find(repo);
  if (it == repos_.end()) {
    throw std::runtime_error("repository " + repo + " does not exist");
  }
  it->second.users.erase(user);
}

auto RepoTable::check_permission(std::string_view repo, std::string_view user,
                                 bool need_write) const -> bool {
  std::shared_lock lock(mu_);
  const auto it = repos_.find(strip_repo_suffix(repo));
  if (it == repos_.end()) {
    return false;
  }
  const auto &users = it->second.users;

  // guest read applies to everyone, known or not
  if (!need_write) {
    const auto guest = users.find(std::string(consts::kGuestName));
    if (guest != users.end() && guest->second >= Permission::Read) {
      return true;
    }
  }

  if (user.empty()) {
    return false;
  }
  const auto entry = users.find(std::string(user));
  if (entry == users.end()) {
    return false;
  }
  if (need_write) {
    return entry->second == Permission::Write;
  }
  return entry->second >= Permission::Read;
}

void RepoTable::load_from_file(const stdfs::path &path) {
  const auto records = storage::load_repos(path);

  std::unique_lock lock(mu_);
  for (const auto &rec : records) {
    if (rec.path.empty() || !fs::exists(rec.path)) {
      continue; // repository is gone from disk
    }
    if (repos_.contains(rec.name)) {
      continue;
    }
    Repository repo{.name = rec.name, .path = rec.path, .users = {}};
    for (const auto &[user, perm_text] : rec.users) {
      if (const auto perm = parse_permission(perm_text))
        repo.users.emplace(user, *perm);
    }
    repos_.emplace(rec.name, std::move(repo));
  }
}

void RepoTable::save_to_file(const stdfs::path &path) const {
  std::vector<storage::RepoRecord> records;
  {
    std::shared_lock lock(mu_);
    records.reserve(repos_.size());
    for (const auto &[name, repo] : repos_) {
      storage::RepoRecord rec{.name = name, .path = repo.path.string(), .users = {}};
      for (const auto &[user, perm] : repo.users) {
        if (perm != Permission::None)
          rec.users.emplace(user, std::string(to_string(perm)));
      }
      records.push_back(std::move(rec));
    }
  }
  storage::save_repos(path, records);
}

} // namespace gitgate
