#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// Flat-file codecs for the identity and permission tables.
//
// users.txt
//   user: alice
//   key: ssh-ed25519 AAAAC3Nza... alice@laptop
//
// repos.txt
//   repo: proj
//   path: data/repos/proj.git
//   perm: alice rw
//   perm: guest r
namespace gitgate::storage {

struct UserRecord {
  std::string name;
  std::vector<std::string> keys; // authorized_keys lines, unvalidated
};

struct RepoRecord {
  std::string name;
  std::string path;
  std::map<std::string, std::string> users; // username -> "r" | "rw" (unvalidated)
};

std::vector<UserRecord> parse_users(std::string_view text);
std::string format_users(const std::vector<UserRecord> &users);

std::vector<RepoRecord> parse_repos(std::string_view text);
std::string format_repos(const std::vector<RepoRecord> &repos);

// Missing or empty files yield no records; unreadable files throw.
std::vector<UserRecord> load_users(const std::filesystem::path &path);
void save_users(const std::filesystem::path &path, const std::vector<UserRecord> &users);

std::vector<RepoRecord> load_repos(const std::filesystem::path &path);
void save_repos(const std::filesystem::path &path, const std::vector<RepoRecord> &repos);

} // namespace gitgate::storage
