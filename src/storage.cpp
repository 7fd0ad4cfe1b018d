#include "gitgate/storage.hpp"

#include "gitgate/consts.hpp"
#include "gitgate/fs.hpp"
#include "gitgate/util.hpp"

#include <sstream>
#include <stdexcept>

namespace gitgate::storage {

namespace {

// "prefix: value" -> value, trimmed
[[nodiscard]] auto value_after(std::string_view line, std::string_view prefix) -> std::string {
  return strutil::trim(line.substr(prefix.size()));
}

template <typename Fn> void for_each_line(std::string_view text, Fn &&fn) {
  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    const std::string trimmed = strutil::trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;
    fn(std::string_view{trimmed});
  }
}

} // namespace

std::vector<UserRecord> parse_users(std::string_view text) {
  std::vector<UserRecord> out;
  for_each_line(text, [&](std::string_view sv) {
    if (sv.starts_with(consts::kUserPrefix)) {
      std::string name = value_after(sv, consts::kUserPrefix);
      if (!name.empty())
        out.push_back(UserRecord{.name = std::move(name), .keys = {}});
    } else if (sv.starts_with(consts::kKeyPrefix) && !out.empty()) {
      out.back().keys.push_back(value_after(sv, consts::kKeyPrefix));
    }
  });
  return out;
}

std::string format_users(const std::vector<UserRecord> &users) {
  std::ostringstream os;
  for (const auto &u : users) {
    os << consts::kUserPrefix << ' ' << u.name << '\n';
    for (const auto &k : u.keys)
      os << consts::kKeyPrefix << ' ' << k << '\n';
  }
  return os.str();
}

std::vector<RepoRecord> parse_repos(std::string_view text) {
  std::vector<RepoRecord> out;
  for_each_line(text, [&](std::string_view sv) {
    if (sv.starts_with(consts::kRepoPrefix)) {
      std::string name = value_after(sv, consts::kRepoPrefix);
      if (!name.empty())
        out.push_back(RepoRecord{.name = std::move(name), .path = {}, .users = {}});
      return;
    }
    if (out.empty())
      return;
    if (sv.starts_with(consts::kPathPrefix)) {
      out.back().path = value_after(sv, consts::kPathPrefix);
    } else if (sv.starts_with(consts::kPermPrefix)) {
      const auto parts = strutil::fields(sv.substr(consts::kPermPrefix.size()));
      if (parts.size() == 2)
        out.back().users[parts[0]] = parts[1];
    }
  });
  return out;
}

std::string format_repos(const std::vector<RepoRecord> &repos) {
  std::ostringstream os;
  for (const auto &r : repos) {
    os << consts::kRepoPrefix << ' ' << r.name << '\n';
    os << consts::kPathPrefix << ' ' << r.path << '\n';
    for (const auto &[user, perm] : r.users)
      os << consts::kPermPrefix << ' ' << user << ' ' << perm << '\n';
  }
  return os.str();
}

std::vector<UserRecord> load_users(const std::filesystem::path &path) {
  if (!fs::exists(path))
    return {}; // no data file yet
  try {
    return parse_users(fs::read_text(path));
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("failed to read user data: ") + e.what());
  }
}

void save_users(const std::filesystem::path &path, const std::vector<UserRecord> &users) {
  try {
    fs::write_text_atomic(path, format_users(users));
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("failed to save user data: ") + e.what());
  }
}

std::vector<RepoRecord> load_repos(const std::filesystem::path &path) {
  if (!fs::exists(path))
    return {};
  try {
    return parse_repos(fs::read_text(path));
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("failed to read repo permission data: ") + e.what());
  }
}

void save_repos(const std::filesystem::path &path, const std::vector<RepoRecord> &repos) {
  try {
    fs::write_text_atomic(path, format_repos(repos));
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("failed to save repo permission data: ") + e.what());
  }
}

} // namespace gitgate::storage
