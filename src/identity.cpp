#include "gitgate/identity.hpp"

#include "gitgate/consts.hpp"
#include "gitgate/storage.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace gitgate {

auto User::has_fingerprint(std::string_view fingerprint) const -> bool {
  return std::ranges::any_of(keys,
                             [&](const PublicKey &k) { return k.fingerprint() == fingerprint; });
}

void IdentityStore::set_admin_key(PublicKey key) {
  std::unique_lock lock(mu_);
  admin_key_ = std::move(key);
}

auto IdentityStore::admin_key() const -> std::optional<PublicKey> {
  std::shared_lock lock(mu_);
  return admin_key_;
}

auto IdentityStore::authenticate(const PublicKey &key) const -> Identity {
  std::shared_lock lock(mu_);
  if (admin_key_ && admin_key_->fingerprint() == key.fingerprint()) {
    return Identity{.kind = IdentityClass::Admin, .name = std::string(consts::kAdminName)};
  }
  for (const auto &[name, user] : users_) {
    if (user.has_fingerprint(key.fingerprint())) {
      return Identity{.kind = IdentityClass::Normal, .name = name};
    }
  }
  return Identity{};
}

void IdentityStore::create_user(const std::string &name) {
  std::unique_lock lock(mu_);
  if (name == consts::kAdminName) {
    throw std::runtime_error("cannot create user named 'admin'");
  }
  if (name.empty()) {
    throw std::runtime_error("user name must not be empty");
  }
  if (users_.contains(name)) {
    throw std::runtime_error("user " + name + " already exists");
  }
  users_.emplace(name, User{.name = name, .keys = {}});
}

void IdentityStore::delete_user(const std::string &name) {
  std::unique_lock lock(mu_);
  if (users_.erase(name) == 0) {
    throw std::runtime_error("user " + name + " does not exist");
  }
}

auto IdentityStore::get_user(const std::string &name) const -> std::optional<User> {
  std::shared_lock lock(mu_);
  const auto it = users_.find(name);
  if (it == users_.end())
    return std::nullopt;
  return it->second;
}

auto IdentityStore::list_users() const -> std::vector<User> {
  std::shared_lock lock(mu_);
  std::vector<User> out;
  out.reserve(users_.size());
  for (const auto &[name, user] : users_)
    out.push_back(user);
  return out;
}

void IdentityStore::add_key_to_user(const std::string &name, PublicKey key) {
  std::unique_lock lock(mu_);
  const auto it = users_.find(name);
  if (it == users_.end()) {
    throw std::runtime_error("user " + name + " does not exist");
  }
  const std::string &fp = key.fingerprint();
  if (it->second.has_fingerprint(fp)) {
    throw std::runtime_error("key already exists");
  }
  if (admin_key_ && admin_key_->fingerprint() == fp) {
    throw std::runtime_error("key belongs to the administrator");
  }
  for (const auto &[other, user] : users_) {
    if (other != name && user.has_fingerprint(fp)) {
      throw std::runtime_error("key already registered to user " + other);
    }
  }
  it->second.keys.push_back(std::move(key));
}

void IdentityStore::remove_key_from_user(const std::string &name, std::string_view fingerprint) {
  std::unique_lock lock(mu_);
  const auto it = users_.find(name);
  if (it == users_.end()) {
    throw std::runtime_error("user " + name + " does not exist");
  }
  auto &keys = it->second.keys;
  const auto k = std::ranges::find_if(
      keys, [&](const PublicKey &pk) { return pk.fingerprint() == fingerprint; });
  if (k == keys.end()) {
    throw std::runtime_error("key not found");
  }
  keys.erase(k);
}

void IdentityStore::load_from_file(const std::filesystem::path &path) {
  const auto records = storage::load_users(path);

  std::unique_lock lock(mu_);
  for (const auto &rec : records) {
    if (rec.name == consts::kAdminName || rec.name == consts::kGuestName)
      continue;
    User user{.name = rec.name, .keys = {}};
    for (const auto &line : rec.keys) {
      auto key = PublicKey::parse(line);
      if (!key || user.has_fingerprint(key->fingerprint()))
        continue; // unparseable or repeated keys are dropped
      user.keys.push_back(std::move(*key));
    }
    users_.insert_or_assign(rec.name, std::move(user));
  }
}

void IdentityStore::save_to_file(const std::filesystem::path &path) const {
  std::vector<storage::UserRecord> records;
  {
    std::shared_lock lock(mu_);
    records.reserve(users_.size());
    for (const auto &[name, user] : users_) {
      storage::UserRecord rec{.name = name, .keys = {}};
      for (const auto &k : user.keys)
        rec.keys.push_back(k.to_authorized_key());
      records.push_back(std::move(rec));
    }
  }
  storage::save_users(path, records);
}

} // namespace gitgate
