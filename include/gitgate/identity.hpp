#pragma once
#include "gitgate/pubkey.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

enum class IdentityClass { Unknown, Admin, Normal };

struct User {
  std::string name;
  std::vector<PublicKey> keys; // distinct by fingerprint, insertion order

  [[nodiscard]] auto has_fingerprint(std::string_view fingerprint) const -> bool;
};

// Outcome of resolving a presented key. `name` is "admin" for the
// administrator, the user's name for Normal, and empty for Unknown.
struct Identity {
  IdentityClass kind = IdentityClass::Unknown;
  std::string name;

  [[nodiscard]] auto is_admin() const -> bool { return kind == IdentityClass::Admin; }
};

/**
 * Process-wide table of the administrator key and registered users.
 * All methods are thread-safe: lookups share a reader lock, mutations
 * take it exclusively and are visible to every later authenticate().
 * Failing mutations throw std::runtime_error and change nothing.
 */
class IdentityStore {
public:
  IdentityStore() = default;
  IdentityStore(const IdentityStore &) = delete;
  IdentityStore &operator=(const IdentityStore &) = delete;

  // Install or replace the single admin credential.
  void set_admin_key(PublicKey key);
  [[nodiscard]] auto admin_key() const -> std::optional<PublicKey>;

  // Admin first, then registered users in name order; never fails.
  [[nodiscard]] auto authenticate(const PublicKey &key) const -> Identity;

  void create_user(const std::string &name);
  void delete_user(const std::string &name);
  [[nodiscard]] auto get_user(const std::string &name) const -> std::optional<User>;
  [[nodiscard]] auto list_users() const -> std::vector<User>;

  // Fails if the user is absent, already holds the key, or the key is
  // already registered to another user or to the administrator.
  void add_key_to_user(const std::string &name, PublicKey key);
  void remove_key_from_user(const std::string &name, std::string_view fingerprint);

  // Persistence (users.txt). A missing file loads nothing; loaded users
  // replace in-memory users of the same name.
  void load_from_file(const std::filesystem::path &path);
  void save_to_file(const std::filesystem::path &path) const;

private:
  mutable std::shared_mutex mu_;
  std::optional<PublicKey> admin_key_;
  std::map<std::string, User> users_;
};

} // namespace gitgate
