#include "gitgate/identity.hpp"
#include "gitgate/pubkey.hpp"
#include "gitgate/repo.hpp"
#include "support.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using gitgate::IdentityClass;
using gitgate::IdentityStore;
using gitgate::Permission;
using gitgate::PublicKey;
using gitgate::RepoTable;

constexpr int kUsers = 200;
constexpr int kReaders = 4;

static int fail(const std::string &msg) {
  std::cerr << msg << "\n";
  return 1;
}

static void put_be32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8)
    out.push_back(static_cast<std::uint8_t>(v >> shift));
}

// Distinct ed25519 wire blob per index.
static PublicKey numbered_key(int i) {
  const std::string type = "ssh-ed25519";
  std::vector<std::uint8_t> blob;
  put_be32(blob, static_cast<std::uint32_t>(type.size()));
  blob.insert(blob.end(), type.begin(), type.end());
  put_be32(blob, 32);
  for (int b = 0; b < 32; ++b)
    blob.push_back(static_cast<std::uint8_t>((i * 31 + b) ^ (i >> 8)));
  return *PublicKey::from_blob(blob);
}

static void fake_init(const fs::path &dir) { std::ofstream(dir / "HEAD") << "ref: refs/heads/main\n"; }

// Writers add users and keys while readers authenticate every key published
// so far. A published user must always resolve to itself.
static int identities_under_contention() {
  IdentityStore ids;
  std::vector<PublicKey> keys;
  keys.reserve(kUsers);
  for (int i = 0; i < kUsers; ++i)
    keys.push_back(numbered_key(i));

  std::atomic<int> published{0};
  std::atomic<bool> bad{false};

  std::thread writer([&] {
    for (int i = 0; i < kUsers; ++i) {
      const std::string name = "user" + std::to_string(i);
      ids.create_user(name);
      ids.add_key_to_user(name, keys[i]);
      published.store(i + 1);
    }
  });
  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; ++r) {
    readers.emplace_back([&] {
      while (published.load() < kUsers && !bad.load()) {
        const int upto = published.load();
        for (int i = 0; i < upto; ++i) {
          const auto id = ids.authenticate(keys[i]);
          if (id.kind != IdentityClass::Normal || id.name != "user" + std::to_string(i))
            bad.store(true);
        }
        (void)ids.list_users();
      }
    });
  }
  writer.join();
  for (auto &t : readers)
    t.join();
  if (bad.load())
    return fail("a published user did not authenticate during concurrent writes");
  if (ids.list_users().size() != static_cast<std::size_t>(kUsers))
    return fail("concurrent writes lost users");
  return 0;
}

// One thread grants and revokes access repeatedly while readers check that a
// permanent grant never flickers and a revoked user never keeps write access.
static int permissions_under_contention(const fs::path &repos_dir) {
  RepoTable table{repos_dir, fake_init};
  table.create("shared");
  table.add_user("shared", "owner", Permission::Write);

  std::atomic<bool> done{false};
  std::atomic<bool> bad{false};

  std::thread writer([&] {
    for (int i = 0; i < kUsers; ++i) {
      const std::string name = "member" + std::to_string(i % 10);
      table.add_user("shared", name, Permission::Read);
      table.remove_user("shared", name);
    }
    done.store(true);
  });
  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        if (!table.check_permission("shared", "owner", true))
          bad.store(true);
        for (int m = 0; m < 10; ++m) {
          if (table.check_permission("shared", "member" + std::to_string(m), true))
            bad.store(true);
        }
        if (table.check_permission("shared", "", false))
          bad.store(true);
      }
    });
  }
  writer.join();
  for (auto &t : readers)
    t.join();
  if (bad.load())
    return fail("permission check saw an inconsistent table");
  const auto shared = table.get("shared");
  if (!shared || shared->users.size() != 1)
    return fail("members left behind after concurrent add/remove");
  return 0;
}

int main() {
  testsupport::TempDir tmp{"concurrency"};
  try {
    if (int rc = identities_under_contention())
      return rc;
    if (int rc = permissions_under_contention(tmp.path() / "repos"))
      return rc;
  } catch (const std::exception &e) {
    return fail(std::string("exception: ") + e.what());
  }
  std::cout << "concurrency test OK\n";
  return 0;
}
