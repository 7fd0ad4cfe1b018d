#pragma once
#include "gitgate/session_io.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>

// Shared fixtures for the test executables.
namespace testsupport {

// ssh-ed25519 keys with fixed key material, and their OpenSSH fingerprints.
inline constexpr std::string_view kAdminKey =
    "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIAALFiEsN0JNWGNueYSPmqWwu8bR3Ofy/QgTHik0P0pV admin@host";
inline constexpr std::string_view kAdminFp = "SHA256:f/2uVPQb/R3bTWosd9VPe2LnmGMG30hw5KHHpjFuaTg";

inline constexpr std::string_view kAliceKey =
    "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAICUwO0ZRXGdyfYiTnqm0v8rV4Ov2AQwXIi04Q05ZZG96 alice@laptop";
inline constexpr std::string_view kAliceFp = "SHA256:jMtLbcm6rO027qTX3y5wqQfpU7jF2C0mTrXHNrnJ/zk";

inline constexpr std::string_view kBobKey =
    "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIEpVYGt2gYyXoq24w87Z5O/6BRAbJjE8R1JdaHN+iZSf";
inline constexpr std::string_view kBobFp = "SHA256:tZVVSz8vLQjMbBRWcdHPxJGMJlGoeUBFEFJlhXQdXuE";

inline constexpr std::string_view kCarolKey =
    "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIG96hZCbprG8x9Ld6PP+CRQfKjVAS1ZhbHeCjZijrrnE carol";
inline constexpr std::string_view kCarolFp = "SHA256:LvSPH8QJbVUFBTBv7YvIh5z4m0OWTSF/2/I9jYYRsDQ";

// Unique scratch directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  explicit TempDir(const std::string &tag) {
    const std::string suffix = std::to_string(std::random_device{}());
    path_ = std::filesystem::temp_directory_path() / ("gitgate_" + tag + "_" + suffix);
    std::filesystem::create_directories(path_);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// In-memory client: scripted input, captured output.
class FakeIo : public gitgate::SessionIo {
public:
  explicit FakeIo(std::string input = {}) : input_(std::move(input)) {}

  auto read(std::span<std::uint8_t> buf, int /*timeout_ms*/) -> long override {
    if (pos_ >= input_.size())
      return kEof;
    const std::size_t n = std::min(buf.size(), input_.size() - pos_);
    std::copy_n(input_.begin() + static_cast<std::ptrdiff_t>(pos_), n, buf.begin());
    pos_ += n;
    return static_cast<long>(n);
  }
  void write(std::span<const std::uint8_t> data) override { out.append(data.begin(), data.end()); }
  void write_stderr(std::span<const std::uint8_t> data) override {
    err.append(data.begin(), data.end());
  }

  std::string out;
  std::string err;

private:
  std::string input_;
  std::size_t pos_ = 0;
};

} // namespace testsupport
