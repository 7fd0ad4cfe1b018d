#include "gitgate/pubkey.hpp"

#include "gitgate/consts.hpp"
#include "gitgate/fs.hpp"
#include "gitgate/hash.hpp"
#include "gitgate/util.hpp"

#include <sstream>
#include <utility>

namespace gitgate {

namespace {

// Reads the leading SSH "string" (uint32 big-endian length + bytes) of a key blob.
[[nodiscard]] auto blob_key_type(std::span<const std::uint8_t> blob) -> std::optional<std::string> {
  if (blob.size() < 4) {
    return std::nullopt;
  }
  const std::uint32_t len = (static_cast<std::uint32_t>(blob[0]) << 24U) |
                            (static_cast<std::uint32_t>(blob[1]) << 16U) |
                            (static_cast<std::uint32_t>(blob[2]) << 8U) |
                            static_cast<std::uint32_t>(blob[3]);
  if (len == 0 || len > blob.size() - 4) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char *>(blob.data() + 4), len);
}

} // namespace

PublicKey::PublicKey(std::string type, std::vector<std::uint8_t> blob, std::string comment)
    : type_(std::move(type)), blob_(std::move(blob)), comment_(std::move(comment)) {
  const digest d = sha256(blob_);
  fingerprint_ = std::string(consts::kFingerprintPrefix) + base64_encode(d, /*pad=*/false);
}

std::optional<PublicKey> PublicKey::parse(std::string_view line) {
  const std::string text = strutil::trim(line);
  const auto parts = strutil::fields(text);
  if (parts.size() < 2) {
    return std::nullopt;
  }
  auto blob = base64_decode(parts[1]);
  if (!blob) {
    return std::nullopt;
  }
  const auto embedded = blob_key_type(*blob);
  if (!embedded || *embedded != parts[0]) {
    return std::nullopt;
  }

  std::string comment;
  for (std::size_t i = 2; i < parts.size(); ++i) {
    if (!comment.empty())
      comment.push_back(consts::kSpace);
    comment += parts[i];
  }
  return PublicKey{parts[0], std::move(*blob), std::move(comment)};
}

std::optional<PublicKey> PublicKey::from_blob(std::span<const std::uint8_t> blob) {
  auto type = blob_key_type(blob);
  if (!type) {
    return std::nullopt;
  }
  return PublicKey{std::move(*type), std::vector<std::uint8_t>(blob.begin(), blob.end()), {}};
}

auto PublicKey::to_authorized_key() const -> std::string {
  std::string s = type_;
  s.push_back(consts::kSpace);
  s += base64_encode(blob_);
  if (!comment_.empty()) {
    s.push_back(consts::kSpace);
    s += comment_;
  }
  return s;
}

std::vector<PublicKey> read_authorized_keys(const std::filesystem::path &path) {
  std::vector<PublicKey> keys;
  std::istringstream in(fs::read_text(path));
  std::string line;
  while (std::getline(in, line)) {
    const std::string t = strutil::trim(line);
    if (t.empty() || t.front() == '#')
      continue;
    if (auto pk = PublicKey::parse(t))
      keys.push_back(std::move(*pk));
  }
  return keys;
}

} // namespace gitgate
