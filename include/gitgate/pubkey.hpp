#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

// An SSH public key as it appears in an authorized_keys line.
class PublicKey {
public:
  // Parse "<type> <base64-blob> [comment]". The blob's embedded type must
  // agree with <type>. Returns std::nullopt on any malformed input.
  static std::optional<PublicKey> parse(std::string_view line);

  // Build from a raw wire blob (as handed over by the SSH transport).
  static std::optional<PublicKey> from_blob(std::span<const std::uint8_t> blob);

  [[nodiscard]] const std::string &type() const { return type_; }
  [[nodiscard]] const std::vector<std::uint8_t> &blob() const { return blob_; }
  [[nodiscard]] const std::string &comment() const { return comment_; }

  // "SHA256:<unpadded base64 of sha256(blob)>", matching ssh-keygen -l.
  [[nodiscard]] const std::string &fingerprint() const { return fingerprint_; }

  // "<type> <base64>[ <comment>]"
  [[nodiscard]] auto to_authorized_key() const -> std::string;

private:
  PublicKey(std::string type, std::vector<std::uint8_t> blob, std::string comment);

  std::string type_;
  std::vector<std::uint8_t> blob_;
  std::string comment_;
  std::string fingerprint_;
};

// Every parsable key in an authorized_keys style file; blank lines and
// '#' comments are skipped, as are malformed lines. Throws if the file
// cannot be read.
std::vector<PublicKey> read_authorized_keys(const std::filesystem::path &path);

} // namespace gitgate
