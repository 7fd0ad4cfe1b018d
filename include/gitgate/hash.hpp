#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

// Raw 32-byte SHA-256 digest (binary, not encoded)
using digest = std::array<std::uint8_t, 32>;

/** Compute SHA-256 of arbitrary bytes. */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Standard base64 (RFC 4648) encoding.
 * With `pad == false` the trailing '=' characters are dropped, which is
 * the form OpenSSH uses when printing SHA256 fingerprints.
 */
std::string base64_encode(std::span<const std::uint8_t> data, bool pad = true);

/**
 * Decode standard base64. Returns std::nullopt on invalid characters or
 * a length that is not a multiple of four.
 */
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text);

} // namespace gitgate
