#include "gitgate/hash.hpp"
#include "gitgate/consts.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest and base64 API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitgate {

digest sha256(std::span<const std::uint8_t> data) {
  digest out{};

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);

  if (len != consts::kSha256Len) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  return out;
}

std::string base64_encode(std::span<const std::uint8_t> data, bool pad) {
  // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock appends
  std::string s(((data.size() + 2) / 3) * 4 + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(s.data()), data.data(),
                                static_cast<int>(data.size()));
  s.resize(static_cast<std::size_t>(n));
  if (!pad) {
    while (!s.empty() && s.back() == '=')
      s.pop_back();
  }
  return s;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
  if (text.empty() || text.size() % 4 != 0) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out((text.size() / 4) * 3);
  const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts the zero bytes produced by '=' padding
  std::size_t padding = 0;
  for (auto it = text.rbegin(); it != text.rend() && *it == '=' && padding < 2; ++it) {
    ++padding;
  }
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

} // namespace gitgate
