#include "gitident/hash.hpp"
#include "gitident/consts.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace {

struct md_ctx_deleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

} // namespace

namespace gitident {

oid sha1(std::span<const std::string_view> parts) {
  const md_ctx_ptr ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  for (const auto part : parts) {
    if (!part.empty() && EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

std::string to_hex(const oid &id) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t b : id) {
    s.push_back(kHex[b >> 4]);
    s.push_back(kHex[b & 0xF]);
  }
  return s;
}

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string object_header(std::string_view type, std::size_t size) {
  std::string s(type);
  s.push_back(consts::kSpace);
  s.append(std::to_string(size));
  s.push_back(consts::kNul);
  return s;
}

} // namespace gitident
