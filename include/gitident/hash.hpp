#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gitident {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * SHA-1 over the concatenation of `parts`, fed to the digest in order.
 * Git object ids hash "<type> <size>\0" followed by the payload; passing
 * both as separate parts avoids building the joined buffer.
 */
oid sha1(std::span<const std::string_view> parts);

inline oid sha1(std::string_view s) {
  const std::array<std::string_view, 1> one{s};
  return sha1(std::span<const std::string_view>(one));
}

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/** Validate 40-char hex (either case). */
bool looks_hex40(std::string_view str);

/** "<type> <size>\0" */
std::string object_header(std::string_view type, std::size_t size);

} // namespace gitident
