#pragma once
#include "gitident/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitident {

struct Object {
  std::string type;               // "blob" | "commit" | ...
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

// 40-hex id of "<type> <size>\0" + payload.
auto object_id(std::string_view type, std::string_view payload) -> std::string;

// Loose-object bytes: zlib-deflated header + payload.
auto encode_loose_object(std::string_view type, std::string_view payload)
    -> std::vector<std::uint8_t>;
auto decode_loose_object(std::span<const std::uint8_t> bytes) -> Object;

// <repo>/.gitident/objects/aa/bbbb...
auto loose_object_path(const std::filesystem::path &repo_root, std::string_view hex_oid)
    -> std::filesystem::path;

// Store the object unless it already exists. Returns its 40-hex id.
auto write_loose_object(const std::filesystem::path &repo_root, std::string_view type,
                        std::string_view payload) -> std::string;

} // namespace gitident
