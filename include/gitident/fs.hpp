#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace gitident::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

// Whole file as bytes; throws std::runtime_error if it cannot be opened or read.
std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Write to "<p>.tmp" and rename over `p`.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

} // namespace gitident::fs
