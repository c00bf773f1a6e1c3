#include "gitident/fs.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace gitident::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed for " + p.parent_path().string() + ": " +
                             ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::vector<std::uint8_t> buf{std::istreambuf_iterator<char>(ifs),
                                std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + p.string());
  }
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    ofs.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("write temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

} // namespace gitident::fs
