#include "gitident/object.hpp"

#include "gitident/consts.hpp"
#include "gitident/fs.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <zlib.h>

namespace gfs = gitident::fs;

namespace {

std::vector<std::uint8_t> z_compress(std::string_view data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 4096> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib inflate failed");
    }
    const std::size_t produced = chunk.size() - zs.avail_out;
    if (rc == Z_OK && produced == 0 && zs.avail_in == 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib stream truncated");
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
  }
  inflateEnd(&zs);
  return out;
}

} // namespace

namespace gitident {

std::string object_id(std::string_view type, std::string_view payload) {
  const std::string hdr = object_header(type, payload.size());
  const std::array<std::string_view, 2> parts{hdr, payload};
  return to_hex(sha1(parts));
}

std::vector<std::uint8_t> encode_loose_object(std::string_view type, std::string_view payload) {
  std::string store = object_header(type, payload.size());
  store.append(payload);
  return z_compress(store);
}

Object decode_loose_object(std::span<const std::uint8_t> bytes) {
  const auto store = z_decompress(bytes);

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw std::runtime_error("loose object: invalid header");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw std::runtime_error("loose object: invalid header");
  }
  const std::string size_txt(it_space + 1, it_nul);
  Object obj{.type = std::string(store.begin(), it_space), .data = {it_nul + 1, store.end()}};
  if (size_txt != std::to_string(obj.data.size())) {
    throw std::runtime_error("loose object: size mismatch");
  }
  return obj;
}

std::filesystem::path loose_object_path(const std::filesystem::path &repo_root,
                                        std::string_view hex_oid) {
  if (!looks_hex40(hex_oid)) {
    throw std::invalid_argument("bad object id: " + std::string(hex_oid));
  }
  return repo_root / consts::kGitDir / consts::kObjectsDir /
         std::string(hex_oid.substr(0, consts::kFanoutDirHexLen)) /
         std::string(hex_oid.substr(consts::kFanoutDirHexLen));
}

std::string write_loose_object(const std::filesystem::path &repo_root, std::string_view type,
                               std::string_view payload) {
  std::string hex = object_id(type, payload);
  const auto path = loose_object_path(repo_root, hex);
  if (!gfs::exists(path)) {
    gfs::write_file_atomic(path, encode_loose_object(type, payload));
  }
  return hex;
}

} // namespace gitident
