#include "patchwright/fs.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <zlib.h>

#include <unistd.h>

namespace patchwright::fs {

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
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("cannot open " + p.string());
  std::vector<std::uint8_t> buf{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  if (ifs.bad())
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".pw-tmp-" + std::to_string(::getpid());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  // A replaced file keeps its mode.
  if (const auto st = std::filesystem::status(p, ec); !ec && std::filesystem::exists(st)) {
    std::filesystem::permissions(tmp, st.permissions(), ec);
    if (ec) {
      const std::string why = ec.message();
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("copy mode failed: " + p.string() + ": " + why);
    }
  }
  ec.clear();
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    const std::string why = ec.message();
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + why);
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, as_bytes(text));
}

std::vector<std::string> list_files(const std::filesystem::path &dir) {
  std::vector<std::string> out;
  for (auto it = std::filesystem::recursive_directory_iterator(dir);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    if (it->is_regular_file())
      out.push_back(std::filesystem::relative(it->path(), dir).generic_string());
  }
  std::ranges::sort(out);
  return out;
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
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
  std::uint8_t chunk[16384];
  int rc = Z_OK;
  while (rc == Z_OK) {
    zs.next_out = chunk;
    zs.avail_out = sizeof chunk;
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END)
      break;
    out.insert(out.end(), chunk, chunk + (sizeof chunk - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)
      rc = Z_DATA_ERROR; // input ended before the stream did
  }
  inflateEnd(&zs);
  if (rc != Z_STREAM_END)
    throw std::runtime_error("zlib: corrupt or truncated data");
  return out;
}

} // namespace patchwright::fs
