#include "datacat/fs.hpp"

#include "datacat/errors.hpp"

#include <algorithm>
#include <fstream>

namespace datacat::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_directory(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

bool is_regular_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

void ensure_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec)
    throw IoError("mkdir -p failed: " + p.string() + ": " + ec.message());
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.has_parent_path())
    ensure_dir(p.parent_path());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  if (fs::is_directory(p)) {
    throw IoError("is a directory: " + p.string());
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0) {
    throw IoError("cannot size file: " + p.string());
  }
  auto n = static_cast<std::size_t>(end);
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw IoError("read failed: " + p.string());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw IoError("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw IoError("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw IoError("atomic replace failed: " + p.string());
    }
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
}

std::vector<std::filesystem::path> list_by_extension(const std::filesystem::path &dir,
                                                     const std::vector<std::string_view> &exts) {
  std::vector<std::filesystem::path> out;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec)
    throw IoError("list dir failed: " + dir.string() + ": " + ec.message());

  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec))
      continue;
    const std::string name = entry.path().filename().string();
    if (name.starts_with('.'))
      continue; // hidden files are not tables
    const bool wanted = std::ranges::any_of(exts, [&](std::string_view ext) {
      return name.size() > ext.size() && name.ends_with(ext);
    });
    if (wanted)
      out.push_back(entry.path());
  }

  // Directory iteration order is unspecified; callers rely on this sort
  std::ranges::sort(out, [](const auto &a, const auto &b) {
    return a.filename().string() < b.filename().string();
  });
  return out;
}

void remove_tree(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  if (ec)
    throw IoError("rm -rf failed: " + p.string() + ": " + ec.message());
}

} // namespace datacat::fs
