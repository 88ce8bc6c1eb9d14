#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace datacat::fs {

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);
bool is_regular_file(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Regular files directly under `dir` whose name ends with one of `exts`,
// sorted by filename (byte-wise).
std::vector<std::filesystem::path> list_by_extension(const std::filesystem::path& dir,
                                                     const std::vector<std::string_view>& exts);

// rm -rf; throws IoError on failure
void remove_tree(const std::filesystem::path& p);

} // namespace datacat::fs
