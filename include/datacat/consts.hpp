#pragma once
#include <cstddef>
#include <string_view>

namespace datacat::consts {

// File names inside a dataset directory
inline constexpr std::string_view kIndexFile   = "index.json";
inline constexpr std::string_view kMetaSuffix  = ".meta.json";

// Table storage formats
inline constexpr std::string_view kFormatFeather = "feather";
inline constexpr std::string_view kFormatCsv     = "csv";
inline constexpr std::string_view kExtFeather    = ".feather";
inline constexpr std::string_view kExtCsv        = ".csv";

// Digest sizes
inline constexpr std::size_t kDigestRawLen = 16; // 16 bytes (MD5)
inline constexpr std::size_t kDigestHexLen = 32; // 32 hex chars (MD5)

// Streaming read
inline constexpr std::size_t kChunkSize = std::size_t{1} << 20; // 1 MiB

// CSV
inline constexpr char kCsvSep   = ',';
inline constexpr char kCsvQuote = '"';
inline constexpr char kLF       = '\n';
inline constexpr char kCR       = '\r';

// JSON output
inline constexpr int kJsonIndent = 2;

} // namespace datacat::consts
