#pragma once
#include "datacat/codec.hpp"
#include "datacat/consts.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace datacat {

struct Options {
  TableFormat default_format = TableFormat::Feather;
  std::size_t chunk_size = consts::kChunkSize;
  std::string log_level = "info";

  bool operator==(const Options &) const = default;
};

// Read "key: value" lines (# comments allowed). Missing file -> defaults.
// Unknown keys or bad values throw ConfigError.
Options load_options(const std::filesystem::path &path);

// Overwrite `path` with the given options
void save_options(const std::filesystem::path &path, const Options &opts);

// Apply opts.log_level to the spdlog default logger.
void configure_logging(const Options &opts);

} // namespace datacat
