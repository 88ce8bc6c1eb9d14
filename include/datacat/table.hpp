#pragma once
#include "datacat/meta.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace datacat {

using ColumnData =
    std::variant<std::vector<std::int64_t>, std::vector<double>, std::vector<std::string>>;

struct Column {
  std::string name;
  ColumnData data;

  [[nodiscard]] std::size_t size() const;
  bool operator==(const Column &) const = default;
};

struct Table {
  TableMeta meta;
  std::vector<Column> columns;

  // meta.short_name, validated as snake_case; this is the on-disk base name.
  // Throws ValidationError when missing or malformed.
  [[nodiscard]] std::string checked_name() const;

  // Row count; throws ValidationError if the columns disagree.
  [[nodiscard]] std::size_t num_rows() const;

  bool operator==(const Table &) const = default;
};

// "[a-z][a-z0-9_]*"
bool is_snake_case(std::string_view s);

// <dir>/<stem>.meta.json for a data file path
std::filesystem::path sidecar_path(const std::filesystem::path &data_file);

} // namespace datacat
