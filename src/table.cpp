#include "datacat/table.hpp"

#include "datacat/consts.hpp"
#include "datacat/errors.hpp"

#include <algorithm>

namespace datacat {

std::size_t Column::size() const {
  return std::visit([](const auto &v) { return v.size(); }, data);
}

bool is_snake_case(std::string_view s) {
  if (s.empty() || s.front() < 'a' || s.front() > 'z')
    return false;
  return std::ranges::all_of(s, [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
  });
}

std::string Table::checked_name() const {
  if (!meta.short_name) {
    throw ValidationError("table has no short_name");
  }
  if (!is_snake_case(*meta.short_name)) {
    throw ValidationError("table short_name is not snake_case: '" + *meta.short_name + "'");
  }
  return *meta.short_name;
}

std::size_t Table::num_rows() const {
  if (columns.empty())
    return 0;
  const std::size_t n = columns.front().size();
  for (const auto &c : columns) {
    if (c.size() != n) {
      throw ValidationError("column '" + c.name + "' has " + std::to_string(c.size()) +
                            " rows, expected " + std::to_string(n));
    }
  }
  return n;
}

std::filesystem::path sidecar_path(const std::filesystem::path &data_file) {
  auto p = data_file;
  p.replace_extension(consts::kMetaSuffix);
  return p;
}

} // namespace datacat
