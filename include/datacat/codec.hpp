#pragma once
#include "datacat/table.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace datacat {

enum class TableFormat { Feather, Csv };

// "feather" | "csv"; anything else throws ValidationError
TableFormat parse_format(std::string_view name);
std::string_view format_name(TableFormat f);

/**
 * Reads and writes one on-disk table format.
 * write() stores the data file and its <stem>.meta.json sidecar;
 * read() loads the data file and, when present, the sidecar.
 */
class TableCodec {
public:
  virtual ~TableCodec() = default;

  [[nodiscard]] virtual TableFormat format() const = 0;
  [[nodiscard]] virtual std::string_view extension() const = 0; // with leading '.'

  virtual void write(const Table &table, const std::filesystem::path &data_file) const = 0;
  [[nodiscard]] virtual Table read(const std::filesystem::path &data_file) const = 0;
};

// Arrow IPC (feather v2) files
class FeatherCodec final : public TableCodec {
public:
  [[nodiscard]] TableFormat format() const override { return TableFormat::Feather; }
  [[nodiscard]] std::string_view extension() const override;
  void write(const Table &table, const std::filesystem::path &data_file) const override;
  [[nodiscard]] Table read(const std::filesystem::path &data_file) const override;
};

// RFC 4180 CSV with a header row; column types inferred on read
class CsvCodec final : public TableCodec {
public:
  [[nodiscard]] TableFormat format() const override { return TableFormat::Csv; }
  [[nodiscard]] std::string_view extension() const override;
  void write(const Table &table, const std::filesystem::path &data_file) const override;
  [[nodiscard]] Table read(const std::filesystem::path &data_file) const override;
};

// Lookup order used by Dataset::get/contains: feather first, then csv.
const std::vector<const TableCodec *> &codecs_by_priority();

const TableCodec &codec_for(TableFormat f);

// Codec whose extension ends `data_file`, or nullptr.
const TableCodec *codec_for_file(const std::filesystem::path &data_file);

namespace detail {
// Sidecar handling shared by the codecs.
void write_sidecar(const Table &table, const std::filesystem::path &data_file);
void read_sidecar(Table &table, const std::filesystem::path &data_file);
} // namespace detail

} // namespace datacat
