#include "datacat/codec.hpp"

#include "datacat/consts.hpp"
#include "datacat/errors.hpp"
#include "datacat/fs.hpp"

namespace datacat {

TableFormat parse_format(std::string_view name) {
  if (name == consts::kFormatFeather)
    return TableFormat::Feather;
  if (name == consts::kFormatCsv)
    return TableFormat::Csv;
  throw ValidationError("format '" + std::string(name) + "' is not supported");
}

std::string_view format_name(TableFormat f) {
  switch (f) {
  case TableFormat::Feather:
    return consts::kFormatFeather;
  case TableFormat::Csv:
    return consts::kFormatCsv;
  }
  throw ValidationError("unknown table format");
}

const std::vector<const TableCodec *> &codecs_by_priority() {
  static const FeatherCodec feather{};
  static const CsvCodec csv{};
  static const std::vector<const TableCodec *> order{&feather, &csv};
  return order;
}

const TableCodec &codec_for(TableFormat f) {
  for (const auto *c : codecs_by_priority()) {
    if (c->format() == f)
      return *c;
  }
  throw ValidationError("no codec for format '" + std::string(format_name(f)) + "'");
}

const TableCodec *codec_for_file(const std::filesystem::path &data_file) {
  const std::string ext = data_file.extension().string();
  for (const auto *c : codecs_by_priority()) {
    if (ext == c->extension())
      return c;
  }
  return nullptr;
}

namespace detail {

void write_sidecar(const Table &table, const std::filesystem::path &data_file) {
  table.meta.save(sidecar_path(data_file));
}

void read_sidecar(Table &table, const std::filesystem::path &data_file) {
  const auto p = sidecar_path(data_file);
  if (fs::exists(p))
    table.meta = TableMeta::load(p);
  else if (!table.meta.short_name)
    table.meta.short_name = data_file.stem().string();
}

} // namespace detail

} // namespace datacat
