#include "datacat/codec.hpp"

#include "datacat/consts.hpp"
#include "datacat/errors.hpp"
#include "datacat/fs.hpp"

#include <type_traits>
#include <variant>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/feather.h>

namespace {

void check(const arrow::Status &st, std::string_view what) {
  if (!st.ok())
    throw datacat::IoError(std::string(what) + ": " + st.ToString());
}

template <typename T>
T unwrap(arrow::Result<T> r, std::string_view what) {
  check(r.status(), what);
  return std::move(r).ValueOrDie();
}

std::shared_ptr<arrow::Array> to_array(const datacat::ColumnData &data) {
  return std::visit(
      [](const auto &v) -> std::shared_ptr<arrow::Array> {
        using T = typename std::decay_t<decltype(v)>::value_type;
        std::shared_ptr<arrow::Array> out;
        if constexpr (std::is_same_v<T, std::int64_t>) {
          arrow::Int64Builder b;
          check(b.AppendValues(v), "append int64");
          check(b.Finish(&out), "finish int64");
        } else if constexpr (std::is_same_v<T, double>) {
          arrow::DoubleBuilder b;
          check(b.AppendValues(v), "append double");
          check(b.Finish(&out), "finish double");
        } else {
          arrow::StringBuilder b;
          check(b.AppendValues(v), "append string");
          check(b.Finish(&out), "finish string");
        }
        return out;
      },
      data);
}

std::shared_ptr<arrow::DataType> to_type(const datacat::ColumnData &data) {
  switch (data.index()) {
  case 0:
    return arrow::int64();
  case 1:
    return arrow::float64();
  default:
    return arrow::utf8();
  }
}

void require_no_nulls(const arrow::Array &arr, const std::string &column) {
  if (arr.null_count() != 0)
    throw datacat::ValidationError("column '" + column + "' contains nulls");
}

datacat::ColumnData from_chunked(const arrow::ChunkedArray &col, const std::string &name) {
  switch (col.type()->id()) {
  case arrow::Type::INT64: {
    std::vector<std::int64_t> out;
    out.reserve(static_cast<std::size_t>(col.length()));
    for (const auto &chunk : col.chunks()) {
      require_no_nulls(*chunk, name);
      const auto &a = static_cast<const arrow::Int64Array &>(*chunk);
      for (int64_t i = 0; i < a.length(); ++i)
        out.push_back(a.Value(i));
    }
    return out;
  }
  case arrow::Type::DOUBLE: {
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(col.length()));
    for (const auto &chunk : col.chunks()) {
      require_no_nulls(*chunk, name);
      const auto &a = static_cast<const arrow::DoubleArray &>(*chunk);
      for (int64_t i = 0; i < a.length(); ++i)
        out.push_back(a.Value(i));
    }
    return out;
  }
  case arrow::Type::STRING: {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(col.length()));
    for (const auto &chunk : col.chunks()) {
      require_no_nulls(*chunk, name);
      const auto &a = static_cast<const arrow::StringArray &>(*chunk);
      for (int64_t i = 0; i < a.length(); ++i)
        out.push_back(a.GetString(i));
    }
    return out;
  }
  default:
    throw datacat::ValidationError("column '" + name +
                                   "' has unsupported type: " + col.type()->ToString());
  }
}

} // namespace

namespace datacat {

std::string_view FeatherCodec::extension() const { return consts::kExtFeather; }

void FeatherCodec::write(const Table &table, const std::filesystem::path &data_file) const {
  const auto rows = static_cast<int64_t>(table.num_rows());

  arrow::FieldVector fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  fields.reserve(table.columns.size());
  arrays.reserve(table.columns.size());
  for (const auto &c : table.columns) {
    fields.push_back(arrow::field(c.name, to_type(c.data), /*nullable=*/false));
    arrays.push_back(to_array(c.data));
  }
  const auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays, rows);

  fs::ensure_parent_dir(data_file);
  auto out = unwrap(arrow::io::FileOutputStream::Open(data_file.string()),
                    "open for write failed: " + data_file.string());
  check(arrow::ipc::feather::WriteTable(*arrow_table, out.get()),
        "feather write failed: " + data_file.string());
  check(out->Close(), "close failed: " + data_file.string());

  detail::write_sidecar(table, data_file);
}

Table FeatherCodec::read(const std::filesystem::path &data_file) const {
  auto in = unwrap(arrow::io::ReadableFile::Open(data_file.string()),
                   "open for read failed: " + data_file.string());
  auto reader = unwrap(arrow::ipc::feather::Reader::Open(in),
                       "feather open failed: " + data_file.string());
  std::shared_ptr<arrow::Table> arrow_table;
  check(reader->Read(&arrow_table), "feather read failed: " + data_file.string());

  Table t;
  const auto &schema = arrow_table->schema();
  t.columns.reserve(static_cast<std::size_t>(arrow_table->num_columns()));
  for (int i = 0; i < arrow_table->num_columns(); ++i) {
    const std::string name = schema->field(i)->name();
    t.columns.push_back(Column{.name = name, .data = from_chunked(*arrow_table->column(i), name)});
  }
  check(in->Close(), "close failed: " + data_file.string());

  detail::read_sidecar(t, data_file);
  return t;
}

} // namespace datacat
