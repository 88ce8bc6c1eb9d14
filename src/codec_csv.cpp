#include "datacat/codec.hpp"

#include "datacat/consts.hpp"
#include "datacat/errors.hpp"
#include "datacat/fs.hpp"

#include <array>
#include <charconv>
#include <optional>
#include <sstream>
#include <type_traits>
#include <variant>

namespace {

using datacat::consts::kCR;
using datacat::consts::kCsvQuote;
using datacat::consts::kCsvSep;
using datacat::consts::kLF;

using Record = std::vector<std::string>;

bool needs_quotes(std::string_view s) {
  return s.find_first_of(",\"\r\n") != std::string_view::npos;
}

void put_field(std::ostringstream &os, std::string_view s) {
  if (!needs_quotes(s)) {
    os << s;
    return;
  }
  os << kCsvQuote;
  for (char c : s) {
    if (c == kCsvQuote)
      os << kCsvQuote;
    os << c;
  }
  os << kCsvQuote;
}

// Shortest round-trip text that still reads back as a double, never as an int.
std::string format_double(double v) {
  std::array<char, 64> buf{};
  auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
  if (ec != std::errc{})
    throw datacat::ValidationError("cannot format double");
  std::string s(buf.data(), end);
  if (s.find_first_of(".eEin") == std::string::npos)
    s += ".0";
  return s;
}

std::string cell(const datacat::ColumnData &data, std::size_t row) {
  return std::visit(
      [row](const auto &v) -> std::string {
        using T = typename std::decay_t<decltype(v)>::value_type;
        if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v[row]);
        } else if constexpr (std::is_same_v<T, double>) {
          return format_double(v[row]);
        } else {
          return v[row];
        }
      },
      data);
}

std::vector<Record> parse_records(std::string_view text) {
  std::vector<Record> out;
  Record rec;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;

  auto end_field = [&] {
    rec.push_back(std::move(field));
    field.clear();
    field_started = false;
  };
  auto end_record = [&] {
    end_field();
    out.push_back(std::move(rec));
    rec.clear();
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_quotes) {
      if (c == kCsvQuote) {
        if (i + 1 < text.size() && text[i + 1] == kCsvQuote) {
          field.push_back(kCsvQuote);
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    if (c == kCsvQuote && !field_started && field.empty()) {
      in_quotes = true;
      field_started = true;
    } else if (c == kCsvSep) {
      end_field();
    } else if (c == kLF) {
      end_record();
    } else if (c == kCR) {
      if (i + 1 < text.size() && text[i + 1] == kLF)
        ++i;
      end_record();
    } else {
      field.push_back(c);
      field_started = true;
    }
  }
  if (in_quotes)
    throw datacat::ValidationError("unterminated quoted field");
  // last line without a trailing newline
  if (field_started || !field.empty() || !rec.empty())
    end_record();
  return out;
}

std::optional<std::int64_t> parse_int(std::string_view s) {
  std::int64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return v;
}

std::optional<double> parse_double(std::string_view s) {
  double v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return v;
}

// int64 if every cell is an integer, else double if every cell is a number,
// else string. A column with no rows stays string.
datacat::ColumnData infer_column(const std::vector<Record> &rows, std::size_t col) {
  if (rows.empty())
    return std::vector<std::string>{};

  std::vector<std::int64_t> ints;
  ints.reserve(rows.size());
  for (const auto &r : rows) {
    auto v = parse_int(r[col]);
    if (!v)
      break;
    ints.push_back(*v);
  }
  if (ints.size() == rows.size())
    return ints;

  std::vector<double> dbls;
  dbls.reserve(rows.size());
  for (const auto &r : rows) {
    auto v = parse_double(r[col]);
    if (!v)
      break;
    dbls.push_back(*v);
  }
  if (dbls.size() == rows.size())
    return dbls;

  std::vector<std::string> strs;
  strs.reserve(rows.size());
  for (const auto &r : rows)
    strs.push_back(r[col]);
  return strs;
}

} // namespace

namespace datacat {

std::string_view CsvCodec::extension() const { return consts::kExtCsv; }

void CsvCodec::write(const Table &table, const std::filesystem::path &data_file) const {
  const std::size_t rows = table.num_rows();

  std::ostringstream os;
  for (std::size_t c = 0; c < table.columns.size(); ++c) {
    if (c)
      os << kCsvSep;
    put_field(os, table.columns[c].name);
  }
  os << kLF;
  for (std::size_t r = 0; r < rows; ++r) {
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
      if (c)
        os << kCsvSep;
      put_field(os, cell(table.columns[c].data, r));
    }
    os << kLF;
  }

  fs::write_text_atomic(data_file, os.str());
  detail::write_sidecar(table, data_file);
}

Table CsvCodec::read(const std::filesystem::path &data_file) const {
  const std::string text = fs::read_text(data_file);
  std::vector<Record> records;
  try {
    records = parse_records(text);
  } catch (const ValidationError &e) {
    throw ValidationError("bad csv " + data_file.string() + ": " + e.what());
  }
  if (records.empty())
    throw ValidationError("csv has no header row: " + data_file.string());

  Record header = std::move(records.front());
  records.erase(records.begin());
  if (header.size() == 1 && header.front().empty())
    header.clear(); // zero-column table

  for (std::size_t i = 0; i < records.size(); ++i) {
    if (records[i].size() != header.size()) {
      throw ValidationError("csv row " + std::to_string(i + 1) + " has " +
                            std::to_string(records[i].size()) + " fields, expected " +
                            std::to_string(header.size()) + ": " + data_file.string());
    }
  }

  Table t;
  t.columns.reserve(header.size());
  for (std::size_t c = 0; c < header.size(); ++c) {
    t.columns.push_back(Column{.name = std::move(header[c]), .data = infer_column(records, c)});
  }
  detail::read_sidecar(t, data_file);
  return t;
}

} // namespace datacat
