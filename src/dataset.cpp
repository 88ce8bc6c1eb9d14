#include "datacat/dataset.hpp"

#include "datacat/errors.hpp"
#include "datacat/fs.hpp"
#include "datacat/hash.hpp"
#include "datacat/properties.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace stdfs = std::filesystem;
namespace dfs = datacat::fs;

namespace {

std::vector<std::string_view> data_extensions() {
  std::vector<std::string_view> exts;
  for (const auto *c : datacat::codecs_by_priority())
    exts.push_back(c->extension());
  return exts;
}

} // namespace

namespace datacat {

// Iterator

Table Dataset::iterator::operator*() const {
  const auto &p = file();
  const TableCodec *codec = codec_for_file(p);
  if (!codec) {
    throw ValidationError("not a table file: " + p.string());
  }
  spdlog::debug("dataset: decode {}", p.string());
  return codec->read(p);
}

auto Dataset::iterator::operator++() -> iterator & {
  if (!at_end())
    ++pos_;
  return *this;
}

auto Dataset::iterator::operator++(int) -> iterator {
  auto prev = *this;
  ++*this;
  return prev;
}

bool Dataset::iterator::operator==(const iterator &other) const {
  if (at_end() || other.at_end())
    return at_end() == other.at_end();
  return files_ == other.files_ && pos_ == other.pos_;
}

auto Dataset::iterator::file() const -> const stdfs::path & {
  if (at_end()) {
    throw std::out_of_range("dataset iterator is past the end");
  }
  return (*files_)[pos_];
}

// Lifecycle

Dataset::Dataset(stdfs::path path, Options opts)
    : path_(std::move(path)), options_(std::move(opts)) {
  const auto index = index_file();
  if (!dfs::is_regular_file(index)) {
    throw NotFoundError("no dataset index at: " + index.string());
  }
  metadata_ = DatasetMeta::load(index);
  spdlog::debug("dataset: opened {}", path_.string());
}

Dataset Dataset::create_empty(const stdfs::path &path, const std::optional<DatasetMeta> &metadata,
                              Options opts) {
  if (dfs::is_directory(path)) {
    if (!dfs::is_regular_file(path / consts::kIndexFile)) {
      throw ConflictError("refuse to overwrite non-dataset dir at: " + path.string());
    }
    spdlog::debug("dataset: resetting existing dataset at {}", path.string());
    dfs::remove_tree(path);
  }

  dfs::ensure_dir(path);
  metadata.value_or(DatasetMeta{}).save(path / consts::kIndexFile);
  spdlog::debug("dataset: created {}", path.string());

  return Dataset{path, std::move(opts)};
}

void Dataset::save() const {
  metadata_.save(index_file());
  spdlog::debug("dataset: saved index of {}", path_.string());
}

// Tables

void Dataset::add(const Table &table) const { add(table, options_.default_format); }

void Dataset::add(const Table &table, std::string_view format) const {
  add(table, parse_format(format));
}

void Dataset::add(const Table &table, TableFormat format) const {
  const TableCodec &codec = codec_for(format);
  const stdfs::path data_file = path_ / (table.checked_name() + std::string(codec.extension()));
  // A copy in another format is left in place; get() prefers feather.
  codec.write(table, data_file);
  spdlog::debug("dataset: wrote {}", data_file.string());
}

auto Dataset::resolve(std::string_view name) const -> std::optional<stdfs::path> {
  // only plain names directly inside the dataset directory
  if (name.empty() || name == "." || name == ".." ||
      name.find_first_of("/\\") != std::string_view::npos)
    return std::nullopt;
  for (const auto *codec : codecs_by_priority()) {
    auto candidate = path_ / (std::string(name) + std::string(codec->extension()));
    if (dfs::is_regular_file(candidate))
      return candidate;
  }
  return std::nullopt;
}

Table Dataset::get(std::string_view name) const {
  const auto found = resolve(name);
  if (!found) {
    throw NotFoundError("no table named '" + std::string(name) + "' in " + path_.string());
  }
  spdlog::debug("dataset: read {}", found->string());
  return codec_for_file(*found)->read(*found);
}

bool Dataset::contains(std::string_view name) const { return resolve(name).has_value(); }

auto Dataset::data_files() const -> std::vector<stdfs::path> {
  return dfs::list_by_extension(path_, data_extensions());
}

std::size_t Dataset::size() const { return data_files().size(); }

auto Dataset::begin() const -> iterator {
  return iterator{std::make_shared<const std::vector<stdfs::path>>(data_files())};
}

// Checksum

std::string Dataset::checksum() const {
  Md5 outer;
  outer.update(md5_file(index_file(), options_.chunk_size));

  for (const auto &data_file : data_files()) {
    outer.update(md5_file(data_file, options_.chunk_size));
    // must exist: a table without a sidecar fails the whole checksum
    outer.update(md5_file(sidecar_path(data_file), options_.chunk_size));
  }

  const std::string hex = to_hex(outer.finish());
  spdlog::debug("dataset: checksum of {} is {}", path_.string(), hex);
  return hex;
}

// Metadata fields

nlohmann::json Dataset::field(std::string_view name) const {
  return properties::get(metadata_, name);
}

void Dataset::set_field(std::string_view name, nlohmann::json value) {
  properties::set(metadata_, name, std::move(value));
}

} // namespace datacat
