#pragma once
#include "datacat/codec.hpp"
#include "datacat/config.hpp"
#include "datacat/consts.hpp"
#include "datacat/meta.hpp"
#include "datacat/table.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace datacat {

/**
 * A directory of tables plus a metadata index at <path>/index.json.
 *
 * The object is a handle: it caches the index document in memory and
 * otherwise goes straight to the filesystem on every call. There is no
 * locking; concurrent writers to the same directory must coordinate
 * themselves.
 */
class Dataset {
public:
  // Lazily decodes one data file per step. Sorted by filename.
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Table;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Table;

    iterator() = default;

    Table operator*() const;
    iterator &operator++();
    iterator operator++(int);
    bool operator==(const iterator &other) const;

    // Path of the data file the iterator currently points at
    [[nodiscard]] const std::filesystem::path &file() const;

  private:
    friend class Dataset;
    explicit iterator(std::shared_ptr<const std::vector<std::filesystem::path>> files)
        : files_(std::move(files)) {}
    [[nodiscard]] bool at_end() const { return !files_ || pos_ >= files_->size(); }

    std::shared_ptr<const std::vector<std::filesystem::path>> files_;
    std::size_t pos_ = 0;
  };

  // Loads index.json; throws NotFoundError if it is absent.
  explicit Dataset(std::filesystem::path path, Options opts = {});

  /**
   * Create an empty dataset at `path`.
   * - `path` holds a dataset (has index.json): it is wiped and recreated.
   * - `path` is some other directory: ConflictError, nothing is touched.
   * - otherwise the directory is created.
   * The index is written from `metadata`, or a default document.
   */
  static Dataset create_empty(const std::filesystem::path &path,
                              const std::optional<DatasetMeta> &metadata = std::nullopt,
                              Options opts = {});

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] auto index_file() const -> std::filesystem::path {
    return path_ / consts::kIndexFile;
  }
  [[nodiscard]] const Options &options() const { return options_; }

  [[nodiscard]] const DatasetMeta &metadata() const { return metadata_; }
  DatasetMeta &metadata() { return metadata_; }

  // Overwrite index.json with the in-memory metadata (last writer wins).
  void save() const;

  // Write <path>/<table.checked_name()>.<ext> plus its sidecar.
  // Unsupported format names throw ValidationError.
  void add(const Table &table) const;
  void add(const Table &table, TableFormat format) const;
  void add(const Table &table, std::string_view format) const;

  // Feather before csv; NotFoundError if neither exists.
  [[nodiscard]] Table get(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] iterator begin() const;
  [[nodiscard]] iterator end() const { return {}; }

  // Every *.feather and *.csv file, sorted by filename.
  [[nodiscard]] std::vector<std::filesystem::path> data_files() const;

  // MD5 over index.json, then each data file followed by its sidecar,
  // as 32 lowercase hex chars. A missing sidecar throws IoError.
  [[nodiscard]] std::string checksum() const;

  // Metadata passthrough, one entry per DatasetMeta field.
  // Requires datacat::init(); see properties.hpp.
  [[nodiscard]] nlohmann::json field(std::string_view name) const;
  void set_field(std::string_view name, nlohmann::json value);

  // Member names a metadata field may not take. Every public member and
  // nested type of Dataset must be listed here; datacat::init() checks the
  // DatasetMeta field names against it.
  static constexpr std::array<std::string_view, 17> kBuiltins = {
      "path",     "index_file", "options", "metadata", "save",       "add",
      "get",      "contains",   "size",    "begin",    "end",        "data_files",
      "checksum", "field",      "set_field", "create_empty", "iterator"};

private:
  [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view name) const;

  std::filesystem::path path_;
  Options options_;
  DatasetMeta metadata_;
};

} // namespace datacat
