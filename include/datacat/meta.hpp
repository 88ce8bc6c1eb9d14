#pragma once
#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace datacat {

struct Source {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<std::string> url;
  std::optional<std::string> source_data_url;
  std::optional<std::string> owid_data_url;
  std::optional<std::string> date_accessed;
  std::optional<std::string> publication_date;
  std::optional<int> publication_year;

  bool operator==(const Source &) const = default;
};

struct License {
  std::optional<std::string> name;
  std::optional<std::string> url;

  bool operator==(const License &) const = default;
};

// Document stored at <dataset>/index.json
struct DatasetMeta {
  std::optional<std::string> namespace_; // "namespace" on disk
  std::optional<std::string> short_name;
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::vector<Source> sources;
  std::vector<License> licenses;
  bool is_public = true;
  std::optional<nlohmann::json> additional_info;
  std::optional<std::string> version;
  std::optional<std::string> source_checksum;

  // On-disk field names, in declaration order
  static constexpr std::array<std::string_view, 10> kFieldNames = {
      "namespace", "short_name", "title",           "description", "sources",
      "licenses",  "is_public",  "additional_info", "version",     "source_checksum"};

  bool operator==(const DatasetMeta &) const = default;

  // Throws IoError if unreadable, ValidationError if not a valid document.
  static DatasetMeta load(const std::filesystem::path &p);
  void save(const std::filesystem::path &p) const;
};

// Per-column metadata inside a table sidecar
struct VariableMeta {
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<std::string> unit;
  std::optional<std::string> short_unit;

  bool operator==(const VariableMeta &) const = default;
};

// Document stored at <dataset>/<name>.meta.json
struct TableMeta {
  std::optional<std::string> short_name;
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::vector<std::string> primary_key;
  std::map<std::string, VariableMeta> fields;

  bool operator==(const TableMeta &) const = default;

  static TableMeta load(const std::filesystem::path &p);
  void save(const std::filesystem::path &p) const;
};

void to_json(nlohmann::json &j, const Source &s);
void from_json(const nlohmann::json &j, Source &s);
void to_json(nlohmann::json &j, const License &l);
void from_json(const nlohmann::json &j, License &l);
void to_json(nlohmann::json &j, const DatasetMeta &m);
void from_json(const nlohmann::json &j, DatasetMeta &m);
void to_json(nlohmann::json &j, const VariableMeta &v);
void from_json(const nlohmann::json &j, VariableMeta &v);
void to_json(nlohmann::json &j, const TableMeta &m);
void from_json(const nlohmann::json &j, TableMeta &m);

} // namespace datacat
