#include "datacat/meta.hpp"

#include "datacat/consts.hpp"
#include "datacat/errors.hpp"
#include "datacat/fs.hpp"

using nlohmann::json;

namespace {

// Unset optionals are left out of the document entirely.
template <typename T>
void put_opt(json &j, const char *key, const std::optional<T> &v) {
  if (v)
    j[key] = *v;
}

// Missing and null both read back as unset.
template <typename T>
void get_opt(const json &j, const char *key, std::optional<T> &out) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    out.reset();
    return;
  }
  out = it->get<T>();
}

template <typename T>
void get_list(const json &j, const char *key, std::vector<T> &out) {
  out.clear();
  const auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return;
  out = it->get<std::vector<T>>();
}

void require_object(const json &j, std::string_view what) {
  if (!j.is_object())
    throw datacat::ValidationError(std::string(what) + " must be a JSON object");
}

template <typename Doc>
Doc load_document(const std::filesystem::path &p) {
  const std::string text = datacat::fs::read_text(p);
  try {
    return json::parse(text).get<Doc>();
  } catch (const json::exception &e) {
    throw datacat::ValidationError("invalid metadata document " + p.string() + ": " + e.what());
  } catch (const datacat::ValidationError &e) {
    throw datacat::ValidationError("invalid metadata document " + p.string() + ": " + e.what());
  }
}

template <typename Doc>
void save_document(const std::filesystem::path &p, const Doc &doc) {
  const json j = doc;
  std::string s = j.dump(datacat::consts::kJsonIndent);
  s.push_back('\n');
  datacat::fs::write_text_atomic(p, s);
}

} // namespace

namespace datacat {

void to_json(json &j, const Source &s) {
  j = json::object();
  put_opt(j, "name", s.name);
  put_opt(j, "description", s.description);
  put_opt(j, "url", s.url);
  put_opt(j, "source_data_url", s.source_data_url);
  put_opt(j, "owid_data_url", s.owid_data_url);
  put_opt(j, "date_accessed", s.date_accessed);
  put_opt(j, "publication_date", s.publication_date);
  put_opt(j, "publication_year", s.publication_year);
}

void from_json(const json &j, Source &s) {
  require_object(j, "source");
  get_opt(j, "name", s.name);
  get_opt(j, "description", s.description);
  get_opt(j, "url", s.url);
  get_opt(j, "source_data_url", s.source_data_url);
  get_opt(j, "owid_data_url", s.owid_data_url);
  get_opt(j, "date_accessed", s.date_accessed);
  get_opt(j, "publication_date", s.publication_date);
  get_opt(j, "publication_year", s.publication_year);
}

void to_json(json &j, const License &l) {
  j = json::object();
  put_opt(j, "name", l.name);
  put_opt(j, "url", l.url);
}

void from_json(const json &j, License &l) {
  require_object(j, "license");
  get_opt(j, "name", l.name);
  get_opt(j, "url", l.url);
}

void to_json(json &j, const DatasetMeta &m) {
  j = json::object();
  put_opt(j, "namespace", m.namespace_);
  put_opt(j, "short_name", m.short_name);
  put_opt(j, "title", m.title);
  put_opt(j, "description", m.description);
  j["sources"] = m.sources;
  j["licenses"] = m.licenses;
  j["is_public"] = m.is_public;
  put_opt(j, "additional_info", m.additional_info);
  put_opt(j, "version", m.version);
  put_opt(j, "source_checksum", m.source_checksum);
}

void from_json(const json &j, DatasetMeta &m) {
  require_object(j, "dataset metadata");
  get_opt(j, "namespace", m.namespace_);
  get_opt(j, "short_name", m.short_name);
  get_opt(j, "title", m.title);
  get_opt(j, "description", m.description);
  get_list(j, "sources", m.sources);
  get_list(j, "licenses", m.licenses);
  const auto it = j.find("is_public");
  m.is_public = (it == j.end() || it->is_null()) ? true : it->get<bool>();
  get_opt(j, "additional_info", m.additional_info);
  if (m.additional_info && !m.additional_info->is_object()) {
    throw ValidationError("additional_info must be a JSON object");
  }
  get_opt(j, "version", m.version);
  get_opt(j, "source_checksum", m.source_checksum);
}

void to_json(json &j, const VariableMeta &v) {
  j = json::object();
  put_opt(j, "title", v.title);
  put_opt(j, "description", v.description);
  put_opt(j, "unit", v.unit);
  put_opt(j, "short_unit", v.short_unit);
}

void from_json(const json &j, VariableMeta &v) {
  require_object(j, "variable metadata");
  get_opt(j, "title", v.title);
  get_opt(j, "description", v.description);
  get_opt(j, "unit", v.unit);
  get_opt(j, "short_unit", v.short_unit);
}

void to_json(json &j, const TableMeta &m) {
  j = json::object();
  put_opt(j, "short_name", m.short_name);
  put_opt(j, "title", m.title);
  put_opt(j, "description", m.description);
  j["primary_key"] = m.primary_key;
  j["fields"] = m.fields;
}

void from_json(const json &j, TableMeta &m) {
  require_object(j, "table metadata");
  get_opt(j, "short_name", m.short_name);
  get_opt(j, "title", m.title);
  get_opt(j, "description", m.description);
  get_list(j, "primary_key", m.primary_key);
  m.fields.clear();
  const auto it = j.find("fields");
  if (it != j.end() && !it->is_null())
    m.fields = it->get<std::map<std::string, VariableMeta>>();
}

DatasetMeta DatasetMeta::load(const std::filesystem::path &p) {
  return load_document<DatasetMeta>(p);
}

void DatasetMeta::save(const std::filesystem::path &p) const { save_document(p, *this); }

TableMeta TableMeta::load(const std::filesystem::path &p) { return load_document<TableMeta>(p); }

void TableMeta::save(const std::filesystem::path &p) const { save_document(p, *this); }

} // namespace datacat
