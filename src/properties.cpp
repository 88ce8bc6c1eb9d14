#include "datacat/properties.hpp"

#include "datacat/dataset.hpp"
#include "datacat/errors.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace {

std::once_flag g_init_once;
std::atomic<bool> g_initialized{false};

void require_field(std::string_view name) {
  if (!datacat::initialized()) {
    throw datacat::ConfigError("metadata properties are not registered; call datacat::init()");
  }
  if (!datacat::properties::is_field(name)) {
    throw datacat::NotFoundError("no metadata field '" + std::string(name) + "'");
  }
}

} // namespace

namespace datacat {

void init() {
  // A throwing call leaves the flag unset, so a retry checks again.
  std::call_once(g_init_once, [] {
    properties::check_collisions(DatasetMeta::kFieldNames, Dataset::kBuiltins);
    g_initialized = true;
    spdlog::debug("datacat: registered {} metadata fields", DatasetMeta::kFieldNames.size());
  });
}

bool initialized() { return g_initialized; }

namespace properties {

void check_collisions(std::span<const std::string_view> fields,
                      std::span<const std::string_view> builtins) {
  for (const auto f : fields) {
    if (std::ranges::find(builtins, f) != builtins.end()) {
      throw ConfigError("metadata field \"" + std::string(f) +
                        "\" would overwrite a Dataset built-in");
    }
  }
}

bool is_field(std::string_view name) {
  return std::ranges::find(DatasetMeta::kFieldNames, name) != DatasetMeta::kFieldNames.end();
}

nlohmann::json get(const DatasetMeta &meta, std::string_view name) {
  require_field(name);
  const nlohmann::json j = meta;
  const auto it = j.find(std::string(name));
  return it == j.end() ? nlohmann::json{} : *it;
}

void set(DatasetMeta &meta, std::string_view name, nlohmann::json value) {
  require_field(name);
  nlohmann::json j = meta;
  j[std::string(name)] = std::move(value);
  try {
    meta = j.get<DatasetMeta>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError("bad value for metadata field '" + std::string(name) + "': " + e.what());
  }
}

} // namespace properties

} // namespace datacat
