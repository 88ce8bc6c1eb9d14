#pragma once
#include "datacat/meta.hpp"

#include <span>
#include <string_view>

#include <nlohmann/json.hpp>

namespace datacat {

/**
 * Process startup hook. Checks that no DatasetMeta field name shadows a
 * Dataset built-in and enables Dataset::field/set_field. Throws ConfigError
 * on a collision. Safe to call any number of times.
 */
void init();

[[nodiscard]] bool initialized();

namespace properties {

// Throws ConfigError naming the first field found in `builtins`.
void check_collisions(std::span<const std::string_view> fields,
                      std::span<const std::string_view> builtins);

[[nodiscard]] bool is_field(std::string_view name);

// JSON value of one DatasetMeta field (null when unset).
nlohmann::json get(const DatasetMeta &meta, std::string_view name);

// Replace one field; ValidationError if `value` has the wrong shape,
// in which case `meta` is left unchanged.
void set(DatasetMeta &meta, std::string_view name, nlohmann::json value);

} // namespace properties

} // namespace datacat
