#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of stored records
 */

#include "semverpp/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace semverpp::common {

/**
 * Schema directory chosen at build time (the installed data directory for
 * install builds, the source tree otherwise)
 */
[[nodiscard]] std::filesystem::path default_schema_dir();

/**
 * Resolve "<schema_dir>/<name>.schema.json"
 */
[[nodiscard]] std::filesystem::path schema_path(const std::filesystem::path& schema_dir,
                                                std::string_view name);

/**
 * Validate JSON against a JSON Schema file.
 *
 * References of the form "semverpp:schema/<name>" are resolved against the
 * directory containing the schema file.
 *
 * @param j JSON document to validate
 * @param schema_file Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] semverpp::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::filesystem::path& schema_file);

}  // namespace semverpp::common
