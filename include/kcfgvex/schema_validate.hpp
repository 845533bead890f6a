#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "kcfgvex/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace kcfgvex::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * References of the form "kcfgvex:schema/<name>" resolve to
 * "<schema dir>/<name>.schema.json".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, SchemaValidationFailed (one line per violation) on failure
 */
[[nodiscard]] kcfgvex::VoidResult validate_json(const nlohmann::json& j,
                                                const std::string& schema_path);

}  // namespace kcfgvex::common
