#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of configuration files and reports
 */

#include "pkgaudit/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace pkgaudit::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, SchemaValidationFailed (with one line per
 *         violation) or a schema loading error on failure
 */
[[nodiscard]] pkgaudit::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path);

}  // namespace pkgaudit::common
