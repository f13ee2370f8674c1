#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "compactscan/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace compactscan::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * References of the form "compactscan:schema/<name>" resolve to
 * "<schema dir>/<name>.schema.json".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] compactscan::VoidResult validate_json(const nlohmann::json& j,
                                                    const std::filesystem::path& schema_path);

/**
 * Validate JSON against "<schema_dir>/<schema_name>.schema.json".
 */
[[nodiscard]] compactscan::VoidResult validate_json(const nlohmann::json& j,
                                                    const std::filesystem::path& schema_dir,
                                                    std::string_view schema_name);

}  // namespace compactscan::common
