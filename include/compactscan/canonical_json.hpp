#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for byte-stable analysis output
 *
 * Rules:
 * - UTF-8 encoding (invalid sequences are an error, never replaced)
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point)
 */

#include "compactscan/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace compactscan::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] compactscan::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements
 * - No floating point numbers
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] compactscan::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace compactscan::canonical
