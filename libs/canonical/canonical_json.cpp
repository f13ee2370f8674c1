/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "compactscan/canonical_json.hpp"

#include <format>
#include <ranges>

namespace compactscan::canonical {

namespace {

compactscan::VoidResult validate_no_float(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = validate_no_float(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

}  // namespace

compactscan::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    // nlohmann::json stores objects in std::map, so dump() already emits sorted keys.
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("InvalidUtf8", std::string("Failed to serialize JSON: ") + ex.what()));
    }
}

compactscan::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_no_float(j, "$");
}

}  // namespace compactscan::canonical
