/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "compactscan/schema_validate.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace compactscan::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "compactscan:schema/";
constexpr std::string_view kSchemaSuffix = ".schema.json";

// valijson understands draft-7 "definitions"; our schemas are written with "$defs".
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] compactscan::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text;
}

}  // namespace

compactscan::VoidResult validate_json(const nlohmann::json& j,
                                      const std::filesystem::path& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = schema_path.parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir,
                            &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto file = schema_dir / (uri.substr(kSchemaUriPrefix.size()) + std::string(kSchemaSuffix));
        auto loaded = read_schema(file);
        if (!loaded) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*loaded)));
        return referenced.back().get();
    };
    const auto free_doc = [](const nlohmann::json* /*unused*/) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        auto text = describe_errors(results);
        return std::unexpected(Error::make("SchemaValidationFailed",
                                           text.empty() ? "Schema validation failed." : text));
    }
    return {};
}

compactscan::VoidResult validate_json(const nlohmann::json& j,
                                      const std::filesystem::path& schema_dir,
                                      std::string_view schema_name)
{
    return validate_json(j, schema_dir / (std::string(schema_name) + std::string(kSchemaSuffix)));
}

}  // namespace compactscan::common
