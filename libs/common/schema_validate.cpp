/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "semverpp/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

#ifndef SEMVERPP_DEFAULT_SCHEMA_DIR
    #define SEMVERPP_DEFAULT_SCHEMA_DIR "schemas"
#endif

namespace semverpp::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "semverpp:schema/";

// valijson understands draft-07 "definitions" only.
void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref" && value.is_string()) {
                std::string ref = value.get<std::string>();
                constexpr std::string_view kDefsPrefix = "#/$defs/";
                if (ref.starts_with(kDefsPrefix)) {
                    value = "#/definitions/" + ref.substr(kDefsPrefix.size());
                }
                continue;
            }
            normalize_schema_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
    }
}

[[nodiscard]] semverpp::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
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
    normalize_schema_defs(schema);
    return schema;
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }

        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }

    return result;
}

}  // namespace

std::filesystem::path default_schema_dir()
{
    return SEMVERPP_DEFAULT_SCHEMA_DIR;
}

std::filesystem::path schema_path(const std::filesystem::path& schema_dir, std::string_view name)
{
    return schema_dir / (std::string(name) + ".schema.json");
}

semverpp::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_file)
{
    auto schema_json = load_schema(schema_file);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    valijson::SchemaParser parser;
    const auto schema_dir = schema_file.parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> owned_schemas;
    const auto fetch_doc = [&schema_dir,
                            &owned_schemas](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto referenced = load_schema(schema_path(schema_dir, uri.substr(kSchemaUriPrefix.size())));
        if (!referenced) {
            return nullptr;
        }
        owned_schemas.push_back(std::make_unique<nlohmann::json>(std::move(*referenced)));
        return owned_schemas.back().get();
    };
    const auto free_doc = [](const nlohmann::json* schema_ptr) { (void)schema_ptr; };

    try {
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
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(
            Error::make(std::string(error_code::kSchemaValidationFailed), std::move(error)));
    }

    return {};
}

}  // namespace semverpp::common
