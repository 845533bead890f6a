/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "kcfgvex/schema_validate.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace kcfgvex::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "kcfgvex:schema/";

// valijson understands draft-07 "definitions" only.
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
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
        schema.erase("$defs");
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            std::string ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", context.empty() ? "/" : context, error.description);
    }
    return text;
}

[[nodiscard]] std::unique_ptr<nlohmann::json> load_schema_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return nullptr;
    }
    auto schema = std::make_unique<nlohmann::json>();
    try {
        in >> *schema;
    } catch (const std::exception&) {
        return nullptr;
    }
    rewrite_defs(*schema);
    return schema;
}

}  // namespace

kcfgvex::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }
    nlohmann::json schema_json;
    try {
        schema_stream >> schema_json;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make("SchemaParseFailed",
                                           std::string("Failed to parse schema JSON: ") + ex.what()));
    }
    rewrite_defs(schema_json);

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir, &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto schema = load_schema_file(schema_dir
                                       / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json"));
        if (!schema) {
            return nullptr;
        }
        referenced.push_back(std::move(schema));
        return referenced.back().get();
    };
    const auto free_doc = [](const nlohmann::json* doc) { (void)doc; };

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = describe_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

}  // namespace kcfgvex::common
