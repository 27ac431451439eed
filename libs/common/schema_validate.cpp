/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "pkgaudit/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace pkgaudit::common {

namespace {

[[nodiscard]] pkgaudit::Result<nlohmann::json> load_schema(const std::string& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }

    try {
        return nlohmann::json::parse(schema_stream);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", schema_path, ex.what())));
    }
}

[[nodiscard]] std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context.empty() ? "/" : context, error.description);
    }
    return result;
}

}  // namespace

pkgaudit::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
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
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }

    return {};
}

}  // namespace pkgaudit::common
