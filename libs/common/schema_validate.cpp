/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "assa/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <string>
#include <utility>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace assa::common {

namespace {

[[nodiscard]] std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", context, error.description);
    }
    return text;
}

}  // namespace

assa::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(assa::Error::make(
            "SchemaFileOpenFailed", "Failed to open schema file: " + schema_path.string()));
    }

    nlohmann::json schema_json;
    try {
        schema_stream >> schema_json;
    } catch (const std::exception& ex) {
        return std::unexpected(assa::Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema {}: {}", schema_path.string(), ex.what())));
    }

    valijson::Schema schema;
    valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            assa::Error::make("SchemaBuildFailed",
                              std::format("Failed to build schema {}: {}",
                                          schema_path.filename().string(),
                                          ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(assa::Error::make("SchemaValidationFailed", std::move(error)));
    }

    return {};
}

}  // namespace assa::common
