/**
 * @file json_io.cpp
 * @brief JSON file helpers shared by loaders and writers
 */

#include "assa/json_io.hpp"

#include "assa/canonical_json.hpp"
#include "assa/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <string>

namespace assa::common {

assa::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            assa::Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            assa::Error::make("ParseError",
                              "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

assa::Result<nlohmann::json> read_validated_json(const std::filesystem::path& path,
                                                 const std::filesystem::path& schema_dir,
                                                 std::string_view schema_name)
{
    auto payload = read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    const auto schema_path = schema_dir / std::format("{}.schema.json", schema_name);
    if (auto validation = validate_json(*payload, schema_path); !validation) {
        return std::unexpected(assa::Error::make(
            "SchemaInvalid",
            std::format("{} schema validation failed: {}", schema_name, validation.error().message)));
    }
    return payload;
}

assa::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                           const nlohmann::json& payload)
{
    auto canonical = assa::canonical::canonicalize(payload, 2);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            assa::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            assa::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace assa::common
