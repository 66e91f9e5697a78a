#pragma once

/**
 * @file json_io.hpp
 * @brief JSON file helpers shared by loaders and writers
 */

#include "assa/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace assa::common {

/**
 * Read and parse a JSON file.
 * @return Parsed document, IOError or ParseError
 */
[[nodiscard]] assa::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Read a JSON file and validate it against `<schema_dir>/<schema_name>.schema.json`.
 * @return Parsed document, or SchemaInvalid naming `schema_name`
 */
[[nodiscard]] assa::Result<nlohmann::json>
read_validated_json(const std::filesystem::path& path,
                    const std::filesystem::path& schema_dir,
                    std::string_view schema_name);

/**
 * Write a JSON document in canonical form followed by a newline.
 */
[[nodiscard]] assa::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                         const nlohmann::json& payload);

}  // namespace assa::common
