#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "assa/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace assa::common {

/**
 * Validate JSON against a JSON Schema (draft-07) file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] assa::VoidResult validate_json(const nlohmann::json& j,
                                             const std::filesystem::path& schema_path);

}  // namespace assa::common
