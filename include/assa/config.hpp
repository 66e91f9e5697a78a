#pragma once

/**
 * @file config.hpp
 * @brief Analysis configuration and its JSON loader
 */

#include "assa/category.hpp"
#include "assa/common.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace assa::config {

/// Configuration document schema version
constexpr const char* kConfigSchemaVersion = "assa_config.v1";

struct AnalysisConfig
{
    double org_factor = 1.0;                ///< > 0
    double critical_path_threshold = 0.7;   ///< (0,1]
    std::size_t path_cutoff = 5;            ///< >= 1 edges
    double budget = 100000.0;               ///< >= 0
    std::optional<std::uint64_t> max_path_expansions;
    model::CategoryTable categories = model::CategoryTable::defaults();
};

/**
 * Check semantic ranges of a configuration.
 * @return Empty on success, InvalidConfig on failure
 */
[[nodiscard]] assa::VoidResult validate_config(const AnalysisConfig& config);

/**
 * Build a configuration from an `assa_config.v1` document. Absent keys keep
 * their defaults; `category_profiles` entries override the default table.
 */
[[nodiscard]] assa::Result<AnalysisConfig> config_from_json(const nlohmann::json& document);

/**
 * Read, schema-validate and convert a configuration file.
 */
[[nodiscard]] assa::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                                       const std::filesystem::path& schema_dir);

}  // namespace assa::config
