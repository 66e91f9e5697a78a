/**
 * @file config.cpp
 * @brief Analysis configuration and its JSON loader
 */

#include "assa/config.hpp"

#include "assa/json_io.hpp"

#include <cmath>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace assa::config {

namespace {

constexpr std::string_view kDefaultProfileKey = "default";

[[nodiscard]] assa::Error invalid_config(std::string message)
{
    return assa::Error::make("InvalidConfig", std::move(message));
}

[[nodiscard]] assa::Result<double> read_number(const nlohmann::json& document,
                                               const std::string& key,
                                               double fallback)
{
    if (!document.contains(key)) {
        return fallback;
    }
    const auto& value = document.at(key);
    if (!value.is_number()) {
        return std::unexpected(invalid_config(std::format("'{}' must be a number", key)));
    }
    return value.get<double>();
}

[[nodiscard]] assa::Result<std::uint64_t> read_count(const nlohmann::json& document,
                                                     const std::string& key,
                                                     std::uint64_t fallback)
{
    if (!document.contains(key)) {
        return fallback;
    }
    const auto& value = document.at(key);
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
        return std::unexpected(
            invalid_config(std::format("'{}' must be a non-negative integer", key)));
    }
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
}

[[nodiscard]] assa::Result<model::CategoryProfile>
merge_profile(model::CategoryProfile profile, const nlohmann::json& entry, std::string_view label)
{
    if (!entry.is_object()) {
        return std::unexpected(
            invalid_config(std::format("category_profiles.{} must be an object", label)));
    }
    auto base_cost = read_number(entry, "base_cost", profile.base_cost);
    if (!base_cost) {
        return std::unexpected(base_cost.error());
    }
    auto effectiveness = read_number(entry, "effectiveness", profile.effectiveness);
    if (!effectiveness) {
        return std::unexpected(effectiveness.error());
    }
    profile.base_cost = *base_cost;
    profile.effectiveness = *effectiveness;
    if (entry.contains("recommendation")) {
        if (!entry.at("recommendation").is_string()) {
            return std::unexpected(invalid_config(
                std::format("category_profiles.{}.recommendation must be a string", label)));
        }
        profile.recommendation = entry.at("recommendation").get<std::string>();
    }
    return profile;
}

[[nodiscard]] assa::VoidResult apply_category_profiles(model::CategoryTable& table,
                                                       const nlohmann::json& profiles)
{
    if (!profiles.is_object()) {
        return std::unexpected(invalid_config("'category_profiles' must be an object"));
    }
    for (const auto& [label, entry] : profiles.items()) {
        model::AssetCategory category = model::AssetCategory::kOther;
        if (label != kDefaultProfileKey) {
            category = model::parse_category(label);
            if (category == model::AssetCategory::kOther) {
                return std::unexpected(invalid_config(std::format(
                    "Unknown category '{}' in category_profiles (use 'default' for the fallback)",
                    label)));
            }
        }
        auto merged = merge_profile(table.profile(category), entry, label);
        if (!merged) {
            return std::unexpected(merged.error());
        }
        table.set_profile(category, std::move(*merged));
    }
    return {};
}

[[nodiscard]] assa::VoidResult validate_profile(const model::CategoryProfile& profile,
                                                std::string_view label)
{
    if (!std::isfinite(profile.base_cost) || profile.base_cost <= 0.0) {
        return std::unexpected(invalid_config(
            std::format("base_cost for '{}' must be positive, got {}", label, profile.base_cost)));
    }
    if (!std::isfinite(profile.effectiveness) || profile.effectiveness < 0.0
        || profile.effectiveness > 1.0) {
        return std::unexpected(invalid_config(std::format(
            "effectiveness for '{}' must be in [0,1], got {}", label, profile.effectiveness)));
    }
    return {};
}

}  // namespace

assa::VoidResult validate_config(const AnalysisConfig& config)
{
    if (!std::isfinite(config.org_factor) || config.org_factor <= 0.0) {
        return std::unexpected(invalid_config(
            std::format("org_factor must be positive, got {}", config.org_factor)));
    }
    if (!std::isfinite(config.critical_path_threshold) || config.critical_path_threshold <= 0.0
        || config.critical_path_threshold > 1.0) {
        return std::unexpected(invalid_config(std::format(
            "critical_path_threshold must be in (0,1], got {}", config.critical_path_threshold)));
    }
    if (config.path_cutoff == 0) {
        return std::unexpected(invalid_config("path_cutoff must be at least 1"));
    }
    if (!std::isfinite(config.budget) || config.budget < 0.0) {
        return std::unexpected(
            invalid_config(std::format("budget must be non-negative, got {}", config.budget)));
    }
    for (const auto category : {model::AssetCategory::kPointOfSale,
                                model::AssetCategory::kServer,
                                model::AssetCategory::kNetwork,
                                model::AssetCategory::kIot,
                                model::AssetCategory::kDatabase,
                                model::AssetCategory::kOther}) {
        if (auto valid = validate_profile(config.categories.profile(category),
                                          model::category_label(category));
            !valid) {
            return valid;
        }
    }
    return {};
}

assa::Result<AnalysisConfig> config_from_json(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return std::unexpected(invalid_config("Configuration must be a JSON object"));
    }

    AnalysisConfig config;
    auto org_factor = read_number(document, "org_factor", config.org_factor);
    if (!org_factor) {
        return std::unexpected(org_factor.error());
    }
    auto threshold =
        read_number(document, "critical_path_threshold", config.critical_path_threshold);
    if (!threshold) {
        return std::unexpected(threshold.error());
    }
    auto cutoff = read_count(document, "path_cutoff", config.path_cutoff);
    if (!cutoff) {
        return std::unexpected(cutoff.error());
    }
    auto budget = read_number(document, "budget", config.budget);
    if (!budget) {
        return std::unexpected(budget.error());
    }

    config.org_factor = *org_factor;
    config.critical_path_threshold = *threshold;
    config.path_cutoff = static_cast<std::size_t>(*cutoff);
    config.budget = *budget;

    if (document.contains("max_path_expansions")) {
        auto ceiling = read_count(document, "max_path_expansions", 0);
        if (!ceiling) {
            return std::unexpected(ceiling.error());
        }
        config.max_path_expansions = *ceiling;
    }
    if (document.contains("category_profiles")) {
        if (auto applied = apply_category_profiles(config.categories,
                                                   document.at("category_profiles"));
            !applied) {
            return std::unexpected(applied.error());
        }
    }

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

assa::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                         const std::filesystem::path& schema_dir)
{
    auto document = common::read_validated_json(path, schema_dir, kConfigSchemaVersion);
    if (!document) {
        return std::unexpected(document.error());
    }
    return config_from_json(*document);
}

}  // namespace assa::config
