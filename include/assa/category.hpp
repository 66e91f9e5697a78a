#pragma once

/**
 * @file category.hpp
 * @brief Asset categories and the per-category mitigation table
 */

#include <map>
#include <string>
#include <string_view>

namespace assa::model {

/**
 * Asset category. The set of labels is open: any label that is not one of the
 * known ones maps to kOther and is served by the table's default branch.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class AssetCategory {
    kPointOfSale,  ///< "pos"
    kServer,       ///< "server"
    kNetwork,      ///< "network"
    kIot,          ///< "iot"
    kDatabase,     ///< "database"
    kOther         ///< Any other label
};

[[nodiscard]] AssetCategory parse_category(std::string_view label) noexcept;

/**
 * Canonical label of a category ("other" for kOther).
 */
[[nodiscard]] std::string_view category_label(AssetCategory category) noexcept;

/**
 * High-value categories are the sinks of critical-path analysis.
 */
[[nodiscard]] bool is_high_value(AssetCategory category) noexcept;

struct CategoryProfile
{
    double base_cost = 1000.0;      ///< One-time mitigation cost before severity scaling
    double effectiveness = 0.70;    ///< Fraction of the node score removed by mitigation
    std::string recommendation;     ///< Human-readable mitigation action
};

/**
 * Lookup from category to mitigation profile with an explicit default branch.
 */
class CategoryTable
{
public:
    CategoryTable(std::map<AssetCategory, CategoryProfile> entries, CategoryProfile fallback);

    /// Table calibrated for retail infrastructure
    [[nodiscard]] static CategoryTable defaults();

    [[nodiscard]] const CategoryProfile& profile(AssetCategory category) const;
    [[nodiscard]] const CategoryProfile& fallback() const noexcept { return m_fallback; }

    /// Replace one entry; kOther replaces the default branch.
    void set_profile(AssetCategory category, CategoryProfile profile);

private:
    std::map<AssetCategory, CategoryProfile> m_entries;
    CategoryProfile m_fallback;
};

}  // namespace assa::model
