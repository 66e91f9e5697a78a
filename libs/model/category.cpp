/**
 * @file category.cpp
 * @brief Asset categories and the per-category mitigation table
 */

#include "assa/category.hpp"

#include <array>
#include <utility>

namespace assa::model {

namespace {

struct CategoryName
{
    std::string_view label;
    AssetCategory category;
};

constexpr std::array<CategoryName, 5> kCategoryNames = {
    {{"pos", AssetCategory::kPointOfSale},
     {"server", AssetCategory::kServer},
     {"network", AssetCategory::kNetwork},
     {"iot", AssetCategory::kIot},
     {"database", AssetCategory::kDatabase}}
};

}  // namespace

AssetCategory parse_category(std::string_view label) noexcept
{
    for (const auto& entry : kCategoryNames) {
        if (entry.label == label) {
            return entry.category;
        }
    }
    return AssetCategory::kOther;
}

std::string_view category_label(AssetCategory category) noexcept
{
    for (const auto& entry : kCategoryNames) {
        if (entry.category == category) {
            return entry.label;
        }
    }
    return "other";
}

bool is_high_value(AssetCategory category) noexcept
{
    return category == AssetCategory::kServer || category == AssetCategory::kDatabase;
}

CategoryTable::CategoryTable(std::map<AssetCategory, CategoryProfile> entries,
                             CategoryProfile fallback)
    : m_entries(std::move(entries))
    , m_fallback(std::move(fallback))
{
    m_entries.erase(AssetCategory::kOther);
}

CategoryTable CategoryTable::defaults()
{
    std::map<AssetCategory, CategoryProfile> entries = {
        {AssetCategory::kPointOfSale,
         {.base_cost = 500.0,
          .effectiveness = 0.70,
          .recommendation = "Update POS firmware, enforce network segmentation"}},
        {AssetCategory::kServer,
         {.base_cost = 5000.0,
          .effectiveness = 0.80,
          .recommendation = "OS hardening, automated patch management, advanced monitoring"}},
        {AssetCategory::kNetwork,
         {.base_cost = 3000.0,
          .effectiveness = 0.85,
          .recommendation = "Micro-segmentation, Zero Trust architecture, traffic monitoring"}},
        {AssetCategory::kIot,
         {.base_cost = 200.0,
          .effectiveness = 0.60,
          .recommendation = "Firmware update, VLAN isolation, anomaly monitoring"}},
        {AssetCategory::kDatabase,
         {.base_cost = 8000.0,
          .effectiveness = 0.90,
          .recommendation = "Encryption at rest and in transit, access control, audit logging"}},
    };
    return CategoryTable(std::move(entries),
                         {.base_cost = 1000.0,
                          .effectiveness = 0.70,
                          .recommendation = "Security configuration review"});
}

const CategoryProfile& CategoryTable::profile(AssetCategory category) const
{
    if (auto it = m_entries.find(category); it != m_entries.end()) {
        return it->second;
    }
    return m_fallback;
}

void CategoryTable::set_profile(AssetCategory category, CategoryProfile profile)
{
    if (category == AssetCategory::kOther) {
        m_fallback = std::move(profile);
        return;
    }
    m_entries.insert_or_assign(category, std::move(profile));
}

}  // namespace assa::model
