/**
 * @file mitigation.cpp
 * @brief Budget-constrained mitigation planning
 */

#include "assa/mitigation.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>

namespace assa::engine {

namespace {

constexpr double kCriticalPriorityScore = 0.8;
constexpr double kHighPriorityScore = 0.5;

}  // namespace

MitigationPriority classify_priority(double score) noexcept
{
    if (score > kCriticalPriorityScore) {
        return MitigationPriority::kCritical;
    }
    if (score > kHighPriorityScore) {
        return MitigationPriority::kHigh;
    }
    return MitigationPriority::kMedium;
}

std::string_view priority_name(MitigationPriority priority) noexcept
{
    switch (priority) {
        case MitigationPriority::kMedium:
            return "MEDIUM";
        case MitigationPriority::kHigh:
            return "HIGH";
        case MitigationPriority::kCritical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

MitigationPlanner::MitigationPlanner(model::CategoryTable table, PlannerOptions options)
    : m_table(std::move(table))
    , m_options(options)
{}

std::int64_t MitigationPlanner::estimate_cost(const model::Asset& asset) const
{
    const double base_cost = m_table.profile(asset.category).base_cost;
    const double severity_multiplier = 1.0 + asset.severity / model::kMaxSeverity;
    return static_cast<std::int64_t>(base_cost * severity_multiplier);
}

double MitigationPlanner::effectiveness(const model::Asset& asset) const
{
    return m_table.profile(asset.category).effectiveness;
}

MitigationPlan MitigationPlanner::plan(const model::GraphView& graph,
                                       const AggregateScore& scores,
                                       double budget) const
{
    std::vector<const NodeScore*> ranked;
    ranked.reserve(scores.nodes.size());
    for (const auto& node : scores.nodes) {
        ranked.push_back(&node);
    }
    std::ranges::stable_sort(ranked, std::ranges::greater{}, [](const NodeScore* node) {
        return node->score;
    });
    if (ranked.size() > m_options.max_candidates) {
        ranked.resize(m_options.max_candidates);
    }

    MitigationPlan plan;
    plan.budget = budget;
    double remaining = budget;

    for (const NodeScore* candidate : ranked) {
        const model::Asset* asset = graph.find_asset(candidate->asset_id);
        if (asset == nullptr) {
            continue;
        }
        ++plan.candidates_evaluated;

        const std::int64_t cost = estimate_cost(*asset);
        // NaN remaining admits nothing
        if (!(static_cast<double>(cost) <= remaining)) {
            continue;
        }

        const double risk_reduction = candidate->score * effectiveness(*asset);
        const double roi =
            cost > 0 ? risk_reduction * m_options.risk_point_value / static_cast<double>(cost)
                     : 0.0;

        plan.mitigations.push_back(
            {.asset_id = asset->id,
             .category_label = asset->category_label,
             .current_score = candidate->score,
             .cost = cost,
             .risk_reduction = risk_reduction,
             .roi = roi,
             .recommendation = m_table.profile(asset->category).recommendation,
             .priority = classify_priority(candidate->score)});
        remaining -= static_cast<double>(cost);
        plan.total_cost += cost;
        plan.total_risk_reduction += risk_reduction;
    }

    if (plan.total_cost > 0) {
        plan.overall_roi = plan.total_risk_reduction * m_options.risk_point_value
                           / static_cast<double>(plan.total_cost);
    }
    plan.budget_utilization = percent_of(static_cast<double>(plan.total_cost), budget);
    return plan;
}

}  // namespace assa::engine
