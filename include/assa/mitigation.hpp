#pragma once

/**
 * @file mitigation.hpp
 * @brief Budget-constrained mitigation planning
 */

#include "assa/category.hpp"
#include "assa/infrastructure.hpp"
#include "assa/scoring.hpp"
#include "assa/version.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace assa::engine {

enum class MitigationPriority { kMedium, kHigh, kCritical };

/**
 * CRITICAL above 0.8, HIGH above 0.5, MEDIUM otherwise.
 */
[[nodiscard]] MitigationPriority classify_priority(double score) noexcept;

[[nodiscard]] std::string_view priority_name(MitigationPriority priority) noexcept;

struct MitigationRecord
{
    std::string asset_id;
    std::string category_label;
    double current_score = 0.0;
    std::int64_t cost = 0;
    double risk_reduction = 0.0;
    double roi = 0.0;
    std::string recommendation;
    MitigationPriority priority = MitigationPriority::kMedium;
};

struct MitigationPlan
{
    std::vector<MitigationRecord> mitigations;
    double budget = 0.0;
    std::int64_t total_cost = 0;
    double total_risk_reduction = 0.0;
    double overall_roi = 0.0;          ///< 0 when nothing was spent
    double budget_utilization = 0.0;   ///< Percent of budget spent, 0 for a zero budget
    std::size_t candidates_evaluated = 0;
};

struct PlannerOptions
{
    std::size_t max_candidates = 10;
    double risk_point_value = assa::kRiskPointValue;
};

/**
 * @brief Greedy rank-then-admit mitigation selection
 *
 * Candidates are the highest-scoring assets, considered in descending score
 * order. A candidate is admitted when its cost fits in the remaining budget.
 * The selection is order-dependent and not optimal.
 */
class MitigationPlanner
{
public:
    explicit MitigationPlanner(model::CategoryTable table = model::CategoryTable::defaults(),
                               PlannerOptions options = {});

    [[nodiscard]] MitigationPlan
    plan(const model::GraphView& graph, const AggregateScore& scores, double budget) const;

    /// Base cost scaled by (1 + severity / 10), truncated
    [[nodiscard]] std::int64_t estimate_cost(const model::Asset& asset) const;

    [[nodiscard]] double effectiveness(const model::Asset& asset) const;

private:
    model::CategoryTable m_table;
    PlannerOptions m_options;
};

}  // namespace assa::engine
