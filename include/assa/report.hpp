#pragma once

/**
 * @file report.hpp
 * @brief Attack-surface report assembly
 */

#include "assa/common.hpp"
#include "assa/config.hpp"
#include "assa/infrastructure.hpp"
#include "assa/mitigation.hpp"
#include "assa/paths.hpp"
#include "assa/scoring.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace assa::report {

/// Components listed in the top-vulnerable section
constexpr std::size_t kTopVulnerableCount = 10;

/// Critical paths listed in the top-paths section of a report document
constexpr std::size_t kTopPathCount = 5;

struct CategoryStats
{
    std::string category_label;
    std::size_t count = 0;
    double mean_score = 0.0;
    double max_score = 0.0;
    double contribution_percent = 0.0;  ///< 0 when the total is zero
};

struct AssaReport
{
    std::string generated_at;
    double org_factor = 1.0;
    double critical_path_threshold = 0.7;
    std::size_t path_cutoff = 5;
    double total_score = 0.0;
    engine::RiskLevel risk_level = engine::RiskLevel::kLow;
    std::size_t components_analyzed = 0;
    std::vector<engine::NodeScore> node_scores;          ///< Graph order
    std::vector<engine::NodeScore> top_vulnerable;       ///< Descending, at most 10
    std::vector<engine::CriticalPath> critical_paths;    ///< Descending risk
    std::vector<CategoryStats> category_distribution;    ///< First-appearance order
    engine::MitigationPlan mitigation_plan;
};

/**
 * Group node scores by category label, in first-appearance order.
 */
[[nodiscard]] std::vector<CategoryStats>
category_distribution(const std::vector<engine::NodeScore>& nodes, double total);

/**
 * @brief Runs aggregation, path analysis and mitigation planning once each
 * over one graph snapshot and merges the results.
 */
class ReportBuilder
{
public:
    explicit ReportBuilder(config::AnalysisConfig config);

    [[nodiscard]] assa::Result<AssaReport> build(const model::GraphView& graph,
                                                 std::string generated_at) const;

    [[nodiscard]] const config::AnalysisConfig& config() const noexcept { return m_config; }

private:
    config::AnalysisConfig m_config;
};

}  // namespace assa::report
