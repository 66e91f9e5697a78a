/**
 * @file report.cpp
 * @brief Attack-surface report assembly
 */

#include "assa/report.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <utility>

namespace assa::report {

namespace {

struct CategoryAccumulator
{
    std::size_t count = 0;
    double sum = 0.0;
    double max = 0.0;
};

}  // namespace

std::vector<CategoryStats> category_distribution(const std::vector<engine::NodeScore>& nodes,
                                                 double total)
{
    std::vector<std::string> order;
    std::map<std::string, CategoryAccumulator, std::less<>> groups;

    for (const auto& node : nodes) {
        auto [it, inserted] = groups.try_emplace(node.category_label);
        auto& group = it->second;
        if (inserted) {
            order.push_back(node.category_label);
            group.max = node.score;
        }
        ++group.count;
        group.sum += node.score;
        group.max = std::max(group.max, node.score);
    }

    std::vector<CategoryStats> stats;
    stats.reserve(order.size());
    for (const auto& label : order) {
        const auto& group = groups.at(label);
        stats.push_back({.category_label = label,
                         .count = group.count,
                         .mean_score = group.sum / static_cast<double>(group.count),
                         .max_score = group.max,
                         .contribution_percent = engine::percent_of(group.sum, total)});
    }
    return stats;
}

ReportBuilder::ReportBuilder(config::AnalysisConfig config)
    : m_config(std::move(config))
{}

assa::Result<AssaReport> ReportBuilder::build(const model::GraphView& graph,
                                              std::string generated_at) const
{
    if (auto valid = config::validate_config(m_config); !valid) {
        return std::unexpected(valid.error());
    }

    const engine::NodeScorer scorer(m_config.org_factor);
    auto scores = engine::aggregate(graph, scorer);

    const engine::PathAnalyzer analyzer({.threshold = m_config.critical_path_threshold,
                                         .cutoff = m_config.path_cutoff,
                                         .max_expansions = m_config.max_path_expansions});
    auto paths = analyzer.critical_paths(graph);
    if (!paths) {
        return std::unexpected(paths.error());
    }

    const engine::MitigationPlanner planner(m_config.categories);
    auto plan = planner.plan(graph, scores, m_config.budget);

    AssaReport report;
    report.generated_at = std::move(generated_at);
    report.org_factor = m_config.org_factor;
    report.critical_path_threshold = m_config.critical_path_threshold;
    report.path_cutoff = m_config.path_cutoff;
    report.total_score = scores.total;
    report.risk_level = engine::classify_risk_level(scores.total);
    report.components_analyzed = scores.nodes.size();
    report.category_distribution = category_distribution(scores.nodes, scores.total);

    report.top_vulnerable = scores.nodes;
    std::ranges::stable_sort(report.top_vulnerable,
                             std::ranges::greater{},
                             &engine::NodeScore::score);
    if (report.top_vulnerable.size() > kTopVulnerableCount) {
        report.top_vulnerable.resize(kTopVulnerableCount);
    }

    report.node_scores = std::move(scores.nodes);
    report.critical_paths = std::move(*paths);
    report.mitigation_plan = std::move(plan);
    return report;
}

}  // namespace assa::report
