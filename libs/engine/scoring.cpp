/**
 * @file scoring.cpp
 * @brief Node scoring, aggregation and risk-level classification
 */

#include "assa/scoring.hpp"

#include <algorithm>

namespace assa::engine {

namespace {

constexpr double kMediumThreshold = 100.0;
constexpr double kHighThreshold = 300.0;
constexpr double kCriticalThreshold = 600.0;

}  // namespace

double normalize_severity(double severity) noexcept
{
    return std::min(severity / model::kMaxSeverity, 1.0);
}

NodeScorer::NodeScorer(double organizational_factor, double alpha) noexcept
    : m_org_factor(organizational_factor)
    , m_alpha(alpha)
{}

double NodeScorer::amplification(const model::GraphView& graph, std::string_view id) const
{
    double factor = 1.0;
    for (const auto& neighbor : graph.neighbors(id)) {
        factor *= (1.0 + m_alpha * neighbor.probability);
    }
    return factor;
}

double NodeScorer::score(const model::GraphView& graph, const model::Asset& asset) const
{
    const double vulnerability = normalize_severity(asset.severity);
    return vulnerability * asset.exposure * amplification(graph, asset.id) * m_org_factor;
}

AggregateScore aggregate(const model::GraphView& graph, const NodeScorer& scorer)
{
    AggregateScore result;
    const auto ids = graph.asset_ids();
    result.nodes.reserve(ids.size());
    result.by_asset.reserve(ids.size());

    for (const auto id : ids) {
        const model::Asset* asset = graph.find_asset(id);
        if (asset == nullptr) {
            continue;
        }
        const double node_score = scorer.score(graph, *asset);
        result.nodes.push_back({.asset_id = asset->id,
                                .category = asset->category,
                                .category_label = asset->category_label,
                                .score = node_score});
        result.by_asset.insert_or_assign(asset->id, node_score);
        result.total += node_score;
    }
    return result;
}

RiskLevel classify_risk_level(double total) noexcept
{
    if (total < kMediumThreshold) {
        return RiskLevel::kLow;
    }
    if (total < kHighThreshold) {
        return RiskLevel::kMedium;
    }
    if (total < kCriticalThreshold) {
        return RiskLevel::kHigh;
    }
    return RiskLevel::kCritical;
}

std::string_view risk_level_name(RiskLevel level) noexcept
{
    switch (level) {
        case RiskLevel::kLow:
            return "LOW";
        case RiskLevel::kMedium:
            return "MEDIUM";
        case RiskLevel::kHigh:
            return "HIGH";
        case RiskLevel::kCritical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

double percent_of(double part, double total) noexcept
{
    if (total == 0.0) {
        return 0.0;
    }
    return part / total * 100.0;
}

}  // namespace assa::engine
