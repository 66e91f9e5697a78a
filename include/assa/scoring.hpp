#pragma once

/**
 * @file scoring.hpp
 * @brief Node scoring, aggregation and risk-level classification
 */

#include "assa/infrastructure.hpp"
#include "assa/version.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace assa::engine {

/**
 * Normalize a CVSS base severity to [0,1]. Values above 10 clamp to 1;
 * nothing else is clamped.
 */
[[nodiscard]] double normalize_severity(double severity) noexcept;

/**
 * @brief Per-node attack-surface contribution
 *
 * score = V * exposure * amplification * organizational_factor, with
 * V = min(severity / 10, 1) and amplification the product of
 * (1 + alpha * P) over every incident edge.
 */
class NodeScorer
{
public:
    explicit NodeScorer(double organizational_factor = 1.0,
                        double alpha = assa::kAmplificationAlpha) noexcept;

    [[nodiscard]] double score(const model::GraphView& graph, const model::Asset& asset) const;

    /// Product of (1 + alpha * P) over the asset's edges, 1.0 for an isolated asset
    [[nodiscard]] double amplification(const model::GraphView& graph, std::string_view id) const;

    [[nodiscard]] double organizational_factor() const noexcept { return m_org_factor; }
    [[nodiscard]] double alpha() const noexcept { return m_alpha; }

private:
    double m_org_factor;
    double m_alpha;
};

struct NodeScore
{
    std::string asset_id;
    model::AssetCategory category = model::AssetCategory::kOther;
    std::string category_label;
    double score = 0.0;
};

/**
 * @brief Aggregated attack surface
 *
 * `nodes` follows the graph's iteration order; `total` is the left-to-right
 * sum of `nodes`, so it equals the sum of the per-node scores exactly.
 */
struct AggregateScore
{
    double total = 0.0;
    std::vector<NodeScore> nodes;
    std::unordered_map<std::string, double> by_asset;
};

[[nodiscard]] AggregateScore aggregate(const model::GraphView& graph, const NodeScorer& scorer);

enum class RiskLevel { kLow, kMedium, kHigh, kCritical };

/**
 * Step function on the total: [0,100) LOW, [100,300) MEDIUM,
 * [300,600) HIGH, [600,inf) CRITICAL.
 */
[[nodiscard]] RiskLevel classify_risk_level(double total) noexcept;

[[nodiscard]] std::string_view risk_level_name(RiskLevel level) noexcept;

/**
 * part / total * 100, or 0 when total is zero.
 */
[[nodiscard]] double percent_of(double part, double total) noexcept;

}  // namespace assa::engine
