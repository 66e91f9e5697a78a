#pragma once

/**
 * @file infrastructure.hpp
 * @brief Infrastructure graph model: assets, propagation edges, graph view
 */

#include "assa/category.hpp"
#include "assa/common.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace assa::model {

/// Propagation probability of an edge that does not specify one
constexpr double kDefaultPropagationProbability = 0.1;

/// Maximum CVSS base severity
constexpr double kMaxSeverity = 10.0;

/**
 * @brief An infrastructure asset (graph node)
 */
struct Asset
{
    std::string id;
    AssetCategory category = AssetCategory::kOther;
    std::string category_label;                ///< Label as supplied (open set)
    double severity = 0.0;                     ///< CVSS base score, [0,10]
    double exposure = 0.0;                     ///< Reachability from outside, [0,1]
    std::map<std::string, double> privileges;  ///< Privilege domain -> level, [0,1]
    std::vector<std::string> services;         ///< Informational only
};

/**
 * @brief Undirected propagation relation between two assets
 */
struct PropagationEdge
{
    std::string source;
    std::string target;
    std::optional<double> probability;  ///< kDefaultPropagationProbability when absent
};

struct Neighbor
{
    std::string_view id;
    double probability = kDefaultPropagationProbability;
};

/**
 * @brief Read-only capability contract consumed by the scoring engine
 *
 * Scorer and path analyzer only depend on this interface, so any graph
 * representation can be analyzed. Views returned by an implementation stay
 * valid for the lifetime of the graph.
 */
class GraphView
{
public:
    GraphView() = default;
    virtual ~GraphView() = default;

    GraphView(const GraphView&) = default;
    GraphView& operator=(const GraphView&) = default;
    GraphView(GraphView&&) = default;
    GraphView& operator=(GraphView&&) = default;

    /// All asset identifiers, in the graph's iteration order
    [[nodiscard]] virtual std::vector<std::string_view> asset_ids() const = 0;

    /// Asset record by identifier, nullptr when unknown
    [[nodiscard]] virtual const Asset* find_asset(std::string_view id) const = 0;

    /// Direct neighbors of an asset with the probability of the connecting edge
    [[nodiscard]] virtual std::vector<Neighbor> neighbors(std::string_view id) const = 0;

    /// Probability of the edge between two assets, kDefaultPropagationProbability if absent
    [[nodiscard]] virtual double propagation_probability(std::string_view from,
                                                         std::string_view to) const = 0;

    [[nodiscard]] virtual std::size_t asset_count() const = 0;
};

/**
 * Build an asset, resolving the category label.
 */
[[nodiscard]] Asset make_asset(std::string id,
                               std::string category_label,
                               double severity,
                               double exposure,
                               std::map<std::string, double> privileges = {},
                               std::vector<std::string> services = {});

/**
 * Check asset ranges: non-empty id, severity in [0,10], exposure and
 * privilege levels in [0,1], all values finite.
 * @return Empty on success, InvalidAsset on failure
 */
[[nodiscard]] assa::VoidResult validate_asset(const Asset& asset);

/**
 * @brief Adjacency-list graph, immutable after construction
 */
class InfrastructureGraph final : public GraphView
{
public:
    /**
     * Build a graph from assets and edges.
     * Errors: InvalidAsset, DuplicateAsset, UnknownAsset, InvalidEdge.
     * Duplicate edges are not detected.
     */
    [[nodiscard]] static assa::Result<InfrastructureGraph>
    build(std::vector<Asset> assets, const std::vector<PropagationEdge>& edges);

    [[nodiscard]] std::vector<std::string_view> asset_ids() const override;
    [[nodiscard]] const Asset* find_asset(std::string_view id) const override;
    [[nodiscard]] std::vector<Neighbor> neighbors(std::string_view id) const override;
    [[nodiscard]] double propagation_probability(std::string_view from,
                                                 std::string_view to) const override;
    [[nodiscard]] std::size_t asset_count() const override { return m_assets.size(); }

    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edges.size(); }
    [[nodiscard]] std::span<const Asset> assets() const noexcept { return m_assets; }

    /// Edges in construction order, probability always set
    [[nodiscard]] std::span<const PropagationEdge> edges() const noexcept { return m_edges; }

private:
    struct Adjacency
    {
        std::size_t target = 0;
        double probability = kDefaultPropagationProbability;
    };

    InfrastructureGraph() = default;

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view id) const;

    std::vector<Asset> m_assets;
    std::map<std::string, std::size_t, std::less<>> m_index;
    std::vector<std::vector<Adjacency>> m_adjacency;
    std::vector<PropagationEdge> m_edges;
};

}  // namespace assa::model
