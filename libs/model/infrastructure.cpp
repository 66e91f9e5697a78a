/**
 * @file infrastructure.cpp
 * @brief Infrastructure graph model
 */

#include "assa/infrastructure.hpp"

#include <cmath>
#include <format>
#include <utility>

namespace assa::model {

namespace {

[[nodiscard]] bool in_unit_range(double value) noexcept
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

[[nodiscard]] assa::Error invalid_asset(const Asset& asset, std::string_view detail)
{
    return assa::Error::make("InvalidAsset", std::format("Asset '{}': {}", asset.id, detail));
}

}  // namespace

Asset make_asset(std::string id,
                 std::string category_label,
                 double severity,
                 double exposure,
                 std::map<std::string, double> privileges,
                 std::vector<std::string> services)
{
    const AssetCategory category = parse_category(category_label);
    return Asset{.id = std::move(id),
                 .category = category,
                 .category_label = std::move(category_label),
                 .severity = severity,
                 .exposure = exposure,
                 .privileges = std::move(privileges),
                 .services = std::move(services)};
}

assa::VoidResult validate_asset(const Asset& asset)
{
    if (asset.id.empty()) {
        return std::unexpected(
            assa::Error::make("InvalidAsset", "Asset identifier must not be empty"));
    }
    if (!std::isfinite(asset.severity) || asset.severity < 0.0 || asset.severity > kMaxSeverity) {
        return std::unexpected(
            invalid_asset(asset, std::format("severity {} outside [0,10]", asset.severity)));
    }
    if (!in_unit_range(asset.exposure)) {
        return std::unexpected(
            invalid_asset(asset, std::format("exposure {} outside [0,1]", asset.exposure)));
    }
    for (const auto& [domain, level] : asset.privileges) {
        if (!in_unit_range(level)) {
            return std::unexpected(invalid_asset(
                asset,
                std::format("privilege level {} for '{}' outside [0,1]", level, domain)));
        }
    }
    return {};
}

assa::Result<InfrastructureGraph>
InfrastructureGraph::build(std::vector<Asset> assets, const std::vector<PropagationEdge>& edges)
{
    InfrastructureGraph graph;
    graph.m_assets.reserve(assets.size());
    graph.m_adjacency.resize(assets.size());
    graph.m_edges.reserve(edges.size());

    for (auto& asset : assets) {
        if (auto valid = validate_asset(asset); !valid) {
            return std::unexpected(valid.error());
        }
        const std::size_t index = graph.m_assets.size();
        auto [_, inserted] = graph.m_index.emplace(asset.id, index);
        if (!inserted) {
            return std::unexpected(assa::Error::make(
                "DuplicateAsset",
                std::format("Asset identifier '{}' appears more than once", asset.id)));
        }
        graph.m_assets.push_back(std::move(asset));
    }

    for (const auto& edge : edges) {
        auto source = graph.index_of(edge.source);
        auto target = graph.index_of(edge.target);
        if (!source || !target) {
            return std::unexpected(assa::Error::make(
                "UnknownAsset",
                std::format("Edge {} -> {} references an unknown asset", edge.source, edge.target)));
        }
        if (*source == *target) {
            return std::unexpected(assa::Error::make(
                "InvalidEdge", std::format("Self-loop on asset '{}'", edge.source)));
        }
        const double probability = edge.probability.value_or(kDefaultPropagationProbability);
        if (!std::isfinite(probability) || probability <= 0.0 || probability > 1.0) {
            return std::unexpected(assa::Error::make(
                "InvalidEdge",
                std::format("Edge {} -> {}: propagation probability {} outside (0,1]",
                            edge.source,
                            edge.target,
                            probability)));
        }
        graph.m_adjacency[*source].push_back({.target = *target, .probability = probability});
        graph.m_adjacency[*target].push_back({.target = *source, .probability = probability});
        graph.m_edges.push_back(
            {.source = edge.source, .target = edge.target, .probability = probability});
    }

    return graph;
}

std::vector<std::string_view> InfrastructureGraph::asset_ids() const
{
    std::vector<std::string_view> ids;
    ids.reserve(m_assets.size());
    for (const auto& asset : m_assets) {
        ids.emplace_back(asset.id);
    }
    return ids;
}

const Asset* InfrastructureGraph::find_asset(std::string_view id) const
{
    auto index = index_of(id);
    if (!index) {
        return nullptr;
    }
    return &m_assets[*index];
}

std::vector<Neighbor> InfrastructureGraph::neighbors(std::string_view id) const
{
    std::vector<Neighbor> result;
    auto index = index_of(id);
    if (!index) {
        return result;
    }
    const auto& adjacency = m_adjacency[*index];
    result.reserve(adjacency.size());
    for (const auto& entry : adjacency) {
        result.push_back({.id = m_assets[entry.target].id, .probability = entry.probability});
    }
    return result;
}

double InfrastructureGraph::propagation_probability(std::string_view from,
                                                    std::string_view to) const
{
    auto source = index_of(from);
    auto target = index_of(to);
    if (!source || !target) {
        return kDefaultPropagationProbability;
    }
    for (const auto& entry : m_adjacency[*source]) {
        if (entry.target == *target) {
            return entry.probability;
        }
    }
    return kDefaultPropagationProbability;
}

std::optional<std::size_t> InfrastructureGraph::index_of(std::string_view id) const
{
    if (auto it = m_index.find(id); it != m_index.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace assa::model
