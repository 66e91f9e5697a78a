/**
 * @file paths.cpp
 * @brief Critical attack path enumeration and scoring
 *
 * Enumeration is an explicit depth-first traversal: one frame per asset on
 * the current path, a shared path buffer, and a running prefix product of
 * edge probabilities. Call-stack depth stays constant regardless of cutoff.
 */

#include "assa/paths.hpp"

#include "assa/scoring.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <unordered_set>
#include <utility>

namespace assa::engine {

namespace {

struct Frame
{
    std::vector<model::Neighbor> neighbors;
    std::size_t cursor = 0;
};

[[nodiscard]] bool is_source(const model::Asset& asset) noexcept
{
    return asset.exposure > kExposedThreshold;
}

[[nodiscard]] bool is_sink(const model::Asset& asset) noexcept
{
    return model::is_high_value(asset.category);
}

class PathEnumerator
{
public:
    PathEnumerator(const model::GraphView& graph, const PathAnalysisOptions& options)
        : m_graph(graph)
        , m_options(options)
    {}

    [[nodiscard]] assa::VoidResult enumerate_from(std::string_view source,
                                                  std::vector<CriticalPath>& out)
    {
        m_path.assign(1, source);
        m_prefix.assign(1, 1.0);
        m_on_path.clear();
        m_on_path.insert(source);

        std::vector<Frame> stack;
        stack.push_back({.neighbors = m_graph.neighbors(source), .cursor = 0});

        while (!stack.empty()) {
            Frame& frame = stack.back();
            if (frame.cursor == frame.neighbors.size()) {
                stack.pop_back();
                m_on_path.erase(m_path.back());
                m_path.pop_back();
                m_prefix.pop_back();
                continue;
            }

            const model::Neighbor next = frame.neighbors[frame.cursor++];
            if (m_on_path.contains(next.id)) {
                continue;
            }
            if (auto budget = charge_expansion(); !budget) {
                return budget;
            }

            m_path.push_back(next.id);
            m_prefix.push_back(m_prefix.back() * next.probability);

            const model::Asset* asset = m_graph.find_asset(next.id);
            if (asset != nullptr && is_sink(*asset)) {
                emit(out);
            }

            // m_path holds (size - 1) edges
            if (m_path.size() - 1 < m_options.cutoff) {
                m_on_path.insert(next.id);
                stack.push_back({.neighbors = m_graph.neighbors(next.id), .cursor = 0});
            } else {
                m_path.pop_back();
                m_prefix.pop_back();
            }
        }
        return {};
    }

private:
    [[nodiscard]] assa::VoidResult charge_expansion()
    {
        ++m_expansions;
        if (m_options.max_expansions && m_expansions > *m_options.max_expansions) {
            return std::unexpected(assa::Error::make(
                "PathBudgetExceeded",
                std::format("Path enumeration exceeded {} expansions (cutoff {})",
                            *m_options.max_expansions,
                            m_options.cutoff)));
        }
        return {};
    }

    void emit(std::vector<CriticalPath>& out) const
    {
        const double probability = m_prefix.back();
        if (!(probability > m_options.threshold)) {
            return;
        }
        CriticalPath path;
        path.assets.reserve(m_path.size());
        for (const auto id : m_path) {
            path.assets.emplace_back(id);
        }
        path.probability = probability;
        path.risk = path_risk(m_graph, m_path);
        out.push_back(std::move(path));
    }

    const model::GraphView& m_graph;
    const PathAnalysisOptions& m_options;
    std::vector<std::string_view> m_path;
    std::vector<double> m_prefix;
    std::unordered_set<std::string_view> m_on_path;
    std::uint64_t m_expansions = 0;
};

}  // namespace

double path_probability(const model::GraphView& graph, std::span<const std::string_view> path)
{
    double probability = 1.0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        probability *= graph.propagation_probability(path[i - 1], path[i]);
    }
    return probability;
}

double path_risk(const model::GraphView& graph, std::span<const std::string_view> path)
{
    if (path.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto id : path) {
        const model::Asset* asset = graph.find_asset(id);
        if (asset == nullptr) {
            continue;
        }
        total += normalize_severity(asset->severity) * asset->exposure;
    }
    return total / static_cast<double>(path.size());
}

PathAnalyzer::PathAnalyzer(PathAnalysisOptions options)
    : m_options(std::move(options))
{}

assa::Result<std::vector<CriticalPath>>
PathAnalyzer::critical_paths(const model::GraphView& graph) const
{
    std::vector<CriticalPath> paths;
    if (m_options.cutoff == 0) {
        return paths;
    }

    PathEnumerator enumerator(graph, m_options);
    for (const auto id : graph.asset_ids()) {
        const model::Asset* asset = graph.find_asset(id);
        if (asset == nullptr || !is_source(*asset)) {
            continue;
        }
        if (auto result = enumerator.enumerate_from(id, paths); !result) {
            return std::unexpected(result.error());
        }
    }

    std::ranges::stable_sort(paths, std::ranges::greater{}, &CriticalPath::risk);
    return paths;
}

}  // namespace assa::engine
