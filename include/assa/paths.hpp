#pragma once

/**
 * @file paths.hpp
 * @brief Critical attack path enumeration and scoring
 */

#include "assa/common.hpp"
#include "assa/infrastructure.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace assa::engine {

/// Assets with exposure strictly above this value are path sources
constexpr double kExposedThreshold = 0.5;

struct PathAnalysisOptions
{
    double threshold = 0.7;   ///< Keep paths whose probability is strictly greater
    std::size_t cutoff = 5;   ///< Maximum number of edges in a path
    /// Ceiling on partial paths expanded during enumeration; unset means exhaustive
    std::optional<std::uint64_t> max_expansions;
};

struct CriticalPath
{
    std::vector<std::string> assets;  ///< Ordered, no repeats
    double probability = 0.0;
    double risk = 0.0;
};

/**
 * Product of edge probabilities along consecutive assets of a path.
 * A path with a single asset has probability 1.
 */
[[nodiscard]] double path_probability(const model::GraphView& graph,
                                      std::span<const std::string_view> path);

/**
 * Mean of normalized_severity * exposure over the assets of a path,
 * 0 for an empty path.
 */
[[nodiscard]] double path_risk(const model::GraphView& graph,
                               std::span<const std::string_view> path);

/**
 * @brief Enumerates simple paths from exposed assets to high-value assets
 *
 * Every simple path of at most `cutoff` edges from a source (exposure > 0.5)
 * to a different sink (server or database) is scored; paths with probability
 * above `threshold` are returned sorted by risk, highest first.
 *
 * The path space grows exponentially with branching factor and cutoff.
 */
class PathAnalyzer
{
public:
    explicit PathAnalyzer(PathAnalysisOptions options = {});

    /**
     * @return Ranked critical paths, or PathBudgetExceeded when
     *         max_expansions is set and reached
     */
    [[nodiscard]] assa::Result<std::vector<CriticalPath>>
    critical_paths(const model::GraphView& graph) const;

    [[nodiscard]] const PathAnalysisOptions& options() const noexcept { return m_options; }

private:
    PathAnalysisOptions m_options;
};

}  // namespace assa::engine
