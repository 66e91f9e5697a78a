/**
 * @file test_scoring.cpp
 * @brief Tests for node scoring, aggregation and risk levels
 */

#include "assa/infrastructure.hpp"
#include "assa/scoring.hpp"

#include "graph_fixtures.hpp"

#include <optional>

#include <gtest/gtest.h>

namespace assa::engine::test {

TEST(NodeScorerTest, IsolatedAssetIsSeverityTimesExposure)
{
    auto graph = build_graph({model::make_asset("pos_001", "pos", 6.5, 0.8)});
    const NodeScorer scorer;

    EXPECT_DOUBLE_EQ(scorer.amplification(graph, "pos_001"), 1.0);
    EXPECT_DOUBLE_EQ(scorer.score(graph, *graph.find_asset("pos_001")), 0.65 * 0.8);
}

TEST(NodeScorerTest, OrganizationalFactorScalesLinearly)
{
    auto graph = build_graph({model::make_asset("db_primary", "database", 8.2, 0.1)});
    const NodeScorer scorer(1.5);

    EXPECT_DOUBLE_EQ(scorer.score(graph, *graph.find_asset("db_primary")), 0.82 * 0.1 * 1.5);
}

TEST(NodeScorerTest, SingleEdgeAmplification)
{
    auto graph = build_graph({model::make_asset("a", "server", 5.0, 0.5),
                              model::make_asset("b", "server", 5.0, 0.5)},
                             {{.source = "a", .target = "b", .probability = 0.5}});
    const NodeScorer scorer;

    EXPECT_DOUBLE_EQ(scorer.amplification(graph, "a"), 1.365);
    EXPECT_DOUBLE_EQ(scorer.amplification(graph, "b"), 1.365);
    EXPECT_DOUBLE_EQ(scorer.score(graph, *graph.find_asset("a")), 0.5 * 0.5 * 1.365);
}

TEST(NodeScorerTest, AmplificationMultipliesOverIncidentEdges)
{
    auto graph = build_graph({model::make_asset("hub", "network", 6.0, 0.5),
                              model::make_asset("x", "iot", 4.0, 0.9),
                              model::make_asset("y", "iot", 4.0, 0.9)},
                             {{.source = "hub", .target = "x", .probability = 0.5},
                              {.source = "y", .target = "hub", .probability = std::nullopt}});
    const NodeScorer scorer;

    EXPECT_DOUBLE_EQ(scorer.amplification(graph, "hub"), (1.0 + 0.73 * 0.5) * (1.0 + 0.73 * 0.1));
    EXPECT_DOUBLE_EQ(scorer.amplification(graph, "y"), 1.0 + 0.73 * 0.1);
}

TEST(NodeScorerTest, ZeroExposureScoresZero)
{
    auto graph = build_graph({model::make_asset("vault", "database", 9.8, 0.0),
                              model::make_asset("web", "server", 9.8, 1.0)},
                             {{.source = "vault", .target = "web", .probability = 1.0}});
    const NodeScorer scorer;

    EXPECT_EQ(scorer.score(graph, *graph.find_asset("vault")), 0.0);
}

TEST(NodeScorerTest, SeverityAboveScaleClamps)
{
    EXPECT_DOUBLE_EQ(normalize_severity(12.0), 1.0);
    EXPECT_DOUBLE_EQ(normalize_severity(10.0), 1.0);
    EXPECT_DOUBLE_EQ(normalize_severity(4.0), 0.4);

    // GraphView implementations are not required to validate ranges.
    model::Asset asset = model::make_asset("legacy", "server", 14.0, 0.5);
    const FakeGraph graph({asset}, {});
    EXPECT_DOUBLE_EQ(NodeScorer().score(graph, asset), 0.5);
}

TEST(AggregateTest, TotalIsExactSumOfNodes)
{
    auto graph = build_graph({model::make_asset("pos_001", "pos", 6.5, 0.8),
                              model::make_asset("network_core", "network", 6.1, 0.5),
                              model::make_asset("server_main", "server", 7.8, 0.3),
                              model::make_asset("iot_sensor_1", "iot", 5.2, 0.9)},
                             {{.source = "pos_001", .target = "network_core", .probability = 0.6},
                              {.source = "network_core", .target = "server_main", .probability = 0.7},
                              {.source = "iot_sensor_1", .target = "network_core", .probability = 0.3}});

    auto result = aggregate(graph, NodeScorer(1.2));

    ASSERT_EQ(result.nodes.size(), 4U);
    double sum = 0.0;
    for (const auto& node : result.nodes) {
        sum += node.score;
        EXPECT_EQ(result.by_asset.at(node.asset_id), node.score);
    }
    EXPECT_EQ(result.total, sum);
}

TEST(AggregateTest, PreservesGraphOrderAndLabels)
{
    auto graph = build_graph({model::make_asset("b", "printer", 3.0, 0.4),
                              model::make_asset("a", "pos", 3.0, 0.4)});

    auto result = aggregate(graph, NodeScorer());

    ASSERT_EQ(result.nodes.size(), 2U);
    EXPECT_EQ(result.nodes[0].asset_id, "b");
    EXPECT_EQ(result.nodes[0].category, model::AssetCategory::kOther);
    EXPECT_EQ(result.nodes[0].category_label, "printer");
    EXPECT_EQ(result.nodes[1].asset_id, "a");
    EXPECT_EQ(result.nodes[1].category, model::AssetCategory::kPointOfSale);
}

TEST(AggregateTest, EmptyGraphIsZero)
{
    auto graph = build_graph({});

    auto result = aggregate(graph, NodeScorer());

    EXPECT_EQ(result.total, 0.0);
    EXPECT_TRUE(result.nodes.empty());
    EXPECT_EQ(classify_risk_level(result.total), RiskLevel::kLow);
}

TEST(AggregateTest, WorksOverAnyGraphView)
{
    const FakeGraph graph({model::make_asset("a", "server", 5.0, 0.5),
                           model::make_asset("b", "server", 5.0, 0.5)},
                          {{.a = "a", .b = "b", .probability = 0.5}});

    auto result = aggregate(graph, NodeScorer());

    ASSERT_EQ(result.nodes.size(), 2U);
    EXPECT_DOUBLE_EQ(result.by_asset.at("a"), 0.5 * 0.5 * 1.365);
    EXPECT_DOUBLE_EQ(result.total, 2.0 * 0.5 * 0.5 * 1.365);
}

TEST(RiskLevelTest, Boundaries)
{
    EXPECT_EQ(classify_risk_level(0.0), RiskLevel::kLow);
    EXPECT_EQ(classify_risk_level(99.999), RiskLevel::kLow);
    EXPECT_EQ(classify_risk_level(100.0), RiskLevel::kMedium);
    EXPECT_EQ(classify_risk_level(299.999), RiskLevel::kMedium);
    EXPECT_EQ(classify_risk_level(300.0), RiskLevel::kHigh);
    EXPECT_EQ(classify_risk_level(599.999), RiskLevel::kHigh);
    EXPECT_EQ(classify_risk_level(600.0), RiskLevel::kCritical);
    EXPECT_EQ(classify_risk_level(1.0e6), RiskLevel::kCritical);
}

TEST(RiskLevelTest, Names)
{
    EXPECT_EQ(risk_level_name(RiskLevel::kLow), "LOW");
    EXPECT_EQ(risk_level_name(RiskLevel::kMedium), "MEDIUM");
    EXPECT_EQ(risk_level_name(RiskLevel::kHigh), "HIGH");
    EXPECT_EQ(risk_level_name(RiskLevel::kCritical), "CRITICAL");
    EXPECT_EQ(risk_level_name(static_cast<RiskLevel>(42)), "UNKNOWN");
}

TEST(PercentOfTest, ZeroTotalGivesZero)
{
    EXPECT_EQ(percent_of(5.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(percent_of(1.0, 4.0), 25.0);
}

}  // namespace assa::engine::test
