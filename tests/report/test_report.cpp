/**
 * @file test_report.cpp
 * @brief Tests for report assembly over the sample network
 */

#include "assa/infrastructure_io.hpp"
#include "assa/report.hpp"

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace assa::report::test {

namespace {

model::InfrastructureGraph sample_graph()
{
    auto graph = model::sample_infrastructure();
    if (!graph) {
        throw std::runtime_error(graph.error().message);
    }
    return std::move(*graph);
}

}  // namespace

TEST(CategoryDistributionTest, GroupsInFirstAppearanceOrder)
{
    const std::vector<engine::NodeScore> nodes = {
        {.asset_id = "a", .category_label = "iot", .score = 1.0},
        {.asset_id = "b", .category_label = "pos", .score = 2.0},
        {.asset_id = "c", .category_label = "iot", .score = 3.0},
    };

    auto stats = category_distribution(nodes, 6.0);

    ASSERT_EQ(stats.size(), 2U);
    EXPECT_EQ(stats[0].category_label, "iot");
    EXPECT_EQ(stats[0].count, 2U);
    EXPECT_DOUBLE_EQ(stats[0].mean_score, 2.0);
    EXPECT_DOUBLE_EQ(stats[0].max_score, 3.0);
    EXPECT_DOUBLE_EQ(stats[0].contribution_percent, 4.0 / 6.0 * 100.0);
    EXPECT_EQ(stats[1].category_label, "pos");
    EXPECT_DOUBLE_EQ(stats[1].contribution_percent, 2.0 / 6.0 * 100.0);
}

TEST(CategoryDistributionTest, ZeroTotalGivesZeroContribution)
{
    const std::vector<engine::NodeScore> nodes = {
        {.asset_id = "a", .category_label = "iot", .score = 0.0},
    };

    auto stats = category_distribution(nodes, 0.0);

    ASSERT_EQ(stats.size(), 1U);
    EXPECT_EQ(stats[0].contribution_percent, 0.0);
}

TEST(ReportBuilderTest, SampleNetworkDefaults)
{
    auto graph = sample_graph();
    const ReportBuilder builder(config::AnalysisConfig{});

    auto report = builder.build(graph, "2024-01-01T00:00:00Z");
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(report->generated_at, "2024-01-01T00:00:00Z");
    EXPECT_EQ(report->components_analyzed, 7U);
    EXPECT_NEAR(report->total_score, 4.887, 1e-3);
    EXPECT_EQ(report->risk_level, engine::RiskLevel::kLow);
    // No sample path survives the default 0.7 threshold
    EXPECT_TRUE(report->critical_paths.empty());

    ASSERT_EQ(report->top_vulnerable.size(), 7U);
    EXPECT_EQ(report->top_vulnerable[0].asset_id, "network_core");
    EXPECT_EQ(report->top_vulnerable[1].asset_id, "pos_001");
    EXPECT_EQ(report->top_vulnerable[6].asset_id, "db_primary");
    for (std::size_t i = 1; i < report->top_vulnerable.size(); ++i) {
        EXPECT_GE(report->top_vulnerable[i - 1].score, report->top_vulnerable[i].score);
    }

    // node_scores keeps graph order
    ASSERT_EQ(report->node_scores.size(), 7U);
    EXPECT_EQ(report->node_scores[0].asset_id, "pos_001");

    ASSERT_EQ(report->category_distribution.size(), 5U);
    EXPECT_EQ(report->category_distribution[0].category_label, "pos");
    EXPECT_EQ(report->category_distribution[0].count, 2U);
    EXPECT_EQ(report->category_distribution[1].category_label, "server");
    EXPECT_EQ(report->category_distribution[2].category_label, "database");
    EXPECT_EQ(report->category_distribution[3].category_label, "network");
    EXPECT_EQ(report->category_distribution[4].category_label, "iot");
    double contribution = 0.0;
    for (const auto& stats : report->category_distribution) {
        contribution += stats.contribution_percent;
    }
    EXPECT_NEAR(contribution, 100.0, 1e-9);

    const auto& plan = report->mitigation_plan;
    EXPECT_EQ(plan.mitigations.size(), 7U);
    EXPECT_EQ(plan.total_cost, 30504);
    EXPECT_EQ(plan.candidates_evaluated, 7U);
    EXPECT_EQ(plan.mitigations[0].asset_id, "network_core");
    EXPECT_EQ(plan.mitigations[0].cost, 4830);
    EXPECT_EQ(plan.mitigations[0].priority, engine::MitigationPriority::kCritical);
}

TEST(ReportBuilderTest, LowerThresholdFindsRankedPaths)
{
    auto graph = sample_graph();
    config::AnalysisConfig config;
    config.critical_path_threshold = 0.3;

    auto report = ReportBuilder(config).build(graph, "2024-01-01T00:00:00Z");
    ASSERT_TRUE(report.has_value()) << report.error().message;

    ASSERT_EQ(report->critical_paths.size(), 6U);
    EXPECT_EQ(report->critical_paths[0].assets,
              (std::vector<std::string>{"pos_001", "server_main"}));
    EXPECT_DOUBLE_EQ(report->critical_paths[0].probability, 0.4);
    for (std::size_t i = 1; i < report->critical_paths.size(); ++i) {
        EXPECT_GE(report->critical_paths[i - 1].risk, report->critical_paths[i].risk);
    }
}

TEST(ReportBuilderTest, OrganizationalFactorScalesTotal)
{
    auto graph = sample_graph();
    config::AnalysisConfig doubled;
    doubled.org_factor = 2.0;

    auto base = ReportBuilder(config::AnalysisConfig{}).build(graph, "t");
    auto scaled = ReportBuilder(doubled).build(graph, "t");
    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(scaled.has_value());

    EXPECT_NEAR(scaled->total_score, 2.0 * base->total_score, 1e-12);
    EXPECT_DOUBLE_EQ(scaled->org_factor, 2.0);
}

TEST(ReportBuilderTest, ZeroBudgetPlansNothing)
{
    auto graph = sample_graph();
    config::AnalysisConfig config;
    config.budget = 0.0;

    auto report = ReportBuilder(config).build(graph, "t");
    ASSERT_TRUE(report.has_value());

    EXPECT_TRUE(report->mitigation_plan.mitigations.empty());
    EXPECT_EQ(report->mitigation_plan.total_cost, 0);
    EXPECT_EQ(report->mitigation_plan.overall_roi, 0.0);
    EXPECT_EQ(report->mitigation_plan.budget_utilization, 0.0);
}

TEST(ReportBuilderTest, PropagatesPathBudgetExceeded)
{
    auto graph = sample_graph();
    config::AnalysisConfig config;
    config.max_path_expansions = 1;

    auto report = ReportBuilder(config).build(graph, "t");

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, "PathBudgetExceeded");
}

TEST(ReportBuilderTest, RejectsInvalidConfig)
{
    auto graph = sample_graph();
    config::AnalysisConfig negative_factor;
    negative_factor.org_factor = -1.0;
    config::AnalysisConfig nan_budget;
    nan_budget.budget = std::numeric_limits<double>::quiet_NaN();

    for (const auto& config : {negative_factor, nan_budget}) {
        auto report = ReportBuilder(config).build(graph, "t");
        ASSERT_FALSE(report.has_value());
        EXPECT_EQ(report.error().code, "InvalidConfig");
    }
}

TEST(ReportBuilderTest, EmptyGraph)
{
    auto graph = model::InfrastructureGraph::build({}, {});
    ASSERT_TRUE(graph.has_value());

    auto report = ReportBuilder(config::AnalysisConfig{}).build(*graph, "t");
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(report->total_score, 0.0);
    EXPECT_EQ(report->risk_level, engine::RiskLevel::kLow);
    EXPECT_TRUE(report->top_vulnerable.empty());
    EXPECT_TRUE(report->category_distribution.empty());
    EXPECT_TRUE(report->critical_paths.empty());
    EXPECT_TRUE(report->mitigation_plan.mitigations.empty());
}

}  // namespace assa::report::test
