/**
 * @file report_json.cpp
 * @brief Report document (assa_report.v1) and text summary
 */

#include "assa/report_json.hpp"

#include "assa/canonical_json.hpp"
#include "assa/json_io.hpp"
#include "assa/schema_validate.hpp"
#include "assa/version.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <ranges>
#include <string>

namespace assa::report {

namespace {

constexpr int kScoreDigits = 3;
constexpr int kRoiDigits = 2;
constexpr int kPercentDigits = 1;
constexpr std::size_t kSummaryComponents = 5;
constexpr std::size_t kSummaryMitigations = 3;

[[nodiscard]] nlohmann::json path_to_json(const engine::CriticalPath& path)
{
    return nlohmann::json{
        {       "path",                           path.assets},
        {"probability",                      path.probability},
        { "risk_score",        round_to(path.risk, kScoreDigits)}
    };
}

[[nodiscard]] nlohmann::json mitigation_to_json(const engine::MitigationRecord& record)
{
    return nlohmann::json{
        {          "node",                                   record.asset_id},
        {          "type",                             record.category_label},
        { "current_score",         round_to(record.current_score, kScoreDigits)},
        {          "cost",                                       record.cost},
        {"risk_reduction",        round_to(record.risk_reduction, kScoreDigits)},
        {           "roi",                      round_to(record.roi, kRoiDigits)},
        {"recommendation",                             record.recommendation},
        {      "priority", std::string(engine::priority_name(record.priority))}
    };
}

[[nodiscard]] nlohmann::json plan_to_json(const engine::MitigationPlan& plan)
{
    nlohmann::json mitigations = nlohmann::json::array();
    for (const auto& record : plan.mitigations) {
        mitigations.push_back(mitigation_to_json(record));
    }
    return nlohmann::json{
        {         "mitigations",                                             mitigations},
        {              "budget",                                             plan.budget},
        {          "total_cost",                                         plan.total_cost},
        {"total_risk_reduction", round_to(plan.total_risk_reduction, kScoreDigits)},
        {         "overall_roi",          round_to(plan.overall_roi, kRoiDigits)},
        {  "budget_utilization", round_to(plan.budget_utilization, kPercentDigits)},
        {"candidates_evaluated",                               plan.candidates_evaluated}
    };
}

}  // namespace

double round_to(double value, int digits) noexcept
{
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

nlohmann::json report_to_json(const AssaReport& report)
{
    nlohmann::json component_scores = nlohmann::json::object();
    for (const auto& node : report.node_scores) {
        component_scores[node.asset_id] = round_to(node.score, kScoreDigits);
    }

    nlohmann::json top_vulnerable = nlohmann::json::array();
    for (const auto& node : report.top_vulnerable) {
        top_vulnerable.push_back({
            {"asset",                       node.asset_id},
            { "type",                 node.category_label},
            {"score", round_to(node.score, kScoreDigits)}
        });
    }

    nlohmann::json top_paths = nlohmann::json::array();
    for (const auto& path : report.critical_paths | std::views::take(kTopPathCount)) {
        top_paths.push_back(path_to_json(path));
    }

    nlohmann::json distribution = nlohmann::json::object();
    for (const auto& stats : report.category_distribution) {
        distribution[stats.category_label] = {
            {               "count",                                       stats.count},
            {          "mean_score",            round_to(stats.mean_score, kScoreDigits)},
            {           "max_score",             round_to(stats.max_score, kScoreDigits)},
            {"contribution_percent", round_to(stats.contribution_percent, kPercentDigits)}
        };
    }

    nlohmann::json document = {
        {"schema_version", kReportSchemaVersion},
        {"tool", nlohmann::json{{"name", "assa"}, {"version", assa::kVersion}}},
        {"generated_at", report.generated_at},
        {"org_factor_applied", report.org_factor},
        {"total_assa_score", round_to(report.total_score, kScoreDigits)},
        {"risk_level", std::string(engine::risk_level_name(report.risk_level))},
        {"components_analyzed", report.components_analyzed},
        {"component_scores", component_scores},
        {"critical_paths_found", report.critical_paths.size()},
        {"top_critical_paths", top_paths},
        {"component_distribution", distribution},
        {"top_vulnerable_components", top_vulnerable},
        {"recommended_mitigations", plan_to_json(report.mitigation_plan)}
    };
    document["model"] = {
        {"version", assa::kModelVersion},
        {"alpha", assa::kAmplificationAlpha},
        {"risk_point_value", assa::kRiskPointValue}
    };
    document["parameters"] = {
        {"critical_path_threshold", report.critical_path_threshold},
        {"path_cutoff", report.path_cutoff},
        {"budget", report.mitigation_plan.budget}
    };
    return document;
}

assa::VoidResult write_report(const std::filesystem::path& output_path,
                              const nlohmann::json& document,
                              const std::filesystem::path& schema_dir)
{
    const auto schema_path = schema_dir / std::format("{}.schema.json", kReportSchemaVersion);
    if (auto validation = common::validate_json(document, schema_path); !validation) {
        return std::unexpected(assa::Error::make(
            "SchemaInvalid",
            std::format("report schema validation failed: {}", validation.error().message)));
    }
    return common::write_canonical_json_file(output_path, document);
}

std::vector<std::string> summary_lines(const AssaReport& report)
{
    std::vector<std::string> lines;
    lines.push_back(std::format("ASSA total score: {:.3f}", report.total_score));
    lines.push_back(std::format("Risk level: {}", engine::risk_level_name(report.risk_level)));
    lines.push_back(std::format("Components analyzed: {}", report.components_analyzed));
    lines.push_back(std::format("Critical paths found: {}", report.critical_paths.size()));

    lines.emplace_back("Top vulnerable components:");
    for (auto [rank, node] :
         std::views::enumerate(report.top_vulnerable | std::views::take(kSummaryComponents))) {
        lines.push_back(std::format("  {}. {}: {:.3f}", rank + 1, node.asset_id, node.score));
    }

    lines.emplace_back("Distribution by type:");
    for (const auto& stats : report.category_distribution) {
        lines.push_back(std::format("  {}: {} nodes, mean score {:.3f}, contribution {:.1f}%",
                                    stats.category_label,
                                    stats.count,
                                    stats.mean_score,
                                    stats.contribution_percent));
    }

    const auto& plan = report.mitigation_plan;
    lines.push_back(std::format("Budget used: {} of {:.0f} ({:.1f}%)",
                                plan.total_cost,
                                plan.budget,
                                plan.budget_utilization));
    lines.push_back(std::format("Overall ROI: {:.1f}", plan.overall_roi));
    for (auto [rank, record] :
         std::views::enumerate(plan.mitigations | std::views::take(kSummaryMitigations))) {
        lines.push_back(std::format("  {}. {} ({}) cost {} ROI {:.1f}: {}",
                                    rank + 1,
                                    record.asset_id,
                                    engine::priority_name(record.priority),
                                    record.cost,
                                    record.roi,
                                    record.recommendation));
    }
    return lines;
}

}  // namespace assa::report
