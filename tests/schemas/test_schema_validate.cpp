#include "assa/schema_validate.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace assa::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(ASSA_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_tool_json()
{
    return nlohmann::json{
        {   "name",  "assa"},
        {"version", "0.1.0"}
    };
}

nlohmann::json make_infrastructure_json()
{
    return nlohmann::json{
        {"schema_version", "assa_infrastructure.v1"},
        {          "tool",         make_tool_json()},
        {        "assets",
         nlohmann::json::array(
         {{{"id", "pos_001"}, {"type", "pos"}, {"cvss_score", 6.5}, {"exposure", 0.8}},
         {{"id", "db_primary"},
         {"type", "database"},
         {"cvss_score", 8.2},
         {"exposure", 0.1},
         {"privileges", {{"admin", 1.0}}},
         {"services", nlohmann::json::array({"storage"})}}})                  },
        {         "edges",
         nlohmann::json::array(
         {{{"source", "pos_001"}, {"target", "db_primary"}, {"propagation_prob", 0.2}}})}
    };
}

nlohmann::json make_config_json()
{
    return nlohmann::json{
        {         "schema_version",                                       "assa_config.v1"},
        {             "org_factor",                                                    1.2},
        {"critical_path_threshold",                                                    0.5},
        {            "path_cutoff",                                                      4},
        {                 "budget",                                                  50000},
        {      "category_profiles", {{"iot", {{"base_cost", 250}, {"effectiveness", 0.5}}}}}
    };
}

nlohmann::json make_report_json()
{
    return nlohmann::json{
        {           "schema_version",                                          "assa_report.v1"},
        {                     "tool",                                          make_tool_json()},
        {                    "model",
         {{"version", "assa.model.v1"}, {"alpha", 0.73}, {"risk_point_value", 100000}}          },
        {             "generated_at",                                    "2024-01-01T00:00:00Z"},
        {       "org_factor_applied",                                                       1.0},
        {               "parameters",
         {{"critical_path_threshold", 0.7}, {"path_cutoff", 5}, {"budget", 1000}}               },
        {         "total_assa_score",                                                      0.52},
        {               "risk_level",                                                     "LOW"},
        {      "components_analyzed",                                                         1},
        {         "component_scores",                                        {{"pos_001", 0.52}}},
        {     "critical_paths_found",                                                         0},
        {       "top_critical_paths",                                   nlohmann::json::array()},
        {   "component_distribution",
         {{"pos",
         {{"count", 1}, {"mean_score", 0.52}, {"max_score", 0.52}, {"contribution_percent", 100.0}}}}},
        {"top_vulnerable_components",
         nlohmann::json::array({{{"asset", "pos_001"}, {"type", "pos"}, {"score", 0.52}}})      },
        {  "recommended_mitigations",
         {{"mitigations",
         nlohmann::json::array({{{"node", "pos_001"},
         {"type", "pos"},
         {"current_score", 0.52},
         {"cost", 825},
         {"risk_reduction", 0.364},
         {"roi", 44.12},
         {"recommendation", "Update POS firmware"},
         {"priority", "HIGH"}}})},
         {"budget", 1000},
         {"total_cost", 825},
         {"total_risk_reduction", 0.364},
         {"overall_roi", 44.12},
         {"budget_utilization", 82.5},
         {"candidates_evaluated", 1}}                                                           }
    };
}

struct SchemaCase
{
    std::string schema_file;
    nlohmann::json valid_json;
};

std::vector<SchemaCase> make_schema_cases()
{
    return {
        {.schema_file = "assa_infrastructure.v1.schema.json",
         .valid_json = make_infrastructure_json()},
        {.schema_file = "assa_config.v1.schema.json", .valid_json = make_config_json()},
        {.schema_file = "assa_report.v1.schema.json", .valid_json = make_report_json()}
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidSchemaSamplesPass)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        auto result =
            validate_json(schema_case.valid_json, schema_path(schema_case.schema_file));

        EXPECT_TRUE(result) << (result ? "" : result.error().message);
    }
}

TEST(SchemaValidateTest, InvalidSchemaSamplesFail)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        nlohmann::json invalid = schema_case.valid_json;
        invalid["schema_version"] = "invalid.v0";

        auto result = validate_json(invalid, schema_path(schema_case.schema_file));

        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, InfrastructureRejectsOutOfRangeAsset)
{
    auto document = make_infrastructure_json();
    document["assets"][0]["exposure"] = 1.5;

    auto result = validate_json(document, schema_path("assa_infrastructure.v1.schema.json"));

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("assets"), std::string::npos);
}

TEST(SchemaValidateTest, InfrastructureRejectsZeroProbabilityEdge)
{
    auto document = make_infrastructure_json();
    document["edges"][0]["propagation_prob"] = 0.0;

    EXPECT_FALSE(validate_json(document, schema_path("assa_infrastructure.v1.schema.json")));
}

TEST(SchemaValidateTest, ConfigRejectsUnknownCategory)
{
    auto document = make_config_json();
    document["category_profiles"]["printer"] = {
        {"base_cost", 10}
    };

    EXPECT_FALSE(validate_json(document, schema_path("assa_config.v1.schema.json")));
}

TEST(SchemaValidateTest, ReportRejectsUnknownRiskLevel)
{
    auto document = make_report_json();
    document["risk_level"] = "SEVERE";

    EXPECT_FALSE(validate_json(document, schema_path("assa_report.v1.schema.json")));
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto result = validate_json(make_config_json(), schema_path("missing.v1.schema.json"));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace assa::common::test
