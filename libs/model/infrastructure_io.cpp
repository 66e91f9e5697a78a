/**
 * @file infrastructure_io.cpp
 * @brief Infrastructure documents (assa_infrastructure.v1) and the sample network
 */

#include "assa/infrastructure_io.hpp"

#include "assa/json_io.hpp"
#include "assa/version.hpp"

#include <format>
#include <string>
#include <utility>
#include <vector>

namespace assa::model {

namespace {

[[nodiscard]] assa::Error parse_error(std::string message)
{
    return assa::Error::make("ParseError", std::move(message));
}

[[nodiscard]] assa::Result<Asset> parse_asset(const nlohmann::json& entry, std::size_t index)
{
    if (!entry.is_object()) {
        return std::unexpected(parse_error(std::format("assets[{}] must be an object", index)));
    }
    for (const char* key : {"id", "type"}) {
        if (!entry.contains(key) || !entry.at(key).is_string()) {
            return std::unexpected(
                parse_error(std::format("assets[{}].{} must be a string", index, key)));
        }
    }
    for (const char* key : {"cvss_score", "exposure"}) {
        if (!entry.contains(key) || !entry.at(key).is_number()) {
            return std::unexpected(
                parse_error(std::format("assets[{}].{} must be a number", index, key)));
        }
    }

    std::map<std::string, double> privileges;
    if (entry.contains("privileges")) {
        const auto& object = entry.at("privileges");
        if (!object.is_object()) {
            return std::unexpected(
                parse_error(std::format("assets[{}].privileges must be an object", index)));
        }
        for (const auto& [domain, level] : object.items()) {
            if (!level.is_number()) {
                return std::unexpected(parse_error(
                    std::format("assets[{}].privileges.{} must be a number", index, domain)));
            }
            privileges.emplace(domain, level.get<double>());
        }
    }

    std::vector<std::string> services;
    if (entry.contains("services")) {
        const auto& array = entry.at("services");
        if (!array.is_array()) {
            return std::unexpected(
                parse_error(std::format("assets[{}].services must be an array", index)));
        }
        for (const auto& service : array) {
            if (!service.is_string()) {
                return std::unexpected(parse_error(
                    std::format("assets[{}].services entries must be strings", index)));
            }
            services.push_back(service.get<std::string>());
        }
    }

    return make_asset(entry.at("id").get<std::string>(),
                      entry.at("type").get<std::string>(),
                      entry.at("cvss_score").get<double>(),
                      entry.at("exposure").get<double>(),
                      std::move(privileges),
                      std::move(services));
}

[[nodiscard]] assa::Result<PropagationEdge> parse_edge(const nlohmann::json& entry,
                                                       std::size_t index)
{
    if (!entry.is_object()) {
        return std::unexpected(parse_error(std::format("edges[{}] must be an object", index)));
    }
    for (const char* key : {"source", "target"}) {
        if (!entry.contains(key) || !entry.at(key).is_string()) {
            return std::unexpected(
                parse_error(std::format("edges[{}].{} must be a string", index, key)));
        }
    }
    PropagationEdge edge{.source = entry.at("source").get<std::string>(),
                         .target = entry.at("target").get<std::string>(),
                         .probability = std::nullopt};
    if (entry.contains("propagation_prob")) {
        if (!entry.at("propagation_prob").is_number()) {
            return std::unexpected(
                parse_error(std::format("edges[{}].propagation_prob must be a number", index)));
        }
        edge.probability = entry.at("propagation_prob").get<double>();
    }
    return edge;
}

}  // namespace

assa::Result<InfrastructureGraph> parse_infrastructure(const nlohmann::json& document)
{
    if (!document.is_object() || !document.contains("assets")
        || !document.at("assets").is_array()) {
        return std::unexpected(parse_error("Infrastructure document must contain an assets array"));
    }

    std::vector<Asset> assets;
    assets.reserve(document.at("assets").size());
    for (std::size_t i = 0; i < document.at("assets").size(); ++i) {
        auto asset = parse_asset(document.at("assets").at(i), i);
        if (!asset) {
            return std::unexpected(asset.error());
        }
        assets.push_back(std::move(*asset));
    }

    std::vector<PropagationEdge> edges;
    if (document.contains("edges")) {
        const auto& array = document.at("edges");
        if (!array.is_array()) {
            return std::unexpected(parse_error("edges must be an array"));
        }
        edges.reserve(array.size());
        for (std::size_t i = 0; i < array.size(); ++i) {
            auto edge = parse_edge(array.at(i), i);
            if (!edge) {
                return std::unexpected(edge.error());
            }
            edges.push_back(std::move(*edge));
        }
    }

    return InfrastructureGraph::build(std::move(assets), edges);
}

assa::Result<InfrastructureGraph> load_infrastructure(const std::filesystem::path& path,
                                                      const std::filesystem::path& schema_dir)
{
    auto document = common::read_validated_json(path, schema_dir, kInfrastructureSchemaVersion);
    if (!document) {
        return std::unexpected(document.error());
    }
    return parse_infrastructure(*document);
}

nlohmann::json infrastructure_to_json(const InfrastructureGraph& graph)
{
    nlohmann::json assets = nlohmann::json::array();
    for (const auto& asset : graph.assets()) {
        nlohmann::json privileges = nlohmann::json::object();
        for (const auto& [domain, level] : asset.privileges) {
            privileges[domain] = level;
        }
        assets.push_back({
            {        "id",          asset.id},
            {      "type", asset.category_label},
            {"cvss_score",    asset.severity},
            {  "exposure",    asset.exposure},
            {"privileges",        privileges},
            {  "services",    asset.services}
        });
    }

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : graph.edges()) {
        edges.push_back({
            {          "source",                                            edge.source},
            {          "target",                                            edge.target},
            {"propagation_prob", edge.probability.value_or(kDefaultPropagationProbability)}
        });
    }

    return nlohmann::json{
        {"schema_version",                                  kInfrastructureSchemaVersion},
        {          "tool", nlohmann::json{{"name", "assa"}, {"version", assa::kVersion}}},
        {        "assets",                                                        assets},
        {         "edges",                                                         edges}
    };
}

assa::Result<InfrastructureGraph> sample_infrastructure()
{
    std::vector<Asset> assets = {
        make_asset("pos_001", "pos", 6.5, 0.8, {{"user", 0.3}}, {"payment", "inventory"}),
        make_asset("pos_002", "pos", 5.8, 0.7, {{"user", 0.3}}, {"payment"}),
        make_asset("server_main", "server", 7.8, 0.3, {{"admin", 0.9}}, {"api", "web"}),
        make_asset("db_primary", "database", 8.2, 0.1, {{"admin", 1.0}}, {"storage", "backup"}),
        make_asset("network_core", "network", 6.1, 0.5, {{"admin", 0.7}}, {"routing", "firewall"}),
        make_asset("iot_sensor_1", "iot", 5.2, 0.9, {{"device", 0.1}}, {"monitoring"}),
        make_asset("iot_sensor_2", "iot", 4.8, 0.85, {{"device", 0.1}}, {"environmental"}),
    };

    std::vector<PropagationEdge> edges = {
        {.source = "pos_001", .target = "network_core", .probability = 0.6},
        {.source = "pos_002", .target = "network_core", .probability = 0.6},
        {.source = "network_core", .target = "server_main", .probability = 0.7},
        {.source = "server_main", .target = "db_primary", .probability = 0.8},
        {.source = "iot_sensor_1", .target = "network_core", .probability = 0.3},
        {.source = "iot_sensor_2", .target = "network_core", .probability = 0.3},
        // direct service link
        {.source = "pos_001", .target = "server_main", .probability = 0.4},
    };

    return InfrastructureGraph::build(std::move(assets), edges);
}

}  // namespace assa::model
