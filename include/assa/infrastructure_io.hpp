#pragma once

/**
 * @file infrastructure_io.hpp
 * @brief Infrastructure documents (assa_infrastructure.v1) and the sample network
 */

#include "assa/common.hpp"
#include "assa/infrastructure.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace assa::model {

/// Infrastructure document schema version
constexpr const char* kInfrastructureSchemaVersion = "assa_infrastructure.v1";

/**
 * Convert an infrastructure document into a graph. Structural problems are
 * reported as ParseError, range problems by InfrastructureGraph::build.
 */
[[nodiscard]] assa::Result<InfrastructureGraph> parse_infrastructure(const nlohmann::json& document);

/**
 * Read, schema-validate and convert an infrastructure file.
 */
[[nodiscard]] assa::Result<InfrastructureGraph>
load_infrastructure(const std::filesystem::path& path, const std::filesystem::path& schema_dir);

/**
 * Serialize a graph as an infrastructure document. Every edge is written once.
 */
[[nodiscard]] nlohmann::json infrastructure_to_json(const InfrastructureGraph& graph);

/**
 * Small retail network: two POS terminals, a core switch, an application
 * server, a primary database and two IoT sensors.
 */
[[nodiscard]] assa::Result<InfrastructureGraph> sample_infrastructure();

}  // namespace assa::model
