#pragma once

/**
 * @file report_json.hpp
 * @brief Report document (assa_report.v1) and text summary
 */

#include "assa/common.hpp"
#include "assa/report.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace assa::report {

/// Report document schema version
constexpr const char* kReportSchemaVersion = "assa_report.v1";

/**
 * Round half away from zero to `digits` decimals.
 */
[[nodiscard]] double round_to(double value, int digits) noexcept;

/**
 * Convert a report into an `assa_report.v1` document. Scores are rounded to
 * 3 decimals, ROI to 2, percentages to 1.
 */
[[nodiscard]] nlohmann::json report_to_json(const AssaReport& report);

/**
 * Validate a report document against its schema and write it canonically.
 */
[[nodiscard]] assa::VoidResult write_report(const std::filesystem::path& output_path,
                                            const nlohmann::json& document,
                                            const std::filesystem::path& schema_dir);

/**
 * Human-readable summary: totals, top components, category distribution
 * and the first mitigations.
 */
[[nodiscard]] std::vector<std::string> summary_lines(const AssaReport& report);

}  // namespace assa::report
