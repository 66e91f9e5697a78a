#pragma once

/**
 * @file canonical_json.hpp
 * @brief Deterministic JSON serialization for reports
 *
 * Rules:
 * - UTF-8 encoding, invalid sequences rejected
 * - Object keys in lexicographic order
 * - Compact by default, fixed indentation when requested
 * - Numbers must be finite (NaN/Inf would silently become null)
 */

#include "assa/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace assa::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @param indent -1 for compact output, otherwise spaces per level
 * @return Canonical text or error
 */
[[nodiscard]] assa::Result<std::string> canonicalize(const nlohmann::json& j, int indent = -1);

/**
 * Reject NaN and infinite numbers anywhere in the document
 * @return Empty on success, NonFiniteNumber naming the offending path
 */
[[nodiscard]] assa::VoidResult validate_finite(const nlohmann::json& j);

}  // namespace assa::canonical
