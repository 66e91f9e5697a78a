/**
 * @file canonical_json.cpp
 * @brief Deterministic JSON serialization for reports
 */

#include "assa/canonical_json.hpp"

#include <cmath>
#include <exception>
#include <format>
#include <ranges>
#include <string_view>

namespace assa::canonical {

namespace {

assa::VoidResult validate_finite_at(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        return std::unexpected(assa::Error::make(
            "NonFiniteNumber", std::format("Non-finite number not allowed in report at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_finite_at(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = validate_finite_at(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

}  // namespace

assa::Result<std::string> canonicalize(const nlohmann::json& j, int indent)
{
    if (auto result = validate_finite_at(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    // nlohmann::json objects are std::map backed, so keys are already ordered
    try {
        return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const std::exception& ex) {
        return std::unexpected(assa::Error::make(
            "SerializationFailed", std::string("Failed to serialize JSON: ") + ex.what()));
    }
}

assa::VoidResult validate_finite(const nlohmann::json& j)
{
    return validate_finite_at(j, "$");
}

}  // namespace assa::canonical
