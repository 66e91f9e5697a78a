#pragma once

/**
 * @file version.hpp
 * @brief ASSA version information and model constants
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace assa {

/// ASSA version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Scoring model version (embedded in all reports)
constexpr const char* kModelVersion = "assa.model.v1";

/// Calibrated lateral-movement amplification constant
constexpr double kAmplificationAlpha = 0.73;

/// Currency value of one point of risk, used for ROI
constexpr double kRiskPointValue = 100000.0;

}  // namespace assa
