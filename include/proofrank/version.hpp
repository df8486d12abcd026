#pragma once

/**
 * @file version.hpp
 * @brief proofrank version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace proofrank {

/// proofrank version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema the report loader validates `.spark` files against
constexpr const char* kReportSchemaVersion = "spark_report.v1";

/// Version tag of the JSON emitted by `suggest` and `summary`
constexpr const char* kOutputSchemaVersion = "proofrank.v1";

}  // namespace proofrank
