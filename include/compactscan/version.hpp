#pragma once

/**
 * @file version.hpp
 * @brief CompactScan version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace compactscan {

/// CompactScan version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the documents read and written by the tool
constexpr const char* kRuleTableSchemaVersion = "rule_table.v1";
constexpr const char* kAnalysisResultSchemaVersion = "analysis_result.v1";

}  // namespace compactscan
