#pragma once

/**
 * @file report.hpp
 * @brief JSON and text rendering of analysis results
 */

#include "compactscan/analyzer.hpp"
#include "compactscan/common.hpp"
#include "compactscan/rules.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace compactscan::report {

/**
 * Build the analysis_result.v1 document.
 * A failed analysis yields exactly {"success": false, "failureReason": code}.
 */
[[nodiscard]] nlohmann::json to_json(const analyzer::AnalysisResult& result);

/// to_json() serialized in canonical form (sorted keys, no whitespace)
[[nodiscard]] compactscan::Result<std::string> to_canonical_json(const analyzer::AnalysisResult& result);

/// Human-readable rendering for terminals
[[nodiscard]] std::string render_text(const analyzer::AnalysisResult& result);

/// Most severe issue level present, or nullopt when there are no issues
[[nodiscard]] std::optional<rules::Severity> highest_severity(const std::vector<rules::Issue>& issues);

}  // namespace compactscan::report
