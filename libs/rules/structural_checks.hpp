#pragma once

/**
 * @file structural_checks.hpp
 * @brief Cross-declaration predicates behind structural rules
 */

#include "compactscan/rules.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace compactscan::rules {

/// One hit of a rule before message templating
struct Finding
{
    std::optional<std::size_t> line;
    std::string subject;  ///< Substituted for {subject}
    std::string target;   ///< Substituted for {target}
};

[[nodiscard]] std::vector<Finding> evaluate_structural(const StructuralMatch& match,
                                                       const RuleInput& input,
                                                       const header::VersionRange& supported);

}  // namespace compactscan::rules
