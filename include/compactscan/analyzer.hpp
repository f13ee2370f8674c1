#pragma once

/**
 * @file analyzer.hpp
 * @brief Contract analyzer: scan, extract, apply rules, assemble
 */

#include "compactscan/common.hpp"
#include "compactscan/header.hpp"
#include "compactscan/rules.hpp"
#include "compactscan/source.hpp"
#include "compactscan/structure.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace compactscan::analyzer {

struct AnalyzerOptions
{
    std::size_t max_source_bytes = source::kDefaultMaxSourceBytes;
    std::size_t max_line_bytes = source::kDefaultMaxLineBytes;
    bool check_security = false;  ///< Also apply rules in the "security" category
};

/// Counts derived from the extracted structure
struct Stats
{
    std::size_t circuit_count = 0;
    std::size_t witness_count = 0;
    std::size_t ledger_item_count = 0;
    std::size_t enum_count = 0;
    std::size_t struct_count = 0;
    std::size_t type_alias_count = 0;
    std::size_t exported_circuit_count = 0;
    std::size_t exported_witness_count = 0;
    std::size_t exported_ledger_item_count = 0;
    std::size_t line_count = 0;
};

/// Names of exported declarations, in source order
struct Exports
{
    std::vector<std::string> circuits;
    std::vector<std::string> witnesses;
    std::vector<std::string> ledger_items;
};

struct AnalysisReport
{
    std::optional<std::string> language_version;  ///< "MAJOR.MINOR" when a pragma was found
    std::optional<header::PragmaInfo> pragma;
    std::vector<header::ImportDecl> imports;
    structure::Structure structure;
    std::vector<rules::Issue> issues;
    std::size_t line_count = 0;

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] Exports exports() const;

    /// e.g. "2 circuit(s), 1 ledger item(s), 1 potential issue(s)"; "Empty contract" when
    /// nothing was found. The issue count is omitted when there are none.
    [[nodiscard]] std::string summary() const;
};

/**
 * Outcome of one analysis. On failure, Error::code is the failure reason
 * (EmptyInput, InputTooLarge, InvalidContent or LineTooLong).
 */
using AnalysisResult = compactscan::Result<AnalysisReport>;

[[nodiscard]] AnalysisReport assemble(header::Header header,
                                      structure::Structure structure,
                                      std::vector<rules::Issue> issues,
                                      std::size_t line_count);

class Analyzer
{
public:
    explicit Analyzer(rules::RuleTable table, AnalyzerOptions options = {});

    /// Pure; safe to call concurrently on one instance
    [[nodiscard]] AnalysisResult analyze(std::string_view source) const;

    [[nodiscard]] const rules::RuleTable& rule_table() const { return m_rules; }

private:
    rules::RuleTable m_rules;
    AnalyzerOptions m_options;
};

}  // namespace compactscan::analyzer
