/**
 * @file analyzer.cpp
 * @brief Contract analyzer: scan, extract, apply rules, assemble
 */

#include "compactscan/analyzer.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace compactscan::analyzer {

namespace {

template <typename Range, typename Pred>
[[nodiscard]] std::size_t count_matching(const Range& range, Pred pred)
{
    return static_cast<std::size_t>(std::ranges::count_if(range, pred));
}

template <typename Range>
[[nodiscard]] std::vector<std::string> exported_names(const Range& range)
{
    std::vector<std::string> names;
    for (const auto& decl : range) {
        if (decl.exported) {
            names.push_back(decl.name);
        }
    }
    return names;
}

}  // namespace

Stats AnalysisReport::stats() const
{
    const auto exported = [](const auto& decl) { return decl.exported; };
    return Stats{
        .circuit_count = structure.circuits.size(),
        .witness_count = structure.witnesses.size(),
        .ledger_item_count = structure.ledger_items.size(),
        .enum_count = structure.enums.size(),
        .struct_count = structure.structs.size(),
        .type_alias_count = structure.type_aliases.size(),
        .exported_circuit_count = count_matching(structure.circuits, exported),
        .exported_witness_count = count_matching(structure.witnesses, exported),
        .exported_ledger_item_count = count_matching(structure.ledger_items, exported),
        .line_count = line_count,
    };
}

Exports AnalysisReport::exports() const
{
    return Exports{
        .circuits = exported_names(structure.circuits),
        .witnesses = exported_names(structure.witnesses),
        .ledger_items = exported_names(structure.ledger_items),
    };
}

std::string AnalysisReport::summary() const
{
    const std::pair<std::size_t, std::string_view> parts[] = {
        {    structure.circuits.size(),     "circuit(s)"},
        {   structure.witnesses.size(),    "witness(es)"},
        {structure.ledger_items.size(), "ledger item(s)"},
        {structure.type_aliases.size(),  "type alias(es)"},
        {     structure.structs.size(),      "struct(s)"},
        {       structure.enums.size(),        "enum(s)"},
    };
    std::string summary;
    for (const auto& [n, label] : parts) {
        if (n == 0) {
            continue;
        }
        if (!summary.empty()) {
            summary += ", ";
        }
        summary += std::format("{} {}", n, label);
    }
    if (summary.empty()) {
        summary = "Empty contract";
    }
    if (!issues.empty()) {
        summary += std::format(", {} potential issue(s)", issues.size());
    }
    return summary;
}

AnalysisReport assemble(header::Header header,
                        structure::Structure structure,
                        std::vector<rules::Issue> issues,
                        std::size_t line_count)
{
    AnalysisReport report;
    if (header.pragma && header.pragma->language_version) {
        report.language_version = header.pragma->language_version->to_string();
    }
    report.pragma = std::move(header.pragma);
    report.imports = std::move(header.imports);
    report.structure = std::move(structure);
    report.issues = std::move(issues);
    report.line_count = line_count;
    return report;
}

Analyzer::Analyzer(rules::RuleTable table, AnalyzerOptions options)
    : m_rules(std::move(table))
    , m_options(options)
{}

AnalysisResult Analyzer::analyze(std::string_view source_text) const
{
    auto document = source::scan(source_text,
                                 {.max_source_bytes = m_options.max_source_bytes,
                                  .max_line_bytes = m_options.max_line_bytes});
    if (!document) {
        return std::unexpected(document.error());
    }

    header::Header header = header::extract_header(*document);
    structure::Structure structure = structure::extract_structure(*document);
    std::vector<rules::Issue> issues = rules::apply_rules(
        {.document = *document,
         .header = header,
         .structure = structure,
         .check_security = m_options.check_security},
        m_rules);

    return assemble(std::move(header),
                    std::move(structure),
                    std::move(issues),
                    document->line_count());
}

}  // namespace compactscan::analyzer
