/**
 * @file report.cpp
 * @brief JSON and text rendering of analysis results
 */

#include "compactscan/report.hpp"

#include "compactscan/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <string_view>

namespace compactscan::report {

namespace {

using nlohmann::json;

[[nodiscard]] json version_or_null(const std::optional<header::LanguageVersion>& version)
{
    return version ? json(version->to_string()) : json(nullptr);
}

[[nodiscard]] json parameters_json(const std::vector<structure::Parameter>& params)
{
    json out = json::array();
    for (const auto& p : params) {
        out.push_back({
            {"name", p.name},
            {"type", p.type},
        });
    }
    return out;
}

[[nodiscard]] json pragma_json(const std::optional<header::PragmaInfo>& pragma)
{
    if (!pragma) {
        return nullptr;
    }
    return {
        {     "declaredMin", version_or_null(pragma->declared_min)},
        {     "declaredMax", version_or_null(pragma->declared_max)},
        { "languageVersion", version_or_null(pragma->language_version)},
        {         "rawText",                        pragma->raw_text},
        {      "lineNumber",                            pragma->line},
        {      "wellFormed",                     pragma->well_formed},
    };
}

[[nodiscard]] json imports_json(const std::vector<header::ImportDecl>& imports)
{
    json out = json::array();
    for (const auto& decl : imports) {
        json item = {
            {      "name", decl.name},
            {"lineNumber", decl.line},
        };
        if (decl.prefix) {
            item["prefix"] = *decl.prefix;
        }
        out.push_back(std::move(item));
    }
    return out;
}

[[nodiscard]] json structure_json(const structure::Structure& s)
{
    json ledger = json::array();
    for (const auto& item : s.ledger_items) {
        ledger.push_back({
            {        "name",          item.name},
            {"declaredType", item.declared_type},
            {    "exported",      item.exported},
            {      "sealed",        item.sealed},
            {     "private",    item.is_private},
            {  "lineNumber",          item.line},
        });
    }

    json circuits = json::array();
    for (const auto& c : s.circuits) {
        circuits.push_back({
            {      "name",                     c.name},
            {"parameters", parameters_json(c.parameters)},
            {"returnType",              c.return_type},
            {  "exported",                 c.exported},
            {      "pure",                     c.pure},
            {"lineNumber",                     c.line},
        });
    }

    json witnesses = json::array();
    for (const auto& w : s.witnesses) {
        witnesses.push_back({
            {      "name",                     w.name},
            {"parameters", parameters_json(w.parameters)},
            {"returnType",              w.return_type},
            {  "exported",                 w.exported},
            {"lineNumber",                     w.line},
        });
    }

    json enums = json::array();
    for (const auto& e : s.enums) {
        enums.push_back({
            {      "name",     e.name},
            {  "variants", e.variants},
            {  "exported", e.exported},
            {"lineNumber",     e.line},
        });
    }

    json structs = json::array();
    for (const auto& d : s.structs) {
        structs.push_back({
            {      "name",                 d.name},
            {    "fields", parameters_json(d.fields)},
            {  "exported",             d.exported},
            {"lineNumber",                 d.line},
        });
    }

    json aliases = json::array();
    for (const auto& t : s.type_aliases) {
        aliases.push_back({
            {      "name",       t.name},
            {"definition", t.definition},
            {  "exported",   t.exported},
            {"lineNumber",       t.line},
        });
    }

    json constructor = nullptr;
    if (s.constructor) {
        constructor = {
            {"parameters", parameters_json(s.constructor->parameters)},
            {"lineNumber",                    s.constructor->line},
        };
    }

    return {
        {   "ledgerItems",            ledger},
        {      "circuits",          circuits},
        {     "witnesses",         witnesses},
        {         "enums",             enums},
        {       "structs",           structs},
        {   "typeAliases",           aliases},
        {"hasConstructor", s.has_constructor()},
        {   "constructor",       constructor},
    };
}

[[nodiscard]] json stats_json(const analyzer::Stats& stats)
{
    return {
        {            "circuitCount",             stats.circuit_count},
        {            "witnessCount",             stats.witness_count},
        {         "ledgerItemCount",         stats.ledger_item_count},
        {               "enumCount",                stats.enum_count},
        {             "structCount",              stats.struct_count},
        {          "typeAliasCount",          stats.type_alias_count},
        {    "exportedCircuitCount",    stats.exported_circuit_count},
        {    "exportedWitnessCount",    stats.exported_witness_count},
        {"exportedLedgerItemCount", stats.exported_ledger_item_count},
        {               "lineCount",                stats.line_count},
    };
}

[[nodiscard]] json issues_json(const std::vector<rules::Issue>& issues)
{
    json out = json::array();
    for (const auto& issue : issues) {
        json item = {
            {      "ruleId",                          issue.rule_id},
            {    "severity", std::string(rules::to_string(issue.severity))},
            {     "message",                          issue.message},
            {"suggestedFix",                    issue.suggested_fix},
        };
        if (issue.line) {
            item["lineNumber"] = *issue.line;
        }
        out.push_back(std::move(item));
    }
    return out;
}

[[nodiscard]] std::string_view padded_severity(rules::Severity severity)
{
    switch (severity) {
        case rules::Severity::kError:
            return "error  ";
        case rules::Severity::kWarning:
            return "warning";
        case rules::Severity::kInfo:
            return "info   ";
    }
    return "";
}

}  // namespace

json to_json(const analyzer::AnalysisResult& result)
{
    if (!result) {
        return {
            {      "success",               false},
            {"failureReason", result.error().code},
        };
    }
    const auto& report = *result;
    const auto exports = report.exports();
    const json exports_json = {
        {   "circuits",     exports.circuits},
        {  "witnesses",    exports.witnesses},
        {"ledgerItems", exports.ledger_items},
    };
    const json language_version =
        report.language_version ? json(*report.language_version) : json(nullptr);
    return {
        {        "success",                         true},
        {"languageVersion",             language_version},
        {         "pragma",       pragma_json(report.pragma)},
        {        "imports",     imports_json(report.imports)},
        {      "structure", structure_json(report.structure)},
        {        "exports",                 exports_json},
        {          "stats",       stats_json(report.stats())},
        {"potentialIssues",       issues_json(report.issues)},
        {        "summary",                 report.summary()},
    };
}

compactscan::Result<std::string> to_canonical_json(const analyzer::AnalysisResult& result)
{
    return canonical::canonicalize(to_json(result));
}

std::string render_text(const analyzer::AnalysisResult& result)
{
    if (!result) {
        return std::format("Analysis failed: {} ({})\n", result.error().code, result.error().message);
    }
    const auto& report = *result;
    std::string out;
    out += std::format("Language version: {}\n", report.language_version.value_or("none"));
    if (!report.imports.empty()) {
        out += "Imports:";
        for (const auto& decl : report.imports) {
            out += " " + decl.name;
        }
        out += "\n";
    }
    out += std::format("Summary: {}\n", report.summary());

    if (report.issues.empty()) {
        out += "No issues found.\n";
        return out;
    }
    out += std::format("Issues ({}):\n", report.issues.size());
    for (const auto& issue : report.issues) {
        const std::string location = issue.line ? std::format("line {}", *issue.line) : "-";
        out += std::format("  {} {:<9} [{}] {}\n",
                           padded_severity(issue.severity),
                           location,
                           issue.rule_id,
                           issue.message);
        if (!issue.suggested_fix.empty()) {
            out += std::format("            fix: {}\n", issue.suggested_fix);
        }
    }
    return out;
}

std::optional<rules::Severity> highest_severity(const std::vector<rules::Issue>& issues)
{
    std::optional<rules::Severity> highest;
    for (const auto& issue : issues) {
        // Enumerators are ordered from most to least severe.
        if (!highest || static_cast<int>(issue.severity) < static_cast<int>(*highest)) {
            highest = issue.severity;
        }
    }
    return highest;
}

}  // namespace compactscan::report
