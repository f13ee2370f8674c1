/**
 * @file structural_checks.cpp
 * @brief Cross-declaration predicates behind structural rules
 */

#include "structural_checks.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <regex>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

namespace compactscan::rules {

namespace {

constexpr std::string_view kStandardLibrary = "CompactStandardLibrary";

[[nodiscard]] bool is_identifier(const std::string& name)
{
    static const std::regex kIdentifier(R"([A-Za-z_]\w*)");
    return std::regex_match(name, kIdentifier);
}

/// Code-view lines first..last (1-based, inclusive), clamped to the document
template <typename Fn>
void for_each_code_line(const source::SourceDocument& document,
                        std::size_t first,
                        std::size_t last,
                        Fn&& fn)
{
    last = std::min(last, document.line_count());
    for (std::size_t number = std::max<std::size_t>(first, 1); number <= last; ++number) {
        fn(document.line(number));
    }
}

[[nodiscard]] bool mentions_disclose(const std::string& code)
{
    static const std::regex kDisclose(R"(\bdisclose\s*\()");
    return std::regex_search(code, kDisclose);
}

/// First line in first..last whose code view matches, if any
[[nodiscard]] std::optional<std::size_t> first_match(const source::SourceDocument& document,
                                                     std::size_t first,
                                                     std::size_t last,
                                                     const std::regex& pattern)
{
    std::optional<std::size_t> found;
    for_each_code_line(document, first, last, [&](const auto& line) {
        if (!found && std::regex_search(line.code, pattern)) {
            found = line.number;
        }
    });
    return found;
}

[[nodiscard]] std::regex word_pattern(const std::string& name)
{
    return std::regex(std::format(R"(\b{}\b)", name));
}

/// Assignment (not a comparison) or a mutating ledger operation on a field
[[nodiscard]] std::regex write_pattern(const std::string& name)
{
    return std::regex(std::format(
        R"(\b{}\s*(?:[-+]?=(?!=)|\.\s*(?:increment|decrement|insert|insertDefault|remove|resetToDefault|write|push|pushFront|popFront|writeCoin|insertCoin)\s*\())",
        name));
}

std::vector<Finding> missing_pragma(const RuleInput& input)
{
    if (input.header.pragma) {
        return {};
    }
    return {Finding{.line = std::nullopt, .subject = "", .target = ""}};
}

std::vector<Finding> unsupported_language_version(const RuleInput& input,
                                                  const header::VersionRange& supported)
{
    if (!input.header.pragma) {
        return {};
    }
    const auto& pragma = *input.header.pragma;
    const bool too_old = pragma.declared_max && pragma.declared_max->key() < supported.min.key();
    const bool too_new = pragma.declared_min && pragma.declared_min->key() > supported.max.key();
    if (!too_old && !too_new) {
        return {};
    }
    return {Finding{
        .line = pragma.line,
        .subject = pragma.language_version ? pragma.language_version->to_string() : "",
        .target = std::format("{}-{}", supported.min.to_string(), supported.max.to_string()),
    }};
}

std::vector<Finding> stdlib_name_collision(const StructuralMatch& match, const RuleInput& input)
{
    const bool imported = std::ranges::any_of(input.header.imports, [](const auto& decl) {
        // A prefixed import does not bring names into scope unqualified.
        return decl.name == kStandardLibrary && !decl.prefix;
    });
    if (!imported) {
        return {};
    }
    const std::set<std::string, std::less<>> reserved(match.names.begin(), match.names.end());
    std::vector<Finding> findings;
    const auto check = [&](const std::string& name, std::size_t line) {
        if (reserved.contains(name)) {
            findings.push_back({.line = line, .subject = name, .target = std::string(kStandardLibrary)});
        }
    };
    const auto& s = input.structure;
    for (const auto& c : s.circuits) {
        check(c.name, c.line);
    }
    for (const auto& d : s.structs) {
        check(d.name, d.line);
    }
    for (const auto& e : s.enums) {
        check(e.name, e.line);
    }
    for (const auto& t : s.type_aliases) {
        check(t.name, t.line);
    }
    return findings;
}

std::vector<Finding> missing_constructor(const RuleInput& input)
{
    if (input.structure.has_constructor()) {
        return {};
    }
    const auto& items = input.structure.ledger_items;
    const auto sealed = std::ranges::find_if(items, &structure::LedgerItem::sealed);
    if (sealed == items.end()) {
        return {};
    }
    return {Finding{.line = sealed->line, .subject = sealed->name, .target = ""}};
}

std::vector<Finding> sealed_export_conflict(const RuleInput& input)
{
    std::vector<std::pair<std::string, std::regex>> writes;
    for (const auto& item : input.structure.ledger_items) {
        if (!item.sealed || !is_identifier(item.name)) {
            continue;
        }
        writes.emplace_back(item.name, write_pattern(item.name));
    }
    if (writes.empty()) {
        return {};
    }
    std::vector<Finding> findings;
    for (const auto& circuit : input.structure.circuits) {
        if (!circuit.exported) {
            continue;
        }
        for_each_code_line(input.document, circuit.line, circuit.end_line, [&](const auto& line) {
            for (const auto& [name, pattern] : writes) {
                if (std::regex_search(line.code, pattern)) {
                    findings.push_back({.line = line.number, .subject = name, .target = circuit.name});
                }
            }
        });
    }
    return findings;
}

std::vector<Finding> invalid_counter_access(const RuleInput& input)
{
    std::vector<std::pair<std::string, std::regex>> reads;
    for (const auto& item : input.structure.ledger_items) {
        if (item.declared_type == "Counter" && is_identifier(item.name)) {
            reads.emplace_back(item.name,
                               std::regex(std::format(R"(\b{}\s*\.\s*value\b)", item.name)));
        }
    }
    std::vector<Finding> findings;
    if (reads.empty()) {
        return findings;
    }
    for (const auto& line : input.document.lines()) {
        for (const auto& [name, pattern] : reads) {
            if (std::regex_search(line.code, pattern)) {
                findings.push_back({.line = line.number, .subject = name, .target = ""});
            }
        }
    }
    return findings;
}

std::vector<Finding> undisclosed_witness_conditional(const RuleInput& input)
{
    static const std::regex kConditional(R"(\bif\s*\()");
    std::vector<std::pair<std::string, std::regex>> witnesses;
    for (const auto& witness : input.structure.witnesses) {
        if (is_identifier(witness.name)) {
            witnesses.emplace_back(witness.name,
                                   word_pattern(witness.name));
        }
    }
    std::vector<Finding> findings;
    if (witnesses.empty()) {
        return findings;
    }
    for (const auto& circuit : input.structure.circuits) {
        for_each_code_line(input.document, circuit.line, circuit.end_line, [&](const auto& line) {
            if (!std::regex_search(line.code, kConditional) || mentions_disclose(line.code)) {
                return;
            }
            for (const auto& [name, pattern] : witnesses) {
                if (std::regex_search(line.code, pattern)) {
                    findings.push_back({.line = line.number, .subject = name, .target = circuit.name});
                }
            }
        });
    }
    return findings;
}

std::vector<Finding> undisclosed_constructor_param(const RuleInput& input)
{
    if (!input.structure.constructor) {
        return {};
    }
    const auto& ctor = *input.structure.constructor;
    std::vector<std::pair<std::string, std::regex>> params;
    for (const auto& param : ctor.parameters) {
        if (is_identifier(param.name)) {
            params.emplace_back(param.name, word_pattern(param.name));
        }
    }
    std::vector<std::pair<std::string, std::regex>> fields;
    for (const auto& item : input.structure.ledger_items) {
        if (is_identifier(item.name)) {
            fields.emplace_back(item.name,
                                std::regex(std::format(R"(\b{}\s*=(?!=)([^;]*))", item.name)));
        }
    }
    std::vector<Finding> findings;
    if (params.empty() || fields.empty()) {
        return findings;
    }
    for_each_code_line(input.document, ctor.line, ctor.end_line, [&](const auto& line) {
        if (mentions_disclose(line.code)) {
            return;
        }
        for (const auto& [field, assignment] : fields) {
            std::smatch m;
            if (!std::regex_search(line.code, m, assignment)) {
                continue;
            }
            const std::string rhs = m.str(1);
            for (const auto& [param, reference] : params) {
                if (std::regex_search(rhs, reference)) {
                    findings.push_back({.line = line.number, .subject = param, .target = field});
                }
            }
        }
    });
    return findings;
}

std::vector<Finding> private_field_exposure(const RuleInput& input)
{
    static const std::regex kProtected(
        R"(\b(?:disclose|commit|persistentCommit|transientCommit)\s*\()");
    std::vector<std::pair<std::string, std::regex>> fields;
    for (const auto& item : input.structure.ledger_items) {
        if (item.is_private && is_identifier(item.name)) {
            fields.emplace_back(item.name, word_pattern(item.name));
        }
    }
    std::vector<Finding> findings;
    if (fields.empty()) {
        return findings;
    }
    for (const auto& circuit : input.structure.circuits) {
        if (!circuit.exported
            || first_match(input.document, circuit.line, circuit.end_line, kProtected)) {
            continue;
        }
        for (const auto& [name, reference] : fields) {
            if (auto line = first_match(input.document, circuit.line, circuit.end_line, reference)) {
                findings.push_back({.line = *line, .subject = name, .target = circuit.name});
            }
        }
    }
    return findings;
}

std::vector<Finding> unasserted_state_change(const RuleInput& input)
{
    static const std::regex kAssert(R"(\bassert\b)");
    std::vector<std::regex> writes;
    for (const auto& item : input.structure.ledger_items) {
        if (is_identifier(item.name)) {
            writes.push_back(write_pattern(item.name));
        }
    }
    std::vector<Finding> findings;
    if (writes.empty()) {
        return findings;
    }
    for (const auto& circuit : input.structure.circuits) {
        if (!circuit.exported) {
            continue;
        }
        const bool modifies = std::ranges::any_of(writes, [&](const std::regex& write) {
            return first_match(input.document, circuit.line, circuit.end_line, write).has_value();
        });
        if (modifies && !first_match(input.document, circuit.line, circuit.end_line, kAssert)) {
            findings.push_back({.line = circuit.line, .subject = circuit.name, .target = ""});
        }
    }
    return findings;
}

std::vector<Finding> unused_witness(const RuleInput& input)
{
    const auto& s = input.structure;
    std::vector<Finding> findings;
    for (const auto& witness : s.witnesses) {
        if (!is_identifier(witness.name)) {
            continue;
        }
        const std::regex reference = word_pattern(witness.name);
        const bool in_circuit = std::ranges::any_of(s.circuits, [&](const auto& circuit) {
            return first_match(input.document, circuit.line, circuit.end_line, reference)
                .has_value();
        });
        const bool in_constructor =
            s.constructor
            && first_match(input.document, s.constructor->line, s.constructor->end_line, reference);
        if (!in_circuit && !in_constructor) {
            findings.push_back({.line = witness.line, .subject = witness.name, .target = ""});
        }
    }
    return findings;
}

}  // namespace

std::vector<Finding> evaluate_structural(const StructuralMatch& match,
                                         const RuleInput& input,
                                         const header::VersionRange& supported)
{
    switch (match.check) {
        case StructuralCheck::kMissingPragma:
            return missing_pragma(input);
        case StructuralCheck::kUnsupportedLanguageVersion:
            return unsupported_language_version(input, supported);
        case StructuralCheck::kStdlibNameCollision:
            return stdlib_name_collision(match, input);
        case StructuralCheck::kMissingConstructor:
            return missing_constructor(input);
        case StructuralCheck::kSealedExportConflict:
            return sealed_export_conflict(input);
        case StructuralCheck::kInvalidCounterAccess:
            return invalid_counter_access(input);
        case StructuralCheck::kUndisclosedWitnessConditional:
            return undisclosed_witness_conditional(input);
        case StructuralCheck::kUndisclosedConstructorParam:
            return undisclosed_constructor_param(input);
        case StructuralCheck::kPrivateFieldExposure:
            return private_field_exposure(input);
        case StructuralCheck::kUnassertedStateChange:
            return unasserted_state_change(input);
        case StructuralCheck::kUnusedWitness:
            return unused_witness(input);
    }
    return {};
}

}  // namespace compactscan::rules
