/**
 * @file rule_engine.cpp
 * @brief Rule application, deduplication and ordering
 */

#include "compactscan/rules.hpp"

#include "structural_checks.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace compactscan::rules {

namespace {

/// Block patterns see at most this much of a statement, from its first character
constexpr std::size_t kMaxStatementBytes = 4096;

[[nodiscard]] bool scope_allows(RuleScope scope, int depth) noexcept
{
    switch (scope) {
        case RuleScope::kAny:
            return true;
        case RuleScope::kTopLevel:
            return depth == 0;
        case RuleScope::kNested:
            return depth > 0;
    }
    return true;
}

/// Brace depth at a column of a line's code view
[[nodiscard]] int depth_at(const source::LineContext& line, std::size_t column)
{
    int depth = line.depth;
    for (std::size_t i = 0; i < column && i < line.code.size(); ++i) {
        if (line.code[i] == '{') {
            ++depth;
        } else if (line.code[i] == '}' && depth > 0) {
            --depth;
        }
    }
    return depth;
}

std::vector<Finding> match_lines(const LineMatch& match, const source::SourceDocument& document)
{
    std::vector<Finding> findings;
    for (const auto& line : document.lines()) {
        for (auto it = std::sregex_iterator(line.code.begin(), line.code.end(), match.regex);
             it != std::sregex_iterator();
             ++it) {
            const auto column = static_cast<std::size_t>(it->position(0));
            if (scope_allows(match.scope, depth_at(line, column))) {
                findings.push_back({.line = line.number, .subject = it->str(0), .target = ""});
                break;
            }
        }
    }
    return findings;
}

std::vector<Finding> match_statements(const BlockMatch& match,
                                      const source::SourceDocument& document)
{
    const std::string& code = document.joined_code();
    std::vector<Finding> findings;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= code.size(); ++i) {
        const bool at_end = i == code.size();
        const char c = at_end ? ';' : code[i];
        if (c != ';' && c != '{' && c != '}') {
            continue;
        }
        const std::size_t stop = at_end ? i : i + 1;
        std::size_t first = start;
        while (first < stop && std::isspace(static_cast<unsigned char>(code[first])) != 0) {
            ++first;
        }
        if (first < stop) {
            const std::string statement =
                code.substr(first, std::min(stop - first, kMaxStatementBytes));
            std::smatch m;
            if (std::regex_search(statement, m, match.regex) && scope_allows(match.scope, depth)) {
                findings.push_back(
                    {.line = document.line_at(first), .subject = m.str(0), .target = ""});
            }
        }
        if (c == '{' && !at_end) {
            ++depth;
        } else if (c == '}' && depth > 0) {
            --depth;
        }
        start = i + 1;
    }
    return findings;
}

[[nodiscard]] std::string substitute(std::string text, const Finding& finding)
{
    const auto replace_all = [&text](std::string_view token, const std::string& value) {
        std::size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos) {
            text.replace(pos, token.size(), value);
            pos += value.size();
        }
    };
    replace_all("{subject}", finding.subject);
    replace_all("{target}", finding.target);
    return text;
}

}  // namespace

std::vector<Issue> apply_rules(const RuleInput& input, const RuleTable& table)
{
    std::vector<Issue> issues;
    std::set<std::pair<std::string, std::optional<std::size_t>>> emitted;

    for (const auto& rule : table.rules()) {
        if (rule.category == RuleCategory::kSecurity && !input.check_security) {
            continue;
        }
        const auto findings = std::visit(
            [&](const auto& matcher) -> std::vector<Finding> {
                using T = std::decay_t<decltype(matcher)>;
                if constexpr (std::is_same_v<T, LineMatch>) {
                    return match_lines(matcher, input.document);
                } else if constexpr (std::is_same_v<T, BlockMatch>) {
                    return match_statements(matcher, input.document);
                } else {
                    return evaluate_structural(matcher, input, table.version_range());
                }
            },
            rule.matcher);

        for (const auto& finding : findings) {
            if (!emitted.emplace(rule.id, finding.line).second) {
                continue;
            }
            issues.push_back(Issue{
                .rule_id = rule.id,
                .severity = rule.severity,
                .message = substitute(rule.message, finding),
                .suggested_fix = substitute(rule.fix, finding),
                .line = finding.line,
            });
        }
    }

    // Table order is preserved among issues on the same line.
    std::ranges::stable_sort(issues, [](const Issue& a, const Issue& b) {
        return a.line < b.line;
    });
    return issues;
}

}  // namespace compactscan::rules
