/**
 * @file rule_table.cpp
 * @brief Rule Table loading and validation
 */

#include "compactscan/rules.hpp"

#include "compactscan/schema_validate.hpp"
#include "compactscan/version.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace compactscan::rules {

namespace {

constexpr std::string_view kInvalidRuleTable = "InvalidRuleTable";

struct Named
{
    std::string_view name;
    int value;
};

constexpr std::array kSeverityNames = {
    Named{     "error",   static_cast<int>(Severity::kError)},
    Named{   "warning", static_cast<int>(Severity::kWarning)},
    Named{      "info",    static_cast<int>(Severity::kInfo)},
};

constexpr std::array kScopeNames = {
    Named{      "any",      static_cast<int>(RuleScope::kAny)},
    Named{"top_level", static_cast<int>(RuleScope::kTopLevel)},
    Named{   "nested",   static_cast<int>(RuleScope::kNested)},
};

constexpr std::array kCategoryNames = {
    Named{    "lint",     static_cast<int>(RuleCategory::kLint)},
    Named{"security", static_cast<int>(RuleCategory::kSecurity)},
};

constexpr std::array kCheckNames = {
    Named{                 "missing_pragma",
          static_cast<int>(StructuralCheck::kMissingPragma)},
    Named{   "unsupported_language_version",
          static_cast<int>(StructuralCheck::kUnsupportedLanguageVersion)},
    Named{          "stdlib_name_collision",
          static_cast<int>(StructuralCheck::kStdlibNameCollision)},
    Named{            "missing_constructor",
          static_cast<int>(StructuralCheck::kMissingConstructor)},
    Named{         "sealed_export_conflict",
          static_cast<int>(StructuralCheck::kSealedExportConflict)},
    Named{         "invalid_counter_access",
          static_cast<int>(StructuralCheck::kInvalidCounterAccess)},
    Named{"undisclosed_witness_conditional",
          static_cast<int>(StructuralCheck::kUndisclosedWitnessConditional)},
    Named{  "undisclosed_constructor_param",
          static_cast<int>(StructuralCheck::kUndisclosedConstructorParam)},
    Named{        "private_field_exposure",
          static_cast<int>(StructuralCheck::kPrivateFieldExposure)},
    Named{       "unasserted_state_change",
          static_cast<int>(StructuralCheck::kUnassertedStateChange)},
    Named{                 "unused_witness",
          static_cast<int>(StructuralCheck::kUnusedWitness)},
};

template <typename Enum, std::size_t N>
[[nodiscard]] std::optional<Enum> lookup(const std::array<Named, N>& table, std::string_view text)
{
    const auto it = std::ranges::find(table, text, &Named::name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return static_cast<Enum>(it->value);
}

template <typename Enum, std::size_t N>
[[nodiscard]] std::string_view name_of(const std::array<Named, N>& table, Enum value) noexcept
{
    const auto it = std::ranges::find(table, static_cast<int>(value), &Named::value);
    return it == table.end() ? std::string_view{} : it->name;
}

[[nodiscard]] compactscan::Error invalid(std::string message)
{
    return Error::make(std::string(kInvalidRuleTable), std::move(message));
}

[[nodiscard]] compactscan::Result<std::string> require_string(const nlohmann::json& obj,
                                                              std::string_view key,
                                                              std::string_view context)
{
    const auto it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string()) {
        return std::unexpected(
            invalid(std::format("{}: '{}' must be a string", context, key)));
    }
    return it->get<std::string>();
}

[[nodiscard]] std::string optional_string(const nlohmann::json& obj, const std::string& key)
{
    const auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

[[nodiscard]] compactscan::Result<header::LanguageVersion> require_version(std::string_view text,
                                                                           std::string_view context)
{
    auto version = header::LanguageVersion::parse(text);
    if (!version) {
        return std::unexpected(
            invalid(std::format("{}: '{}' is not a MAJOR.MINOR version", context, text)));
    }
    return *version;
}

[[nodiscard]] compactscan::Result<std::regex> compile_pattern(const std::string& pattern,
                                                              std::string_view context)
{
    if (pattern.empty() || pattern.size() > kMaxPatternLength) {
        return std::unexpected(invalid(std::format(
            "{}: pattern length must be between 1 and {}", context, kMaxPatternLength)));
    }
    if (auto safe = check_pattern_safety(pattern); !safe) {
        return std::unexpected(invalid(std::format("{}: {}", context, safe.error().message)));
    }
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& ex) {
        return std::unexpected(
            invalid(std::format("{}: pattern does not compile: {}", context, ex.what())));
    }
}

[[nodiscard]] compactscan::Result<Matcher> parse_matcher(const nlohmann::json& rule,
                                                         std::string_view kind,
                                                         std::string_view context)
{
    if (kind == "structural") {
        auto check_name = require_string(rule, "check", context);
        if (!check_name) {
            return std::unexpected(check_name.error());
        }
        auto check = parse_check(*check_name);
        if (!check) {
            return std::unexpected(
                invalid(std::format("{}: unknown check '{}'", context, *check_name)));
        }
        StructuralMatch match{.check = *check, .names = {}};
        if (auto names = rule.find("names"); names != rule.end()) {
            if (!names->is_array()) {
                return std::unexpected(invalid(std::format("{}: 'names' must be an array", context)));
            }
            for (const auto& name : *names) {
                if (!name.is_string()) {
                    return std::unexpected(
                        invalid(std::format("{}: 'names' entries must be strings", context)));
                }
                match.names.push_back(name.get<std::string>());
            }
        }
        return match;
    }

    if (kind != "line" && kind != "block") {
        return std::unexpected(invalid(std::format("{}: unknown kind '{}'", context, kind)));
    }
    auto pattern = require_string(rule, "pattern", context);
    if (!pattern) {
        return std::unexpected(pattern.error());
    }
    RuleScope scope = RuleScope::kAny;
    if (rule.contains("scope")) {
        auto scope_name = require_string(rule, "scope", context);
        if (!scope_name) {
            return std::unexpected(scope_name.error());
        }
        auto parsed = parse_scope(*scope_name);
        if (!parsed) {
            return std::unexpected(
                invalid(std::format("{}: unknown scope '{}'", context, *scope_name)));
        }
        scope = *parsed;
    }
    auto regex = compile_pattern(*pattern, context);
    if (!regex) {
        return std::unexpected(regex.error());
    }
    if (kind == "line") {
        return LineMatch{.pattern = *pattern, .regex = std::move(*regex), .scope = scope};
    }
    return BlockMatch{.pattern = *pattern, .regex = std::move(*regex), .scope = scope};
}

[[nodiscard]] compactscan::Result<Rule> parse_rule(const nlohmann::json& rule, std::size_t index)
{
    if (!rule.is_object()) {
        return std::unexpected(invalid(std::format("rules[{}] must be an object", index)));
    }
    const std::string context = rule.contains("id") && rule.at("id").is_string()
                                    ? std::format("rule '{}'", rule.at("id").get<std::string>())
                                    : std::format("rules[{}]", index);

    auto id = require_string(rule, "id", context);
    auto kind = require_string(rule, "kind", context);
    auto since = require_string(rule, "since", context);
    auto severity_name = require_string(rule, "severity", context);
    auto message = require_string(rule, "message", context);
    auto fix = require_string(rule, "fix", context);
    for (const auto* field : {&id, &kind, &since, &severity_name, &message, &fix}) {
        if (!*field) {
            return std::unexpected(field->error());
        }
    }
    if (id->empty()) {
        return std::unexpected(invalid(std::format("{}: id must not be empty", context)));
    }

    auto severity = parse_severity(*severity_name);
    if (!severity) {
        return std::unexpected(
            invalid(std::format("{}: unknown severity '{}'", context, *severity_name)));
    }

    std::optional<header::LanguageVersion> since_version;
    if (*since != "always") {
        auto parsed = require_version(*since, context);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        since_version = *parsed;
    }

    RuleCategory category = RuleCategory::kLint;
    if (rule.contains("category")) {
        auto category_name = require_string(rule, "category", context);
        if (!category_name) {
            return std::unexpected(category_name.error());
        }
        auto parsed = parse_category(*category_name);
        if (!parsed) {
            return std::unexpected(
                invalid(std::format("{}: unknown category '{}'", context, *category_name)));
        }
        category = *parsed;
    }

    auto matcher = parse_matcher(rule, *kind, context);
    if (!matcher) {
        return std::unexpected(matcher.error());
    }

    return Rule{
        .id = std::move(*id),
        .matcher = std::move(*matcher),
        .since = since_version,
        .severity = *severity,
        .category = category,
        .message = std::move(*message),
        .fix = std::move(*fix),
    };
}

/// Repetition operator following a position, if any
struct Quantifier
{
    std::size_t length = 0;  ///< Characters consumed; 0 when none
    bool unbounded = false;
    bool repeats = false;  ///< Allows more than one occurrence
};

[[nodiscard]] Quantifier read_quantifier(std::string_view pattern, std::size_t pos)
{
    if (pos >= pattern.size()) {
        return {};
    }
    Quantifier q;
    const char c = pattern[pos];
    if (c == '*' || c == '+') {
        q = {.length = 1, .unbounded = true, .repeats = true};
    } else if (c == '?') {
        q = {.length = 1, .unbounded = false, .repeats = false};
    } else if (c == '{') {
        const std::size_t close = pattern.find('}', pos);
        if (close == std::string_view::npos) {
            return {};
        }
        const std::string_view body = pattern.substr(pos + 1, close - pos - 1);
        const std::size_t comma = body.find(',');
        const auto digits = [](std::string_view s) {
            return std::ranges::all_of(s, [](unsigned char ch) { return std::isdigit(ch) != 0; });
        };
        const std::string_view lower = body.substr(0, comma);
        if (lower.empty() || !digits(lower)) {
            return {};
        }
        q.length = close - pos + 1;
        if (comma == std::string_view::npos) {
            q.repeats = lower != "0" && lower != "1";
        } else {
            const std::string_view upper = body.substr(comma + 1);
            if (!digits(upper)) {
                return {};
            }
            q.unbounded = upper.empty();
            q.repeats = upper.empty() || (upper != "0" && upper != "1");
        }
    } else {
        return {};
    }
    // Lazy or possessive suffix
    if (pos + q.length < pattern.size() && pattern[pos + q.length] == '?') {
        ++q.length;
    }
    return q;
}

}  // namespace

std::string_view to_string(Severity severity) noexcept
{
    return name_of(kSeverityNames, severity);
}

std::string_view to_string(RuleScope scope) noexcept
{
    return name_of(kScopeNames, scope);
}

std::string_view to_string(RuleCategory category) noexcept
{
    return name_of(kCategoryNames, category);
}

std::string_view to_string(StructuralCheck check) noexcept
{
    return name_of(kCheckNames, check);
}

std::optional<Severity> parse_severity(std::string_view text)
{
    return lookup<Severity>(kSeverityNames, text);
}

std::optional<RuleScope> parse_scope(std::string_view text)
{
    return lookup<RuleScope>(kScopeNames, text);
}

std::optional<RuleCategory> parse_category(std::string_view text)
{
    return lookup<RuleCategory>(kCategoryNames, text);
}

std::optional<StructuralCheck> parse_check(std::string_view text)
{
    return lookup<StructuralCheck>(kCheckNames, text);
}

std::string_view kind_name(const Matcher& matcher) noexcept
{
    switch (matcher.index()) {
        case 0:
            return "line";
        case 1:
            return "block";
        default:
            return "structural";
    }
}

compactscan::VoidResult check_pattern_safety(std::string_view pattern)
{
    // One entry per open group
    struct Group
    {
        bool unbounded = false;    ///< Contains an unbounded quantifier
        bool alternation = false;  ///< Has a top-level '|'
    };
    std::vector<Group> groups(1);
    std::size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];
        if (c == '\\') {
            if (i + 1 < pattern.size()) {
                const char next = pattern[i + 1];
                if ((next >= '1' && next <= '9') || next == 'k') {
                    return std::unexpected(invalid(
                        std::format("backreference at offset {} is not allowed", i)));
                }
            }
            i += 2;
            const Quantifier q = read_quantifier(pattern, i);
            groups.back().unbounded = groups.back().unbounded || q.unbounded;
            i += q.length;
            continue;
        }
        if (c == '[') {
            std::size_t j = i + 1;
            if (j < pattern.size() && pattern[j] == '^') {
                ++j;
            }
            if (j < pattern.size() && pattern[j] == ']') {
                ++j;
            }
            while (j < pattern.size() && pattern[j] != ']') {
                j += pattern[j] == '\\' ? 2 : 1;
            }
            i = j + 1;
            const Quantifier q = read_quantifier(pattern, i);
            groups.back().unbounded = groups.back().unbounded || q.unbounded;
            i += q.length;
            continue;
        }
        if (c == '(') {
            groups.emplace_back();
            ++i;
            continue;
        }
        if (c == '|') {
            groups.back().alternation = true;
            ++i;
            continue;
        }
        if (c == ')') {
            if (groups.size() < 2) {
                return std::unexpected(invalid(std::format("unbalanced ')' at offset {}", i)));
            }
            const Group inner = groups.back();
            groups.pop_back();
            ++i;
            const Quantifier q = read_quantifier(pattern, i);
            if (inner.unbounded && q.repeats) {
                return std::unexpected(invalid(std::format(
                    "nested unbounded quantifier at offset {} is not allowed", i)));
            }
            if (inner.alternation && q.repeats) {
                return std::unexpected(invalid(std::format(
                    "repeated alternation at offset {} is not allowed", i)));
            }
            groups.back().unbounded = groups.back().unbounded || inner.unbounded || q.unbounded;
            groups.back().alternation = groups.back().alternation || inner.alternation;
            i += q.length;
            continue;
        }
        ++i;
        const Quantifier q = read_quantifier(pattern, i);
        groups.back().unbounded = groups.back().unbounded || q.unbounded;
        i += q.length;
    }
    if (groups.size() != 1) {
        return std::unexpected(invalid("unbalanced '(' in pattern"));
    }
    return {};
}

compactscan::Result<RuleTable> RuleTable::from_json(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return std::unexpected(invalid("rule table must be a JSON object"));
    }
    auto schema_version = require_string(document, "schema_version", "rule table");
    if (!schema_version) {
        return std::unexpected(schema_version.error());
    }
    if (*schema_version != kRuleTableSchemaVersion) {
        return std::unexpected(invalid(std::format("unsupported schema_version '{}'; expected '{}'",
                                                   *schema_version, kRuleTableSchemaVersion)));
    }

    RuleTable table;
    auto language = require_string(document, "language", "rule table");
    if (!language) {
        return std::unexpected(language.error());
    }
    table.m_language = std::move(*language);
    table.m_last_updated = optional_string(document, "last_updated");
    table.m_reference_source = optional_string(document, "reference_source");

    const auto range = document.find("version_range");
    if (range == document.end() || !range->is_object()) {
        return std::unexpected(invalid("rule table: 'version_range' must be an object"));
    }
    auto min_text = require_string(*range, "min", "version_range");
    auto max_text = require_string(*range, "max", "version_range");
    if (!min_text || !max_text) {
        return std::unexpected(!min_text ? min_text.error() : max_text.error());
    }
    auto min = require_version(*min_text, "version_range.min");
    auto max = require_version(*max_text, "version_range.max");
    if (!min || !max) {
        return std::unexpected(!min ? min.error() : max.error());
    }
    if (min->key() > max->key()) {
        return std::unexpected(invalid(std::format("version_range: min {} exceeds max {}",
                                                   min->to_string(), max->to_string())));
    }
    table.m_version_range = {.min = *min, .max = *max};

    const auto rules = document.find("rules");
    if (rules == document.end() || !rules->is_array()) {
        return std::unexpected(invalid("rule table: 'rules' must be an array"));
    }
    std::set<std::string, std::less<>> seen;
    for (std::size_t index = 0; index < rules->size(); ++index) {
        auto rule = parse_rule(rules->at(index), index);
        if (!rule) {
            return std::unexpected(rule.error());
        }
        if (!seen.insert(rule->id).second) {
            return std::unexpected(invalid(std::format("duplicate rule id '{}'", rule->id)));
        }
        table.m_rules.push_back(std::move(*rule));
    }
    return table;
}

const Rule* RuleTable::find(std::string_view id) const
{
    const auto it = std::ranges::find(m_rules, id, &Rule::id);
    return it == m_rules.end() ? nullptr : &*it;
}

compactscan::Result<RuleTable> load_rule_table(const std::filesystem::path& path,
                                               const std::filesystem::path& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open rule table: " + path.string()));
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse rule table: " + path.string() + ": " + ex.what()));
    }
    if (auto validation = common::validate_json(document, schema_dir, kRuleTableSchemaVersion);
        !validation) {
        return std::unexpected(validation.error());
    }
    return RuleTable::from_json(document);
}

}  // namespace compactscan::rules
