#pragma once

/**
 * @file rules.hpp
 * @brief Rule Table and Rule Engine
 *
 * A RuleTable is loaded once from a versioned JSON document, validated as a
 * whole, and never mutated afterwards. Const access (including regex matching)
 * is safe from multiple threads.
 */

#include "compactscan/common.hpp"
#include "compactscan/header.hpp"
#include "compactscan/source.hpp"
#include "compactscan/structure.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace compactscan::rules {

/// Longest pattern accepted in a rule table
constexpr std::size_t kMaxPatternLength = 512;

enum class Severity { kError, kWarning, kInfo };

/// Brace-depth filter applied at the match position
enum class RuleScope { kAny, kTopLevel, kNested };

/// Security rules run only when RuleInput::check_security is set
enum class RuleCategory { kLint, kSecurity };

enum class StructuralCheck {
    kMissingPragma,
    kUnsupportedLanguageVersion,
    kStdlibNameCollision,
    kMissingConstructor,
    kSealedExportConflict,
    kInvalidCounterAccess,
    kUndisclosedWitnessConditional,
    kUndisclosedConstructorParam,
    kPrivateFieldExposure,
    kUnassertedStateChange,
    kUnusedWitness,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(RuleScope scope) noexcept;
[[nodiscard]] std::string_view to_string(RuleCategory category) noexcept;
[[nodiscard]] std::string_view to_string(StructuralCheck check) noexcept;

[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);
[[nodiscard]] std::optional<RuleScope> parse_scope(std::string_view text);
[[nodiscard]] std::optional<RuleCategory> parse_category(std::string_view text);
[[nodiscard]] std::optional<StructuralCheck> parse_check(std::string_view text);

/// Regex searched on each line's code view
struct LineMatch
{
    std::string pattern;
    std::regex regex;
    RuleScope scope = RuleScope::kAny;
};

/// Regex searched on each statement of the code view
struct BlockMatch
{
    std::string pattern;
    std::regex regex;
    RuleScope scope = RuleScope::kAny;
};

/// Named predicate over the extracted structure
struct StructuralMatch
{
    StructuralCheck check = StructuralCheck::kMissingPragma;
    std::vector<std::string> names;
};

using Matcher = std::variant<LineMatch, BlockMatch, StructuralMatch>;

/// "line", "block" or "structural"
[[nodiscard]] std::string_view kind_name(const Matcher& matcher) noexcept;

struct Rule
{
    std::string id;
    Matcher matcher;
    std::optional<header::LanguageVersion> since;  ///< nullopt for "always"
    Severity severity = Severity::kError;
    RuleCategory category = RuleCategory::kLint;
    std::string message;
    std::string fix;
};

class RuleTable
{
public:
    /**
     * Build a table from a parsed rule_table.v1 document.
     *
     * Rejects the whole table on duplicate ids, unknown kind/severity/scope/check
     * values, malformed versions, patterns that do not compile and patterns that
     * fail check_pattern_safety().
     */
    [[nodiscard]] static compactscan::Result<RuleTable> from_json(const nlohmann::json& document);

    [[nodiscard]] const std::string& language() const { return m_language; }
    [[nodiscard]] const header::VersionRange& version_range() const { return m_version_range; }
    [[nodiscard]] const std::string& last_updated() const { return m_last_updated; }
    [[nodiscard]] const std::string& reference_source() const { return m_reference_source; }
    [[nodiscard]] const std::vector<Rule>& rules() const { return m_rules; }

    [[nodiscard]] const Rule* find(std::string_view id) const;

private:
    RuleTable() = default;

    std::string m_language;
    header::VersionRange m_version_range;
    std::string m_last_updated;
    std::string m_reference_source;
    std::vector<Rule> m_rules;
};

/**
 * Reject patterns prone to catastrophic backtracking: backreferences,
 * quantified groups that already contain an unbounded quantifier, and
 * repeated alternations such as (a|a)+.
 */
[[nodiscard]] compactscan::VoidResult check_pattern_safety(std::string_view pattern);

/// Read, schema-validate (rule_table.v1) and build a table
[[nodiscard]] compactscan::Result<RuleTable>
load_rule_table(const std::filesystem::path& path, const std::filesystem::path& schema_dir);

struct Issue
{
    std::string rule_id;
    Severity severity = Severity::kError;
    std::string message;
    std::string suggested_fix;
    std::optional<std::size_t> line;
};

struct RuleInput
{
    const source::SourceDocument& document;
    const header::Header& header;
    const structure::Structure& structure;
    bool check_security = false;
};

/**
 * Apply every rule of the table. Security rules are skipped unless
 * input.check_security is set.
 *
 * Each (rule id, line) pair is reported once. Issues are ordered by line, with
 * line-less issues first, then by position of the rule in the table.
 */
[[nodiscard]] std::vector<Issue> apply_rules(const RuleInput& input, const RuleTable& table);

}  // namespace compactscan::rules
