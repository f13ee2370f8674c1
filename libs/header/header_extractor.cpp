/**
 * @file header_extractor.cpp
 * @brief Pragma and import extraction
 */

#include "compactscan/header.hpp"

#include <charconv>
#include <format>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

namespace compactscan::header {

namespace {

/// Longest pragma clause considered; longer clauses are malformed
constexpr std::size_t kMaxClauseBytes = 256;

/// Component bounds that keep LanguageVersion::key() within int
constexpr int kMajorLimit = 1'000'000;
constexpr int kMinorLimit = 100;

struct ParsedVersion
{
    LanguageVersion version;
    std::size_t components = 0;
};

[[nodiscard]] std::optional<int> parse_component(std::string_view text)
{
    int value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<ParsedVersion> parse_dotted(std::string_view text)
{
    std::vector<int> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t dot = text.find('.', start);
        if (dot == std::string_view::npos) {
            dot = text.size();
        }
        auto part = parse_component(text.substr(start, dot - start));
        if (!part) {
            return std::nullopt;
        }
        parts.push_back(*part);
        start = dot + 1;
    }
    if (parts.empty() || parts[0] >= kMajorLimit
        || (parts.size() > 1 && parts[1] >= kMinorLimit)) {
        return std::nullopt;
    }
    return ParsedVersion{
        .version = {.major = parts[0], .minor = parts.size() > 1 ? parts[1] : 0},
        .components = parts.size(),
    };
}

void apply_clause(PragmaInfo& pragma, std::string_view op, const LanguageVersion& version)
{
    if (op == ">=" || op == ">") {
        pragma.declared_min = version;
    } else if (op == "<=" || op == "<") {
        pragma.declared_max = version;
    } else {
        if (!pragma.declared_min) {
            pragma.declared_min = version;
        }
        if (!pragma.declared_max) {
            pragma.declared_max = version;
        }
    }
}

[[nodiscard]] std::optional<PragmaInfo> find_pragma(const source::SourceDocument& document)
{
    static const std::regex kPragmaStart(R"(\bpragma\s{1,256}language_version\b)");
    static const std::regex kClause(R"(^\s*(>=|<=|==|>|<|~)?\s*(\d+(?:\.\d+)*)\s*$)");

    const std::string& code = document.joined_code();
    std::smatch start_match;
    if (!std::regex_search(code, start_match, kPragmaStart)) {
        return std::nullopt;
    }
    const auto begin = static_cast<std::size_t>(start_match.position(0));
    const auto clauses_begin = begin + static_cast<std::size_t>(start_match.length(0));
    std::size_t end = code.find(';', clauses_begin);
    const std::size_t raw_end = end == std::string::npos ? code.size() : end + 1;
    if (end == std::string::npos) {
        end = code.size();
    }

    PragmaInfo pragma;
    pragma.line = document.line_at(begin);
    pragma.raw_text = common::collapse_whitespace(
        std::string_view(document.joined_text()).substr(begin, raw_end - begin));

    std::string_view clauses = std::string_view(code).substr(clauses_begin, end - clauses_begin);
    std::size_t start = 0;
    while (start <= clauses.size()) {
        std::size_t split = clauses.find("&&", start);
        if (split == std::string_view::npos) {
            split = clauses.size();
        }
        const std::string clause(clauses.substr(start, split - start));
        start = split + 2;
        if (clause.size() > kMaxClauseBytes) {
            pragma.well_formed = false;
            continue;
        }

        std::smatch clause_match;
        if (!std::regex_match(clause, clause_match, kClause)) {
            pragma.well_formed = false;
            continue;
        }
        auto parsed = parse_dotted(clause_match.str(2));
        if (!parsed) {
            pragma.well_formed = false;
            continue;
        }
        if (parsed->components != 2 || !clause_match[1].matched) {
            pragma.well_formed = false;
        }
        if (!pragma.language_version) {
            pragma.language_version = parsed->version;
        }
        apply_clause(pragma, clause_match[1].matched ? clause_match.str(1) : "", parsed->version);
    }
    return pragma;
}

[[nodiscard]] std::vector<ImportDecl> find_imports(const source::SourceDocument& document)
{
    static const std::regex kImport(
        R"re(\b(?:import|include)\s{1,256}(?:("[^"\n]*")|([A-Za-z_]\w*))(?:\s{1,256}prefix\s{1,256}([A-Za-z_$][\w$]*))?\s{0,256};)re");

    const std::string& code = document.joined_code();
    const std::string_view text = document.joined_text();
    std::vector<ImportDecl> imports;
    for (auto it = std::sregex_iterator(code.begin(), code.end(), kImport);
         it != std::sregex_iterator();
         ++it) {
        const auto& match = *it;
        ImportDecl decl;
        decl.line = document.line_at(static_cast<std::size_t>(match.position(0)));
        if (match[1].matched) {
            // Quoted path: the code view blanks string contents, so read the raw text.
            const auto pos = static_cast<std::size_t>(match.position(1)) + 1;
            const auto len = static_cast<std::size_t>(match.length(1)) - 2;
            decl.name = std::string(text.substr(pos, len));
        } else {
            decl.name = match.str(2);
        }
        if (match[3].matched) {
            decl.prefix = match.str(3);
        }
        imports.push_back(std::move(decl));
    }
    return imports;
}

}  // namespace

std::string LanguageVersion::to_string() const
{
    return std::format("{}.{}", major, minor);
}

std::optional<LanguageVersion> LanguageVersion::parse(std::string_view text)
{
    auto parsed = parse_dotted(text);
    if (!parsed || parsed->components != 2) {
        return std::nullopt;
    }
    return parsed->version;
}

Header extract_header(const source::SourceDocument& document)
{
    return Header{.pragma = find_pragma(document), .imports = find_imports(document)};
}

}  // namespace compactscan::header
